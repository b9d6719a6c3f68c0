#include <egli/egl.hpp>
#include <egli/surface.hpp>

#include <utility>

#include <spdlog/spdlog.h>

namespace egli {

surface_t::surface_t(EGLDisplay display, EGLSurface surface) noexcept : display{display}, surface{surface} {
    spdlog::debug("{}: {}", "surface_t", surface);
}

surface_t::~surface_t() noexcept {
    destroy();
}

surface_t::surface_t(surface_t&& rhs) noexcept
    : display{rhs.display}, surface{std::exchange(rhs.surface, EGL_NO_SURFACE)} {
}

surface_t& surface_t::operator=(surface_t&& rhs) noexcept {
    if (this != &rhs) {
        destroy();
        display = rhs.display;
        surface = std::exchange(rhs.surface, EGL_NO_SURFACE);
    }
    return *this;
}

void surface_t::destroy() noexcept {
    if (surface == EGL_NO_SURFACE) // moved or forgotten
        return;
    if (auto ec = egl::destroy_surface(display, surface))
        spdlog::error("{}: {:#x}", get_entry_point(call_errc::destroy_surface), ec.value());
    else
        spdlog::debug("{}: {}", "eglDestroySurface", surface);
    surface = EGL_NO_SURFACE;
}

EGLSurface surface_t::handle() const noexcept {
    return surface;
}

EGLDisplay surface_t::display_handle() const noexcept {
    return display;
}

EGLSurface surface_t::forget() noexcept {
    return std::exchange(surface, EGL_NO_SURFACE);
}

EGLint surface_t::query_width() const noexcept(false) {
    return query(EGL_WIDTH);
}

EGLint surface_t::query_height() const noexcept(false) {
    return query(EGL_HEIGHT);
}

EGLint surface_t::query(EGLint attribute) const noexcept(false) {
    EGLint value = 0;
    if (auto ec = egl::query_surface(display, surface, attribute, value))
        throw std::system_error{ec, "eglQuerySurface"};
    return value;
}

void surface_t::set_attribute(EGLint attribute, EGLint value) noexcept(false) {
    if (auto ec = egl::surface_attrib(display, surface, attribute, value))
        throw std::system_error{ec, "eglSurfaceAttrib"};
}

} // namespace egli
