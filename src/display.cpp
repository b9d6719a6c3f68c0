#include <egli/display.hpp>
#include <egli/egl.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace egli {

display_t::display_t(EGLDisplay display) noexcept : display{display} {
}

display_t display_t::from_display_id(EGLNativeDisplayType display_id) noexcept(false) {
    EGLDisplay display = EGL_NO_DISPLAY;
    if (auto ec = egl::get_display(display_id, display))
        throw std::system_error{ec, "eglGetDisplay"};
    spdlog::debug("EGLDisplay {}", display);
    return display_t{display};
}

display_t display_t::from_default_display() noexcept(false) {
    return from_display_id(EGL_DEFAULT_DISPLAY);
}

display_t::~display_t() noexcept {
    terminate();
}

display_t::display_t(display_t&& rhs) noexcept : display{std::exchange(rhs.display, EGL_NO_DISPLAY)} {
}

display_t& display_t::operator=(display_t&& rhs) noexcept {
    if (this != &rhs) {
        terminate();
        display = std::exchange(rhs.display, EGL_NO_DISPLAY);
    }
    return *this;
}

void display_t::terminate() noexcept {
    if (display == EGL_NO_DISPLAY) // already terminated
        return;
    // unbind surface and context
    spdlog::debug("EGL current: EGL_NO_SURFACE/EGL_NO_SURFACE EGL_NO_CONTEXT");
    if (auto ec = egl::make_current(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT))
        spdlog::error("{}: {:#x}", get_entry_point(call_errc::make_current), ec.value());
    spdlog::debug("EGL terminate: {}", display);
    if (auto ec = egl::terminate(display))
        spdlog::error("{}: {:#x}", get_entry_point(call_errc::terminate), ec.value());
    display = EGL_NO_DISPLAY;
}

EGLDisplay display_t::handle() const noexcept {
    return display;
}

EGLDisplay display_t::forget() noexcept {
    return std::exchange(display, EGL_NO_DISPLAY);
}

void display_t::initialize() noexcept(false) {
    if (auto ec = egl::initialize(display))
        throw std::system_error{ec, "eglInitialize"};
}

version_t display_t::initialize_and_get_version() noexcept(false) {
    version_t version{};
    if (auto ec = egl::initialize(display, version.major, version.minor))
        throw std::system_error{ec, "eglInitialize"};
    spdlog::debug("EGLDisplay {} {}.{}", display, version.major, version.minor);
    return version;
}

namespace {

std::string_view query_text(EGLDisplay display, EGLint name) noexcept(false) {
    std::string_view text{};
    if (auto ec = egl::query_string(display, name, text))
        throw std::system_error{ec, "eglQueryString"};
    return text;
}

} // namespace

std::string_view display_t::query_client_apis() const noexcept(false) {
    return query_text(display, EGL_CLIENT_APIS);
}

std::string_view display_t::query_vendor() const noexcept(false) {
    return query_text(display, EGL_VENDOR);
}

std::string_view display_t::query_version() const noexcept(false) {
    return query_text(display, EGL_VERSION);
}

std::string_view display_t::query_extensions() const noexcept(false) {
    return query_text(display, EGL_EXTENSIONS);
}

std::vector<config_ref_t> display_t::get_configs() const noexcept(false) {
    EGLint count = 0;
    if (auto ec = egl::num_configs(display, count))
        throw std::system_error{ec, "eglGetConfigs"};

    std::vector<EGLConfig> configs(static_cast<size_t>(count), nullptr);
    EGLint written = 0;
    if (auto ec = egl::get_configs(display, configs, written))
        throw std::system_error{ec, "eglGetConfigs"};
    if (written < count)
        spdlog::warn("{}: {} of {} configs returned", "eglGetConfigs", written, count);
    written = std::min(written, count);

    std::vector<config_ref_t> output{};
    output.reserve(static_cast<size_t>(written));
    for (auto i = 0; i < written; ++i)
        output.emplace_back(display, configs[i]);
    return output;
}

config_filter_t display_t::config_filter() const noexcept {
    return config_filter_t{display};
}

context_t display_t::create_context(config_ref_t config) noexcept(false) {
    EGLContext context = EGL_NO_CONTEXT;
    if (auto ec = egl::create_context(display, config.handle(), EGL_NO_CONTEXT, nullptr, context))
        throw std::system_error{ec, "eglCreateContext"};
    return context_t{display, context};
}

context_t display_t::create_context_with_client_version(config_ref_t config,
                                                        context_client_version_t version) noexcept(false) {
    const EGLint attrs[]{EGL_CONTEXT_CLIENT_VERSION, static_cast<EGLint>(version), EGL_NONE};
    EGLContext context = EGL_NO_CONTEXT;
    if (auto ec = egl::create_context(display, config.handle(), EGL_NO_CONTEXT, attrs, context))
        throw std::system_error{ec, "eglCreateContext"};
    return context_t{display, context};
}

surface_t display_t::create_window_surface(config_ref_t config, EGLNativeWindowType window) noexcept(false) {
    EGLSurface surface = EGL_NO_SURFACE;
    if (auto ec = egl::create_window_surface(display, config.handle(), window, nullptr, surface))
        throw std::system_error{ec, "eglCreateWindowSurface"};
    return surface_t{display, surface};
}

surface_t display_t::create_pbuffer_surface(config_ref_t config, std::span<const EGLint> attributes) noexcept(false) {
    std::vector<EGLint> attrs{attributes.begin(), attributes.end()};
    if (attrs.empty() || attrs.back() != EGL_NONE)
        attrs.emplace_back(EGL_NONE);
    EGLSurface surface = EGL_NO_SURFACE;
    if (auto ec = egl::create_pbuffer_surface(display, config.handle(), attrs.data(), surface))
        throw std::system_error{ec, "eglCreatePbufferSurface"};
    return surface_t{display, surface};
}

surface_t display_t::create_pixmap_surface(config_ref_t config, EGLNativePixmapType pixmap) noexcept(false) {
    EGLSurface surface = EGL_NO_SURFACE;
    if (auto ec = egl::create_pixmap_surface(display, config.handle(), pixmap, nullptr, surface))
        throw std::system_error{ec, "eglCreatePixmapSurface"};
    return surface_t{display, surface};
}

void display_t::make_current(const surface_t& draw, const surface_t& read, const context_t& context) noexcept(false) {
    spdlog::debug("EGL current: {}/{} {}", draw.handle(), read.handle(), context.handle());
    if (auto ec = egl::make_current(display, draw.handle(), read.handle(), context.handle()))
        throw std::system_error{ec, "eglMakeCurrent"};
}

void display_t::make_not_current() noexcept(false) {
    if (auto ec = egl::make_current(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT))
        throw std::system_error{ec, "eglMakeCurrent"};
}

void display_t::swap_buffers(const surface_t& surface) noexcept(false) {
    if (auto ec = egl::swap_buffers(display, surface.handle()))
        throw std::system_error{ec, "eglSwapBuffers"};
}

void display_t::swap_interval(EGLint interval) noexcept(false) {
    if (auto ec = egl::swap_interval(display, interval))
        throw std::system_error{ec, "eglSwapInterval"};
}

__eglMustCastToProperFunctionPointerType display_t::get_proc_address(const char* name) const noexcept(false) {
    if (name == nullptr)
        throw std::invalid_argument{"function name is null"};
    __eglMustCastToProperFunctionPointerType proc = nullptr;
    if (auto ec = egl::get_proc_address(name, proc))
        throw std::system_error{ec, name};
    return proc;
}

} // namespace egli
