#include <egli/context.hpp>
#include <egli/egl.hpp>

#include <utility>

#include <spdlog/spdlog.h>

namespace egli {

context_t::context_t(EGLDisplay display, EGLContext context) noexcept : display{display}, context{context} {
    spdlog::debug("{}: {}", "eglCreateContext", context);
}

context_t::~context_t() noexcept {
    destroy();
}

context_t::context_t(context_t&& rhs) noexcept
    : display{rhs.display}, context{std::exchange(rhs.context, EGL_NO_CONTEXT)} {
}

context_t& context_t::operator=(context_t&& rhs) noexcept {
    if (this != &rhs) {
        destroy();
        display = rhs.display;
        context = std::exchange(rhs.context, EGL_NO_CONTEXT);
    }
    return *this;
}

void context_t::destroy() noexcept {
    if (context == EGL_NO_CONTEXT) // moved or forgotten
        return;
    if (auto ec = egl::destroy_context(display, context))
        spdlog::error("{}: {:#x}", get_entry_point(call_errc::destroy_context), ec.value());
    else
        spdlog::debug("{}: {}", "eglDestroyContext", context);
    context = EGL_NO_CONTEXT;
}

EGLContext context_t::handle() const noexcept {
    return context;
}

EGLDisplay context_t::display_handle() const noexcept {
    return display;
}

EGLContext context_t::forget() noexcept {
    return std::exchange(context, EGL_NO_CONTEXT);
}

EGLint context_t::query(EGLint attribute) const noexcept(false) {
    EGLint value = 0;
    if (auto ec = egl::query_context(display, context, attribute, value))
        throw std::system_error{ec, "eglQueryContext"};
    return value;
}

} // namespace egli
