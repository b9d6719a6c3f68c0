#include <egli/egli.hpp>

namespace egli {

std::string_view query_extensions() noexcept(false) {
    std::string_view text{};
    if (auto ec = egl::query_string(EGL_NO_DISPLAY, EGL_EXTENSIONS, text))
        throw std::system_error{ec, "eglQueryString"};
    return text;
}

std::string_view query_version() noexcept(false) {
    std::string_view text{};
    if (auto ec = egl::query_string(EGL_NO_DISPLAY, EGL_VERSION, text))
        throw std::system_error{ec, "eglQueryString"};
    return text;
}

void bind_api(EGLenum api) noexcept(false) {
    if (auto ec = egl::bind_api(api))
        throw std::system_error{ec, "eglBindAPI"};
}

EGLenum query_api() noexcept {
    return egl::query_api();
}

void release_thread() noexcept(false) {
    if (auto ec = egl::release_thread())
        throw std::system_error{ec, "eglReleaseThread"};
}

} // namespace egli
