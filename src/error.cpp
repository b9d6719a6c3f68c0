#include <egli/error.hpp>

#include <cstdio>
#include <string>

namespace egli {

const char* get_entry_point(call_errc ec) noexcept {
    switch (ec) {
    case call_errc::bind_api:
        return "eglBindAPI";
    case call_errc::bind_tex_image:
        return "eglBindTexImage";
    case call_errc::choose_config:
        return "eglChooseConfig";
    case call_errc::copy_buffers:
        return "eglCopyBuffers";
    case call_errc::create_context:
        return "eglCreateContext";
    case call_errc::create_pbuffer_from_client_buffer:
        return "eglCreatePbufferFromClientBuffer";
    case call_errc::create_pbuffer_surface:
        return "eglCreatePbufferSurface";
    case call_errc::create_pixmap_surface:
        return "eglCreatePixmapSurface";
    case call_errc::create_platform_window_surface:
        return "eglCreatePlatformWindowSurface";
    case call_errc::create_window_surface:
        return "eglCreateWindowSurface";
    case call_errc::destroy_context:
        return "eglDestroyContext";
    case call_errc::destroy_surface:
        return "eglDestroySurface";
    case call_errc::get_config_attrib:
        return "eglGetConfigAttrib";
    case call_errc::get_configs:
        return "eglGetConfigs";
    case call_errc::get_current_context:
        return "eglGetCurrentContext";
    case call_errc::get_current_display:
        return "eglGetCurrentDisplay";
    case call_errc::get_current_surface:
        return "eglGetCurrentSurface";
    case call_errc::get_display:
        return "eglGetDisplay";
    case call_errc::get_proc_address:
        return "eglGetProcAddress";
    case call_errc::initialize:
        return "eglInitialize";
    case call_errc::make_current:
        return "eglMakeCurrent";
    case call_errc::query_context:
        return "eglQueryContext";
    case call_errc::query_string:
        return "eglQueryString";
    case call_errc::query_surface:
        return "eglQuerySurface";
    case call_errc::release_tex_image:
        return "eglReleaseTexImage";
    case call_errc::release_thread:
        return "eglReleaseThread";
    case call_errc::surface_attrib:
        return "eglSurfaceAttrib";
    case call_errc::swap_buffers:
        return "eglSwapBuffers";
    case call_errc::swap_interval:
        return "eglSwapInterval";
    case call_errc::terminate:
        return "eglTerminate";
    case call_errc::wait_client:
        return "eglWaitClient";
    case call_errc::wait_gl:
        return "eglWaitGL";
    case call_errc::wait_native:
        return "eglWaitNative";
    }
    return nullptr;
}

class egl_call_category_t final : public std::error_category {
    const char* name() const noexcept override {
        return "EGL";
    }
    std::string message(int ec) const override {
        if (const char* entry = get_entry_point(static_cast<call_errc>(ec)))
            return std::string{entry} + " failed";
        constexpr auto bufsz = 40;
        char buf[bufsz]{};
        const auto len = snprintf(buf, bufsz, "unknown call %5d(%4x)", ec, ec);
        return {buf, static_cast<size_t>(len)};
    }
};

class egl_string_category_t final : public std::error_category {
    const char* name() const noexcept override {
        return "EGL string";
    }
    std::string message(int ec) const override {
        switch (static_cast<string_errc>(ec)) {
        case string_errc::invalid_utf8:
            return "non UTF-8 string received";
        }
        return "unknown error " + std::to_string(ec);
    }
};

const std::error_category& get_call_category() noexcept {
    static egl_call_category_t instance{};
    return instance;
}

const std::error_category& get_string_category() noexcept {
    static egl_string_category_t instance{};
    return instance;
}

} // namespace egli
