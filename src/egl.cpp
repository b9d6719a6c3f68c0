#include <egli/egl.hpp>

#include <cstdint>
#include <cstring>

namespace egli::egl {

namespace {

std::error_code check(EGLBoolean result, call_errc ec) noexcept {
    if (result == EGL_FALSE)
        return make_error_code(ec);
    return {};
}

template <typename T>
std::error_code check_handle(T handle, T sentinel, T& output, call_errc ec) noexcept {
    if (handle == sentinel)
        return make_error_code(ec);
    output = handle;
    return {};
}

} // namespace

std::error_code bind_api(EGLenum api) noexcept {
    return check(get_api().bind_api(api), call_errc::bind_api);
}

std::error_code bind_tex_image(EGLDisplay display, EGLSurface surface, EGLint buffer) noexcept {
    return check(get_api().bind_tex_image(display, surface, buffer), call_errc::bind_tex_image);
}

std::error_code num_filtered_configs(EGLDisplay display, const EGLint* attrib_list, EGLint& count) noexcept {
    EGLint value = 0;
    if (auto ec = check(get_api().choose_config(display, attrib_list, nullptr, 0, &value), call_errc::choose_config))
        return ec;
    count = value;
    return {};
}

std::error_code get_filtered_configs(EGLDisplay display, const EGLint* attrib_list, std::span<EGLConfig> configs,
                                     EGLint& count) noexcept {
    EGLint value = 0;
    const auto capacity = static_cast<EGLint>(configs.size());
    if (auto ec = check(get_api().choose_config(display, attrib_list, configs.data(), capacity, &value),
                        call_errc::choose_config))
        return ec;
    count = value;
    return {};
}

std::error_code copy_buffers(EGLDisplay display, EGLSurface surface, EGLNativePixmapType target) noexcept {
    return check(get_api().copy_buffers(display, surface, target), call_errc::copy_buffers);
}

std::error_code create_context(EGLDisplay display, EGLConfig config, EGLContext share_context,
                               const EGLint* attrib_list, EGLContext& context) noexcept {
    return check_handle(get_api().create_context(display, config, share_context, attrib_list), EGL_NO_CONTEXT,
                        context, call_errc::create_context);
}

std::error_code create_pbuffer_from_client_buffer(EGLDisplay display, EGLenum buftype, EGLClientBuffer buffer,
                                                  EGLConfig config, const EGLint* attrib_list,
                                                  EGLSurface& surface) noexcept {
    return check_handle(get_api().create_pbuffer_from_client_buffer(display, buftype, buffer, config, attrib_list),
                        EGL_NO_SURFACE, surface, call_errc::create_pbuffer_from_client_buffer);
}

std::error_code create_pbuffer_surface(EGLDisplay display, EGLConfig config, const EGLint* attrib_list,
                                       EGLSurface& surface) noexcept {
    return check_handle(get_api().create_pbuffer_surface(display, config, attrib_list), EGL_NO_SURFACE, surface,
                        call_errc::create_pbuffer_surface);
}

std::error_code create_pixmap_surface(EGLDisplay display, EGLConfig config, EGLNativePixmapType pixmap,
                                      const EGLint* attrib_list, EGLSurface& surface) noexcept {
    return check_handle(get_api().create_pixmap_surface(display, config, pixmap, attrib_list), EGL_NO_SURFACE,
                        surface, call_errc::create_pixmap_surface);
}

std::error_code create_platform_window_surface(EGLDisplay display, EGLConfig config, void* native_window,
                                               const EGLAttrib* attrib_list, EGLSurface& surface) noexcept {
    return check_handle(get_api().create_platform_window_surface(display, config, native_window, attrib_list),
                        EGL_NO_SURFACE, surface, call_errc::create_platform_window_surface);
}

std::error_code create_window_surface(EGLDisplay display, EGLConfig config, EGLNativeWindowType window,
                                      const EGLint* attrib_list, EGLSurface& surface) noexcept {
    return check_handle(get_api().create_window_surface(display, config, window, attrib_list), EGL_NO_SURFACE,
                        surface, call_errc::create_window_surface);
}

std::error_code destroy_context(EGLDisplay display, EGLContext context) noexcept {
    return check(get_api().destroy_context(display, context), call_errc::destroy_context);
}

std::error_code destroy_surface(EGLDisplay display, EGLSurface surface) noexcept {
    return check(get_api().destroy_surface(display, surface), call_errc::destroy_surface);
}

std::error_code get_config_attrib(EGLDisplay display, EGLConfig config, EGLint attribute, EGLint& value) noexcept {
    EGLint result = 0;
    if (auto ec = check(get_api().get_config_attrib(display, config, attribute, &result),
                        call_errc::get_config_attrib))
        return ec;
    value = result;
    return {};
}

std::error_code num_configs(EGLDisplay display, EGLint& count) noexcept {
    EGLint value = 0;
    if (auto ec = check(get_api().get_configs(display, nullptr, 0, &value), call_errc::get_configs))
        return ec;
    count = value;
    return {};
}

std::error_code get_configs(EGLDisplay display, std::span<EGLConfig> configs, EGLint& count) noexcept {
    EGLint value = 0;
    const auto capacity = static_cast<EGLint>(configs.size());
    if (auto ec = check(get_api().get_configs(display, configs.data(), capacity, &value), call_errc::get_configs))
        return ec;
    count = value;
    return {};
}

std::error_code get_current_context(EGLContext& context) noexcept {
    return check_handle(get_api().get_current_context(), EGL_NO_CONTEXT, context, call_errc::get_current_context);
}

std::error_code get_current_display(EGLDisplay& display) noexcept {
    return check_handle(get_api().get_current_display(), EGL_NO_DISPLAY, display, call_errc::get_current_display);
}

std::error_code get_current_surface(EGLint readdraw, EGLSurface& surface) noexcept {
    return check_handle(get_api().get_current_surface(readdraw), EGL_NO_SURFACE, surface,
                        call_errc::get_current_surface);
}

std::error_code get_display(EGLNativeDisplayType display_id, EGLDisplay& display) noexcept {
    return check_handle(get_api().get_display(display_id), EGL_NO_DISPLAY, display, call_errc::get_display);
}

EGLint get_error() noexcept {
    return get_api().get_error();
}

std::error_code get_proc_address(const char* name, __eglMustCastToProperFunctionPointerType& proc) noexcept {
    __eglMustCastToProperFunctionPointerType result = get_api().get_proc_address(name);
    if (result == nullptr)
        return make_error_code(call_errc::get_proc_address);
    proc = result;
    return {};
}

std::error_code initialize(EGLDisplay display) noexcept {
    return check(get_api().initialize(display, nullptr, nullptr), call_errc::initialize);
}

std::error_code initialize(EGLDisplay display, EGLint& major, EGLint& minor) noexcept {
    EGLint versions[2]{};
    if (auto ec = check(get_api().initialize(display, versions + 0, versions + 1), call_errc::initialize))
        return ec;
    major = versions[0];
    minor = versions[1];
    return {};
}

std::error_code make_current(EGLDisplay display, EGLSurface draw, EGLSurface read, EGLContext context) noexcept {
    return check(get_api().make_current(display, draw, read, context), call_errc::make_current);
}

EGLenum query_api() noexcept {
    return get_api().query_api();
}

std::error_code query_context(EGLDisplay display, EGLContext context, EGLint attribute, EGLint& value) noexcept {
    EGLint result = 0;
    if (auto ec = check(get_api().query_context(display, context, attribute, &result), call_errc::query_context))
        return ec;
    value = result;
    return {};
}

std::error_code query_string(EGLDisplay display, EGLint name, std::string_view& text) noexcept {
    const char* txt = get_api().query_string(display, name);
    if (txt == nullptr)
        return make_error_code(call_errc::query_string);
    const std::string_view view{txt, strlen(txt)};
    if (is_utf8(view) == false)
        return make_error_code(string_errc::invalid_utf8);
    text = view;
    return {};
}

std::error_code query_surface(EGLDisplay display, EGLSurface surface, EGLint attribute, EGLint& value) noexcept {
    EGLint result = 0;
    if (auto ec = check(get_api().query_surface(display, surface, attribute, &result), call_errc::query_surface))
        return ec;
    value = result;
    return {};
}

std::error_code release_tex_image(EGLDisplay display, EGLSurface surface, EGLint buffer) noexcept {
    return check(get_api().release_tex_image(display, surface, buffer), call_errc::release_tex_image);
}

std::error_code release_thread() noexcept {
    return check(get_api().release_thread(), call_errc::release_thread);
}

std::error_code surface_attrib(EGLDisplay display, EGLSurface surface, EGLint attribute, EGLint value) noexcept {
    return check(get_api().surface_attrib(display, surface, attribute, value), call_errc::surface_attrib);
}

std::error_code swap_buffers(EGLDisplay display, EGLSurface surface) noexcept {
    return check(get_api().swap_buffers(display, surface), call_errc::swap_buffers);
}

std::error_code swap_interval(EGLDisplay display, EGLint interval) noexcept {
    return check(get_api().swap_interval(display, interval), call_errc::swap_interval);
}

std::error_code terminate(EGLDisplay display) noexcept {
    return check(get_api().terminate(display), call_errc::terminate);
}

std::error_code wait_client() noexcept {
    return check(get_api().wait_client(), call_errc::wait_client);
}

std::error_code wait_gl() noexcept {
    return check(get_api().wait_gl(), call_errc::wait_gl);
}

std::error_code wait_native(EGLint engine) noexcept {
    return check(get_api().wait_native(engine), call_errc::wait_native);
}

/// @see RFC 3629 section 4, Syntax of UTF-8 Byte Sequences
bool is_utf8(std::string_view text) noexcept {
    const auto* it = reinterpret_cast<const uint8_t*>(text.data());
    const auto* const end = it + text.size();
    while (it != end) {
        const uint8_t lead = *it++;
        if (lead < 0x80)
            continue;
        size_t trail = 0;
        uint8_t lower = 0x80, upper = 0xBF; // range of the first continuation byte
        if (lead >= 0xC2 && lead <= 0xDF) {
            trail = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            trail = 2;
            if (lead == 0xE0)
                lower = 0xA0;
            else if (lead == 0xED) // UTF-16 surrogates
                upper = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            trail = 3;
            if (lead == 0xF0)
                lower = 0x90;
            else if (lead == 0xF4)
                upper = 0x8F;
        } else {
            return false;
        }
        if (static_cast<size_t>(end - it) < trail)
            return false;
        if (*it < lower || *it > upper)
            return false;
        for (auto i = 1u; i < trail; ++i)
            if (it[i] < 0x80 || it[i] > 0xBF)
                return false;
        it += trail;
    }
    return true;
}

} // namespace egli::egl
