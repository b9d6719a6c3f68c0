#pragma once
#include <span>
#include <string_view>
#include <system_error>

#include <egli/error.hpp>
#include <egli/native.hpp>

/// @brief Checked forms of the EGL entry points.
/// @note  Each function calls `egli::get_api()` and turns its boolean/null result into a `call_errc`.
///        `eglGetError` is never consulted. Output parameters are written only on success.
namespace egli::egl {

EGLI_API std::error_code bind_api(EGLenum api) noexcept;
EGLI_API std::error_code bind_tex_image(EGLDisplay display, EGLSurface surface, EGLint buffer) noexcept;

/// @brief `eglChooseConfig` without an output buffer
/// @param attrib_list  `EGL_NONE` terminated
EGLI_API std::error_code num_filtered_configs(EGLDisplay display, const EGLint* attrib_list, EGLint& count) noexcept;

/// @brief `eglChooseConfig` into `configs`
/// @param count  number of configs written. It may be less than `configs.size()`
EGLI_API std::error_code get_filtered_configs(EGLDisplay display, const EGLint* attrib_list,
                                              std::span<EGLConfig> configs, EGLint& count) noexcept;

EGLI_API std::error_code copy_buffers(EGLDisplay display, EGLSurface surface, EGLNativePixmapType target) noexcept;

EGLI_API std::error_code create_context(EGLDisplay display, EGLConfig config, EGLContext share_context,
                                        const EGLint* attrib_list, EGLContext& context) noexcept;
EGLI_API std::error_code create_pbuffer_from_client_buffer(EGLDisplay display, EGLenum buftype,
                                                           EGLClientBuffer buffer, EGLConfig config,
                                                           const EGLint* attrib_list, EGLSurface& surface) noexcept;
EGLI_API std::error_code create_pbuffer_surface(EGLDisplay display, EGLConfig config, const EGLint* attrib_list,
                                                EGLSurface& surface) noexcept;
EGLI_API std::error_code create_pixmap_surface(EGLDisplay display, EGLConfig config, EGLNativePixmapType pixmap,
                                               const EGLint* attrib_list, EGLSurface& surface) noexcept;
/// @note EGL 1.5
EGLI_API std::error_code create_platform_window_surface(EGLDisplay display, EGLConfig config, void* native_window,
                                                        const EGLAttrib* attrib_list, EGLSurface& surface) noexcept;
EGLI_API std::error_code create_window_surface(EGLDisplay display, EGLConfig config, EGLNativeWindowType window,
                                               const EGLint* attrib_list, EGLSurface& surface) noexcept;

EGLI_API std::error_code destroy_context(EGLDisplay display, EGLContext context) noexcept;
EGLI_API std::error_code destroy_surface(EGLDisplay display, EGLSurface surface) noexcept;

EGLI_API std::error_code get_config_attrib(EGLDisplay display, EGLConfig config, EGLint attribute,
                                           EGLint& value) noexcept;

EGLI_API std::error_code num_configs(EGLDisplay display, EGLint& count) noexcept;
EGLI_API std::error_code get_configs(EGLDisplay display, std::span<EGLConfig> configs, EGLint& count) noexcept;

EGLI_API std::error_code get_current_context(EGLContext& context) noexcept;
EGLI_API std::error_code get_current_display(EGLDisplay& display) noexcept;
/// @param readdraw  `EGL_READ` or `EGL_DRAW`
EGLI_API std::error_code get_current_surface(EGLint readdraw, EGLSurface& surface) noexcept;

/// @note EGL reports a missing display with `EGL_NO_DISPLAY` and no error. It is `call_errc::get_display` here
EGLI_API std::error_code get_display(EGLNativeDisplayType display_id, EGLDisplay& display) noexcept;

/// @brief thread-local error of the last EGL call. Never called implicitly
EGLI_API EGLint get_error() noexcept;

/// @param name  exact name of the function. e.g. "glClear"
EGLI_API std::error_code get_proc_address(const char* name, __eglMustCastToProperFunctionPointerType& proc) noexcept;

EGLI_API std::error_code initialize(EGLDisplay display) noexcept;
EGLI_API std::error_code initialize(EGLDisplay display, EGLint& major, EGLint& minor) noexcept;

EGLI_API std::error_code make_current(EGLDisplay display, EGLSurface draw, EGLSurface read,
                                      EGLContext context) noexcept;

EGLI_API EGLenum query_api() noexcept;
EGLI_API std::error_code query_context(EGLDisplay display, EGLContext context, EGLint attribute,
                                       EGLint& value) noexcept;

/// @param text  view of the memory owned by EGL. It must be valid UTF-8, or `string_errc::invalid_utf8` is returned
EGLI_API std::error_code query_string(EGLDisplay display, EGLint name, std::string_view& text) noexcept;
EGLI_API std::error_code query_surface(EGLDisplay display, EGLSurface surface, EGLint attribute,
                                       EGLint& value) noexcept;

EGLI_API std::error_code release_tex_image(EGLDisplay display, EGLSurface surface, EGLint buffer) noexcept;
EGLI_API std::error_code release_thread() noexcept;
EGLI_API std::error_code surface_attrib(EGLDisplay display, EGLSurface surface, EGLint attribute,
                                        EGLint value) noexcept;
EGLI_API std::error_code swap_buffers(EGLDisplay display, EGLSurface surface) noexcept;
EGLI_API std::error_code swap_interval(EGLDisplay display, EGLint interval) noexcept;
EGLI_API std::error_code terminate(EGLDisplay display) noexcept;
EGLI_API std::error_code wait_client() noexcept;
EGLI_API std::error_code wait_gl() noexcept;
/// @param engine  usually `EGL_CORE_NATIVE_ENGINE`
EGLI_API std::error_code wait_native(EGLint engine) noexcept;

EGLI_API bool is_utf8(std::string_view text) noexcept;

} // namespace egli::egl
