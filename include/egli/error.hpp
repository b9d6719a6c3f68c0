#pragma once
#include <system_error>

#include <egli/native.hpp>

namespace egli {

/// @brief One value per wrapped EGL entry point. The value names the call which reported failure.
enum class call_errc : int {
    bind_api = 1,
    bind_tex_image,
    choose_config,
    copy_buffers,
    create_context,
    create_pbuffer_from_client_buffer,
    create_pbuffer_surface,
    create_pixmap_surface,
    create_platform_window_surface,
    create_window_surface,
    destroy_context,
    destroy_surface,
    get_config_attrib,
    get_configs,
    get_current_context,
    get_current_display,
    get_current_surface,
    get_display,
    get_proc_address,
    initialize,
    make_current,
    query_context,
    query_string,
    query_surface,
    release_tex_image,
    release_thread,
    surface_attrib,
    swap_buffers,
    swap_interval,
    terminate,
    wait_client,
    wait_gl,
    wait_native,
};

/// @brief Failure to interpret a string returned by EGL
enum class string_errc : int {
    invalid_utf8 = 1,
};

/// @return name of the native entry point. e.g. "eglCreateContext". `nullptr` for unknown values
EGLI_API const char* get_entry_point(call_errc ec) noexcept;

EGLI_API const std::error_category& get_call_category() noexcept;
EGLI_API const std::error_category& get_string_category() noexcept;

inline std::error_code make_error_code(call_errc ec) noexcept {
    return {static_cast<int>(ec), get_call_category()};
}
inline std::error_code make_error_code(string_errc ec) noexcept {
    return {static_cast<int>(ec), get_string_category()};
}

} // namespace egli

namespace std {
template <>
struct is_error_code_enum<egli::call_errc> : true_type {};
template <>
struct is_error_code_enum<egli::string_errc> : true_type {};
} // namespace std
