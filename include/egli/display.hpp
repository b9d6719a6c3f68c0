#pragma once
#include <span>
#include <string_view>
#include <vector>

#include <egli/config.hpp>
#include <egli/config_filter.hpp>
#include <egli/context.hpp>
#include <egli/native.hpp>
#include <egli/surface.hpp>
#include <egli/types.hpp>

namespace egli {

/// @brief Owner of an EGL display connection.
/// @note  On destruction, unless `forget` was called, the current context/surfaces of the calling thread are
///        released with `eglMakeCurrent(.., EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT)` and then
///        `eglTerminate` is called. Failures there are logged and discarded.
///        Use `forget` and terminate the display yourself to observe them.
class EGLI_API display_t final {
    EGLDisplay display = EGL_NO_DISPLAY;

    explicit display_t(EGLDisplay display) noexcept;
    void terminate() noexcept;

  public:
    /// @param display_id  `EGL_DEFAULT_DISPLAY` for the default display
    /// @throw std::system_error with `call_errc::get_display` if no display matches
    static display_t from_display_id(EGLNativeDisplayType display_id) noexcept(false);
    static display_t from_default_display() noexcept(false);

    ~display_t() noexcept;
    display_t(display_t const&) = delete;
    display_t& operator=(display_t const&) = delete;
    display_t(display_t&& rhs) noexcept;
    display_t& operator=(display_t&& rhs) noexcept;

    EGLDisplay handle() const noexcept;
    EGLDisplay forget() noexcept;

    /// @brief `eglInitialize`. Initializing again has no effect
    void initialize() noexcept(false);
    version_t initialize_and_get_version() noexcept(false);

    /// @brief EGL_CLIENT_APIS. e.g. "OpenGL OpenGL_ES"
    /// @return view of the memory owned by EGL
    /// @throw std::system_error with `call_errc::query_string` or `string_errc::invalid_utf8`
    std::string_view query_client_apis() const noexcept(false);
    std::string_view query_vendor() const noexcept(false);
    /// @brief EGL_VERSION. "major.minor vendor_specific_info"
    std::string_view query_version() const noexcept(false);
    std::string_view query_extensions() const noexcept(false);

    /// @brief All configs of the display. `eglGetConfigs` is called twice, for the count and for the configs
    std::vector<config_ref_t> get_configs() const noexcept(false);

    config_filter_t config_filter() const noexcept;

    context_t create_context(config_ref_t config) noexcept(false);
    context_t create_context_with_client_version(config_ref_t config,
                                                 context_client_version_t version) noexcept(false);

    surface_t create_window_surface(config_ref_t config, EGLNativeWindowType window) noexcept(false);
    /// @param attributes  e.g. {EGL_WIDTH, 640, EGL_HEIGHT, 480}. `EGL_NONE` is appended if missing
    surface_t create_pbuffer_surface(config_ref_t config, std::span<const EGLint> attributes) noexcept(false);
    surface_t create_pixmap_surface(config_ref_t config, EGLNativePixmapType pixmap) noexcept(false);

    /// @throw std::system_error with `call_errc::make_current`
    void make_current(const surface_t& draw, const surface_t& read, const context_t& context) noexcept(false);
    void make_not_current() noexcept(false);

    void swap_buffers(const surface_t& surface) noexcept(false);
    void swap_interval(EGLint interval) noexcept(false);

    /// @brief `eglGetProcAddress`. The caller is responsible for the function type
    /// @param name  exact name. e.g. "glClear"
    /// @throw std::system_error with `call_errc::get_proc_address`, std::invalid_argument for `nullptr`
    __eglMustCastToProperFunctionPointerType get_proc_address(const char* name) const noexcept(false);
};

} // namespace egli
