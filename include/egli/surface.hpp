#pragma once
#include <egli/native.hpp>

namespace egli {

class display_t;

/// @brief Owner of an EGLSurface (window, pbuffer or pixmap).
///        `eglDestroySurface` on destruction unless `forget` was called.
/// @note  EGL defers the destruction while the surface is current to a thread
class EGLI_API surface_t final {
    friend class display_t;

    EGLDisplay display;
    EGLSurface surface = EGL_NO_SURFACE;

    surface_t(EGLDisplay display, EGLSurface surface) noexcept;
    void destroy() noexcept;

  public:
    ~surface_t() noexcept;
    surface_t(surface_t const&) = delete;
    surface_t& operator=(surface_t const&) = delete;
    surface_t(surface_t&& rhs) noexcept;
    surface_t& operator=(surface_t&& rhs) noexcept;

    EGLSurface handle() const noexcept;
    EGLDisplay display_handle() const noexcept;

    /// @brief Give up the ownership. The caller must destroy the returned surface
    EGLSurface forget() noexcept;

    EGLint query_width() const noexcept(false);
    EGLint query_height() const noexcept(false);
    EGLint query(EGLint attribute) const noexcept(false);

    /// @brief `eglSurfaceAttrib`. e.g. `EGL_SWAP_BEHAVIOR`
    void set_attribute(EGLint attribute, EGLint value) noexcept(false);
};

} // namespace egli
