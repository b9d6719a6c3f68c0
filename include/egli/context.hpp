#pragma once
#include <egli/native.hpp>

namespace egli {

class display_t;

/// @brief Owner of an EGLContext. `eglDestroyContext` on destruction unless `forget` was called.
/// @note  EGL defers the destruction while the context is current to a thread
class EGLI_API context_t final {
    friend class display_t;

    EGLDisplay display;
    EGLContext context = EGL_NO_CONTEXT;

    context_t(EGLDisplay display, EGLContext context) noexcept;
    void destroy() noexcept;

  public:
    ~context_t() noexcept;
    context_t(context_t const&) = delete;
    context_t& operator=(context_t const&) = delete;
    context_t(context_t&& rhs) noexcept;
    context_t& operator=(context_t&& rhs) noexcept;

    EGLContext handle() const noexcept;
    EGLDisplay display_handle() const noexcept;

    /// @brief Give up the ownership. The caller must destroy the returned context
    EGLContext forget() noexcept;

    /// @brief `eglQueryContext`. e.g. `EGL_CONFIG_ID`, `EGL_CONTEXT_CLIENT_TYPE`
    EGLint query(EGLint attribute) const noexcept(false);
};

} // namespace egli
