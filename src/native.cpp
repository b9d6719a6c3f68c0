#include <egli/native.hpp>

#include <atomic>

namespace egli {

const api_t& get_native_api() noexcept {
    static const api_t instance{
        &eglBindAPI,
        &eglBindTexImage,
        &eglChooseConfig,
        &eglCopyBuffers,
        &eglCreateContext,
        &eglCreatePbufferFromClientBuffer,
        &eglCreatePbufferSurface,
        &eglCreatePixmapSurface,
        &eglCreatePlatformWindowSurface,
        &eglCreateWindowSurface,
        &eglDestroyContext,
        &eglDestroySurface,
        &eglGetConfigAttrib,
        &eglGetConfigs,
        &eglGetCurrentContext,
        &eglGetCurrentDisplay,
        &eglGetCurrentSurface,
        &eglGetDisplay,
        &eglGetError,
        &eglGetProcAddress,
        &eglInitialize,
        &eglMakeCurrent,
        &eglQueryAPI,
        &eglQueryContext,
        &eglQueryString,
        &eglQuerySurface,
        &eglReleaseTexImage,
        &eglReleaseThread,
        &eglSurfaceAttrib,
        &eglSwapBuffers,
        &eglSwapInterval,
        &eglTerminate,
        &eglWaitClient,
        &eglWaitGL,
        &eglWaitNative,
    };
    return instance;
}

namespace {
std::atomic<const api_t*> installed{nullptr};
} // namespace

const api_t& get_api() noexcept {
    if (const api_t* api = installed.load(std::memory_order_acquire))
        return *api;
    return get_native_api();
}

const api_t* set_api(const api_t* api) noexcept {
    const api_t* previous = installed.exchange(api, std::memory_order_acq_rel);
    return previous ? previous : &get_native_api();
}

} // namespace egli
