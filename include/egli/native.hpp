#pragma once
#define EGL_EGL_PROTOTYPES 1 // #define EGL_EGLEXT_PROTOTYPES
#include <EGL/egl.h>
#include <EGL/eglext.h>

/// @see https://learn.microsoft.com/en-us/cpp/preprocessor/predefined-macros
#if !defined(EGLI_API)
#if defined(_WIN32) && defined(EGLI_SHARED)
#if defined(EGLI_EXPORTS)
#define EGLI_API __declspec(dllexport)
#else
#define EGLI_API __declspec(dllimport)
#endif
#else
#define EGLI_API
#endif
#endif

namespace egli {

/// @brief Entry points of the EGL library, one field per wrapped function.
/// @note  Fields use the Khronos `PFNEGL...PROC` typedefs so a replacement must match the native ABI
struct api_t final {
    PFNEGLBINDAPIPROC bind_api;
    PFNEGLBINDTEXIMAGEPROC bind_tex_image;
    PFNEGLCHOOSECONFIGPROC choose_config;
    PFNEGLCOPYBUFFERSPROC copy_buffers;
    PFNEGLCREATECONTEXTPROC create_context;
    PFNEGLCREATEPBUFFERFROMCLIENTBUFFERPROC create_pbuffer_from_client_buffer;
    PFNEGLCREATEPBUFFERSURFACEPROC create_pbuffer_surface;
    PFNEGLCREATEPIXMAPSURFACEPROC create_pixmap_surface;
    PFNEGLCREATEPLATFORMWINDOWSURFACEPROC create_platform_window_surface;
    PFNEGLCREATEWINDOWSURFACEPROC create_window_surface;
    PFNEGLDESTROYCONTEXTPROC destroy_context;
    PFNEGLDESTROYSURFACEPROC destroy_surface;
    PFNEGLGETCONFIGATTRIBPROC get_config_attrib;
    PFNEGLGETCONFIGSPROC get_configs;
    PFNEGLGETCURRENTCONTEXTPROC get_current_context;
    PFNEGLGETCURRENTDISPLAYPROC get_current_display;
    PFNEGLGETCURRENTSURFACEPROC get_current_surface;
    PFNEGLGETDISPLAYPROC get_display;
    PFNEGLGETERRORPROC get_error;
    PFNEGLGETPROCADDRESSPROC get_proc_address;
    PFNEGLINITIALIZEPROC initialize;
    PFNEGLMAKECURRENTPROC make_current;
    PFNEGLQUERYAPIPROC query_api;
    PFNEGLQUERYCONTEXTPROC query_context;
    PFNEGLQUERYSTRINGPROC query_string;
    PFNEGLQUERYSURFACEPROC query_surface;
    PFNEGLRELEASETEXIMAGEPROC release_tex_image;
    PFNEGLRELEASETHREADPROC release_thread;
    PFNEGLSURFACEATTRIBPROC surface_attrib;
    PFNEGLSWAPBUFFERSPROC swap_buffers;
    PFNEGLSWAPINTERVALPROC swap_interval;
    PFNEGLTERMINATEPROC terminate;
    PFNEGLWAITCLIENTPROC wait_client;
    PFNEGLWAITGLPROC wait_gl;
    PFNEGLWAITNATIVEPROC wait_native;
};

EGLI_API const api_t& get_native_api() noexcept;

EGLI_API const api_t& get_api() noexcept;

/// @brief Replace the table used by `egli::egl` functions.
/// @param api  `nullptr` restores `get_native_api()`. The table must outlive its installation
/// @return previously installed table
EGLI_API const api_t* set_api(const api_t* api) noexcept;

} // namespace egli
