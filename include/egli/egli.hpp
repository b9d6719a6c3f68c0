#pragma once
#include <string_view>

#include <egli/config.hpp>
#include <egli/config_filter.hpp>
#include <egli/context.hpp>
#include <egli/display.hpp>
#include <egli/egl.hpp>
#include <egli/error.hpp>
#include <egli/native.hpp>
#include <egli/surface.hpp>
#include <egli/types.hpp>

namespace egli {

/// @brief Client extensions. `eglQueryString(EGL_NO_DISPLAY, EGL_EXTENSIONS)`
/// @return space separated list
/// @throw std::system_error with `call_errc::query_string` or `string_errc::invalid_utf8`
EGLI_API std::string_view query_extensions() noexcept(false);

/// @brief Client version. `eglQueryString(EGL_NO_DISPLAY, EGL_VERSION)`
/// @note  EGL 1.5
EGLI_API std::string_view query_version() noexcept(false);

/// @param api  EGL_OPENGL_API, EGL_OPENGL_ES_API or EGL_OPENVG_API
EGLI_API void bind_api(EGLenum api) noexcept(false);
EGLI_API EGLenum query_api() noexcept;

EGLI_API void release_thread() noexcept(false);

} // namespace egli
