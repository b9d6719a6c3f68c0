#pragma once
#include <egli/native.hpp>

namespace egli {

enum class color_buffer_type_t : EGLint {
    rgb = EGL_RGB_BUFFER,
    luminance = EGL_LUMINANCE_BUFFER,
};

enum class config_caveat_t : EGLint {
    none = EGL_NONE,
    slow = EGL_SLOW_CONFIG,
    non_conformant = EGL_NON_CONFORMANT_CONFIG,
};

enum class transparent_type_t : EGLint {
    none = EGL_NONE,
    transparent_rgb = EGL_TRANSPARENT_RGB,
};

/// @brief EGL_RENDERABLE_TYPE and EGL_CONFORMANT mask bits
enum class renderable_type_t : EGLint {
    opengl = EGL_OPENGL_BIT,
    opengl_es = EGL_OPENGL_ES_BIT,
    opengl_es2 = EGL_OPENGL_ES2_BIT,
    opengl_es3 = EGL_OPENGL_ES3_BIT,
    openvg = EGL_OPENVG_BIT,
};

/// @brief EGL_SURFACE_TYPE mask bits
enum class surface_type_t : EGLint {
    pbuffer = EGL_PBUFFER_BIT,
    pixmap = EGL_PIXMAP_BIT,
    window = EGL_WINDOW_BIT,
    vg_colorspace_linear = EGL_VG_COLORSPACE_LINEAR_BIT,
    vg_alpha_format_pre = EGL_VG_ALPHA_FORMAT_PRE_BIT,
    multisample_resolve_box = EGL_MULTISAMPLE_RESOLVE_BOX_BIT,
    swap_behavior_preserved = EGL_SWAP_BEHAVIOR_PRESERVED_BIT,
};

constexpr EGLint all_bits(renderable_type_t) noexcept {
    return EGL_OPENGL_BIT | EGL_OPENGL_ES_BIT | EGL_OPENGL_ES2_BIT | EGL_OPENGL_ES3_BIT | EGL_OPENVG_BIT;
}
constexpr EGLint all_bits(surface_type_t) noexcept {
    return EGL_PBUFFER_BIT | EGL_PIXMAP_BIT | EGL_WINDOW_BIT | EGL_VG_COLORSPACE_LINEAR_BIT |
           EGL_VG_ALPHA_FORMAT_PRE_BIT | EGL_MULTISAMPLE_RESOLVE_BOX_BIT | EGL_SWAP_BEHAVIOR_PRESERVED_BIT;
}

constexpr renderable_type_t operator|(renderable_type_t lhs, renderable_type_t rhs) noexcept {
    return static_cast<renderable_type_t>(static_cast<EGLint>(lhs) | static_cast<EGLint>(rhs));
}
constexpr renderable_type_t operator&(renderable_type_t lhs, renderable_type_t rhs) noexcept {
    return static_cast<renderable_type_t>(static_cast<EGLint>(lhs) & static_cast<EGLint>(rhs));
}
constexpr surface_type_t operator|(surface_type_t lhs, surface_type_t rhs) noexcept {
    return static_cast<surface_type_t>(static_cast<EGLint>(lhs) | static_cast<EGLint>(rhs));
}
constexpr surface_type_t operator&(surface_type_t lhs, surface_type_t rhs) noexcept {
    return static_cast<surface_type_t>(static_cast<EGLint>(lhs) & static_cast<EGLint>(rhs));
}

/// @brief Drop the bits which are not known to `T`
template <typename T>
constexpr T truncate_bits(EGLint value) noexcept {
    return static_cast<T>(value & all_bits(T{}));
}

/// @return true if every bit of `mask` is set in `value`
template <typename T>
constexpr bool contains(T value, T mask) noexcept {
    return (value & mask) == mask;
}

struct version_t final {
    EGLint major;
    EGLint minor;

    constexpr bool operator==(const version_t&) const noexcept = default;
};

/// @brief EGL_CONTEXT_CLIENT_VERSION for OpenGL ES contexts
enum class context_client_version_t : EGLint {
    opengl_es1 = 1,
    opengl_es2 = 2,
    opengl_es3 = 3,
};

} // namespace egli
