#pragma once
#include <egli/native.hpp>
#include <egli/types.hpp>

namespace egli {

/// @brief Reference to one EGLConfig of a display. It doesn't own anything.
/// @note  Valid while the display which returned it stays initialized. This is not tracked
class EGLI_API config_ref_t final {
    EGLDisplay display;
    EGLConfig config;

  public:
    config_ref_t(EGLDisplay display, EGLConfig config) noexcept;

    EGLConfig handle() const noexcept;
    EGLDisplay display_handle() const noexcept;

    EGLint get_attrib(EGLint attribute) const noexcept(false);

    EGLint alpha_size() const noexcept(false);
    EGLint alpha_mask_size() const noexcept(false);
    bool bind_to_texture_rgb() const noexcept(false);
    bool bind_to_texture_rgba() const noexcept(false);
    EGLint blue_size() const noexcept(false);
    EGLint buffer_size() const noexcept(false);
    color_buffer_type_t color_buffer_type() const noexcept(false);
    config_caveat_t config_caveat() const noexcept(false);
    EGLint config_id() const noexcept(false);
    renderable_type_t conformant() const noexcept(false);
    EGLint depth_size() const noexcept(false);
    EGLint green_size() const noexcept(false);
    EGLint level() const noexcept(false);
    EGLint luminance_size() const noexcept(false);
    EGLint max_pbuffer_width() const noexcept(false);
    EGLint max_pbuffer_height() const noexcept(false);
    EGLint max_pbuffer_pixels() const noexcept(false);
    EGLint max_swap_interval() const noexcept(false);
    EGLint min_swap_interval() const noexcept(false);
    bool native_renderable() const noexcept(false);
    EGLint native_visual_id() const noexcept(false);
    EGLint native_visual_type() const noexcept(false);
    EGLint red_size() const noexcept(false);
    renderable_type_t renderable_type() const noexcept(false);
    EGLint sample_buffers() const noexcept(false);
    EGLint samples() const noexcept(false);
    EGLint stencil_size() const noexcept(false);
    surface_type_t surface_type() const noexcept(false);
    transparent_type_t transparent_type() const noexcept(false);
    EGLint transparent_red_value() const noexcept(false);
    EGLint transparent_green_value() const noexcept(false);
    EGLint transparent_blue_value() const noexcept(false);

    bool operator==(const config_ref_t&) const noexcept = default;
};

} // namespace egli
