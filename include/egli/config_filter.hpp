#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <egli/config.hpp>
#include <egli/native.hpp>
#include <egli/types.hpp>

namespace egli {

/// @brief Builder for the attribute list of `eglChooseConfig`.
/// @note  Each `with_...` sets one (attribute, value) pair and replaces the previous value of the same attribute.
///        Attributes which are never set are left out, and EGL uses its own default for them.
/// @see   https://registry.khronos.org/EGL/sdk/docs/man/html/eglChooseConfig.xhtml
class EGLI_API config_filter_t final {
  public:
    enum class criterion_t : uint8_t {
        alpha_mask_size,
        alpha_size,
        bind_to_texture_rgb,
        bind_to_texture_rgba,
        blue_size,
        buffer_size,
        color_buffer_type,
        config_caveat,
        config_id,
        conformant,
        depth_size,
        green_size,
        level,
        luminance_size,
        match_native_pixmap,
        native_renderable,
        max_swap_interval,
        min_swap_interval,
        red_size,
        sample_buffers,
        samples,
        stencil_size,
        renderable_type,
        surface_type,
        transparent_type,
        transparent_red_value,
        transparent_green_value,
        transparent_blue_value,
    };
    static constexpr size_t criterion_count = 28;

    static EGLint get_attribute(criterion_t criterion) noexcept;

  private:
    EGLDisplay display;
    std::array<std::optional<EGLint>, criterion_count> values{};

    config_filter_t& set(criterion_t criterion, EGLint value) noexcept;

  public:
    explicit config_filter_t(EGLDisplay display) noexcept;

    /// @brief Smallest alpha mask buffers of at least `min_size` bits are preferred. EGL default is 0
    config_filter_t& with_alpha_mask_size(EGLint min_size) noexcept;
    /// @brief 0 prefers the smallest alpha component, otherwise the largest of at least `min_size` bits.
    ///        EGL default is 0
    config_filter_t& with_alpha_size(EGLint min_size) noexcept;
    /// @param value  `std::nullopt` is EGL_DONT_CARE, which is also the EGL default
    config_filter_t& with_bind_to_texture_rgb(std::optional<bool> value) noexcept;
    config_filter_t& with_bind_to_texture_rgba(std::optional<bool> value) noexcept;
    config_filter_t& with_blue_size(EGLint min_size) noexcept;
    /// @brief Sum of red, green, blue and alpha sizes. Smallest of at least `min_size` is preferred
    config_filter_t& with_buffer_size(EGLint min_size) noexcept;
    /// @note EGL default is `color_buffer_type_t::rgb`
    config_filter_t& with_color_buffer_type(color_buffer_type_t value) noexcept;
    /// @param value  `std::nullopt` is EGL_DONT_CARE, which is also the EGL default
    config_filter_t& with_config_caveat(std::optional<config_caveat_t> value) noexcept;
    /// @brief When a config ID is given EGL ignores all the other attributes
    config_filter_t& with_config_id(std::optional<EGLint> value) noexcept;
    config_filter_t& with_conformant(renderable_type_t value) noexcept;
    /// @brief 0 prefers configs without depth buffer. EGL default is 0
    config_filter_t& with_depth_size(EGLint min_size) noexcept;
    config_filter_t& with_green_size(EGLint min_size) noexcept;
    /// @brief Buffer level is matched exactly. 0 is the default frame buffer, positive are overlays
    config_filter_t& with_level(EGLint level) noexcept;
    config_filter_t& with_luminance_size(EGLint min_size) noexcept;
    /// @param handle  `std::nullopt` is EGL_NONE, which is also the EGL default
    config_filter_t& with_match_native_pixmap(std::optional<EGLint> handle) noexcept;
    config_filter_t& with_native_renderable(std::optional<bool> value) noexcept;
    config_filter_t& with_max_swap_interval(std::optional<EGLint> value) noexcept;
    config_filter_t& with_min_swap_interval(std::optional<EGLint> value) noexcept;
    config_filter_t& with_red_size(EGLint min_size) noexcept;
    config_filter_t& with_sample_buffers(EGLint value) noexcept;
    config_filter_t& with_samples(EGLint value) noexcept;
    config_filter_t& with_stencil_size(EGLint min_size) noexcept;
    /// @note EGL default is `renderable_type_t::opengl_es`
    config_filter_t& with_renderable_type(renderable_type_t value) noexcept;
    /// @note EGL default is `surface_type_t::window`
    config_filter_t& with_surface_type(surface_type_t value) noexcept;
    config_filter_t& with_transparent_type(transparent_type_t value) noexcept;
    config_filter_t& with_transparent_red_value(std::optional<EGLint> value) noexcept;
    config_filter_t& with_transparent_green_value(std::optional<EGLint> value) noexcept;
    config_filter_t& with_transparent_blue_value(std::optional<EGLint> value) noexcept;

    std::optional<EGLint> get(criterion_t criterion) const noexcept;

    /// @return the (attribute, value) pairs which were set, followed by `EGL_NONE`
    std::vector<EGLint> attributes() const noexcept(false);

    /// @brief `eglChooseConfig` twice. Once for the count, once to fill the configs
    /// @return configs in the order EGL prefers. Empty if nothing matches
    std::vector<config_ref_t> choose_configs() const noexcept(false);
};

} // namespace egli
