#include <egli/config_filter.hpp>
#include <egli/egl.hpp>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace egli {

namespace {

constexpr std::array<EGLint, config_filter_t::criterion_count> codes{
    EGL_ALPHA_MASK_SIZE,
    EGL_ALPHA_SIZE,
    EGL_BIND_TO_TEXTURE_RGB,
    EGL_BIND_TO_TEXTURE_RGBA,
    EGL_BLUE_SIZE,
    EGL_BUFFER_SIZE,
    EGL_COLOR_BUFFER_TYPE,
    EGL_CONFIG_CAVEAT,
    EGL_CONFIG_ID,
    EGL_CONFORMANT,
    EGL_DEPTH_SIZE,
    EGL_GREEN_SIZE,
    EGL_LEVEL,
    EGL_LUMINANCE_SIZE,
    EGL_MATCH_NATIVE_PIXMAP,
    EGL_NATIVE_RENDERABLE,
    EGL_MAX_SWAP_INTERVAL,
    EGL_MIN_SWAP_INTERVAL,
    EGL_RED_SIZE,
    EGL_SAMPLE_BUFFERS,
    EGL_SAMPLES,
    EGL_STENCIL_SIZE,
    EGL_RENDERABLE_TYPE,
    EGL_SURFACE_TYPE,
    EGL_TRANSPARENT_TYPE,
    EGL_TRANSPARENT_RED_VALUE,
    EGL_TRANSPARENT_GREEN_VALUE,
    EGL_TRANSPARENT_BLUE_VALUE,
};

constexpr EGLint to_tristate(std::optional<bool> value) noexcept {
    if (value.has_value() == false)
        return EGL_DONT_CARE;
    return *value ? EGL_TRUE : EGL_FALSE;
}

} // namespace

EGLint config_filter_t::get_attribute(criterion_t criterion) noexcept {
    return codes[static_cast<size_t>(criterion)];
}

config_filter_t::config_filter_t(EGLDisplay display) noexcept : display{display} {
}

config_filter_t& config_filter_t::set(criterion_t criterion, EGLint value) noexcept {
    values[static_cast<size_t>(criterion)] = value;
    return *this;
}

std::optional<EGLint> config_filter_t::get(criterion_t criterion) const noexcept {
    return values[static_cast<size_t>(criterion)];
}

config_filter_t& config_filter_t::with_alpha_mask_size(EGLint min_size) noexcept {
    return set(criterion_t::alpha_mask_size, min_size);
}

config_filter_t& config_filter_t::with_alpha_size(EGLint min_size) noexcept {
    return set(criterion_t::alpha_size, min_size);
}

config_filter_t& config_filter_t::with_bind_to_texture_rgb(std::optional<bool> value) noexcept {
    return set(criterion_t::bind_to_texture_rgb, to_tristate(value));
}

config_filter_t& config_filter_t::with_bind_to_texture_rgba(std::optional<bool> value) noexcept {
    return set(criterion_t::bind_to_texture_rgba, to_tristate(value));
}

config_filter_t& config_filter_t::with_blue_size(EGLint min_size) noexcept {
    return set(criterion_t::blue_size, min_size);
}

config_filter_t& config_filter_t::with_buffer_size(EGLint min_size) noexcept {
    return set(criterion_t::buffer_size, min_size);
}

config_filter_t& config_filter_t::with_color_buffer_type(color_buffer_type_t value) noexcept {
    return set(criterion_t::color_buffer_type, static_cast<EGLint>(value));
}

config_filter_t& config_filter_t::with_config_caveat(std::optional<config_caveat_t> value) noexcept {
    return set(criterion_t::config_caveat, value ? static_cast<EGLint>(*value) : EGL_DONT_CARE);
}

config_filter_t& config_filter_t::with_config_id(std::optional<EGLint> value) noexcept {
    return set(criterion_t::config_id, value.value_or(EGL_DONT_CARE));
}

config_filter_t& config_filter_t::with_conformant(renderable_type_t value) noexcept {
    return set(criterion_t::conformant, static_cast<EGLint>(value));
}

config_filter_t& config_filter_t::with_depth_size(EGLint min_size) noexcept {
    return set(criterion_t::depth_size, min_size);
}

config_filter_t& config_filter_t::with_green_size(EGLint min_size) noexcept {
    return set(criterion_t::green_size, min_size);
}

config_filter_t& config_filter_t::with_level(EGLint level) noexcept {
    return set(criterion_t::level, level);
}

config_filter_t& config_filter_t::with_luminance_size(EGLint min_size) noexcept {
    return set(criterion_t::luminance_size, min_size);
}

config_filter_t& config_filter_t::with_match_native_pixmap(std::optional<EGLint> handle) noexcept {
    return set(criterion_t::match_native_pixmap, handle.value_or(EGL_NONE));
}

config_filter_t& config_filter_t::with_native_renderable(std::optional<bool> value) noexcept {
    return set(criterion_t::native_renderable, to_tristate(value));
}

config_filter_t& config_filter_t::with_max_swap_interval(std::optional<EGLint> value) noexcept {
    return set(criterion_t::max_swap_interval, value.value_or(EGL_DONT_CARE));
}

config_filter_t& config_filter_t::with_min_swap_interval(std::optional<EGLint> value) noexcept {
    return set(criterion_t::min_swap_interval, value.value_or(EGL_DONT_CARE));
}

config_filter_t& config_filter_t::with_red_size(EGLint min_size) noexcept {
    return set(criterion_t::red_size, min_size);
}

config_filter_t& config_filter_t::with_sample_buffers(EGLint value) noexcept {
    return set(criterion_t::sample_buffers, value);
}

config_filter_t& config_filter_t::with_samples(EGLint value) noexcept {
    return set(criterion_t::samples, value);
}

config_filter_t& config_filter_t::with_stencil_size(EGLint min_size) noexcept {
    return set(criterion_t::stencil_size, min_size);
}

config_filter_t& config_filter_t::with_renderable_type(renderable_type_t value) noexcept {
    return set(criterion_t::renderable_type, static_cast<EGLint>(value));
}

config_filter_t& config_filter_t::with_surface_type(surface_type_t value) noexcept {
    return set(criterion_t::surface_type, static_cast<EGLint>(value));
}

config_filter_t& config_filter_t::with_transparent_type(transparent_type_t value) noexcept {
    return set(criterion_t::transparent_type, static_cast<EGLint>(value));
}

config_filter_t& config_filter_t::with_transparent_red_value(std::optional<EGLint> value) noexcept {
    return set(criterion_t::transparent_red_value, value.value_or(EGL_DONT_CARE));
}

config_filter_t& config_filter_t::with_transparent_green_value(std::optional<EGLint> value) noexcept {
    return set(criterion_t::transparent_green_value, value.value_or(EGL_DONT_CARE));
}

config_filter_t& config_filter_t::with_transparent_blue_value(std::optional<EGLint> value) noexcept {
    return set(criterion_t::transparent_blue_value, value.value_or(EGL_DONT_CARE));
}

std::vector<EGLint> config_filter_t::attributes() const noexcept(false) {
    std::vector<EGLint> attrs{};
    attrs.reserve(criterion_count * 2 + 1);
    for (auto i = 0u; i < criterion_count; ++i) {
        if (values[i].has_value() == false)
            continue;
        attrs.emplace_back(codes[i]);
        attrs.emplace_back(*values[i]);
    }
    attrs.emplace_back(EGL_NONE);
    return attrs;
}

std::vector<config_ref_t> config_filter_t::choose_configs() const noexcept(false) {
    const auto attrs = attributes();
    EGLint count = 0;
    if (auto ec = egl::num_filtered_configs(display, attrs.data(), count))
        throw std::system_error{ec, "eglChooseConfig"};

    std::vector<EGLConfig> configs(static_cast<size_t>(count), nullptr);
    EGLint written = 0;
    if (auto ec = egl::get_filtered_configs(display, attrs.data(), configs, written))
        throw std::system_error{ec, "eglChooseConfig"};
    if (written < count)
        spdlog::warn("{}: {} of {} configs returned", "eglChooseConfig", written, count);
    written = std::min(written, count);

    std::vector<config_ref_t> output{};
    output.reserve(static_cast<size_t>(written));
    for (auto i = 0; i < written; ++i)
        output.emplace_back(display, configs[i]);
    return output;
}

} // namespace egli
