#include <egli/format.hpp>

#include <system_error>
#include <utility>

namespace egli {

const char* to_string(color_buffer_type_t value) noexcept {
    switch (value) {
    case color_buffer_type_t::rgb:
        return "RGB";
    case color_buffer_type_t::luminance:
        return "LUMINANCE";
    }
    return "UNKNOWN";
}

const char* to_string(config_caveat_t value) noexcept {
    switch (value) {
    case config_caveat_t::none:
        return "NONE";
    case config_caveat_t::slow:
        return "SLOW";
    case config_caveat_t::non_conformant:
        return "NON_CONFORMANT";
    }
    return "UNKNOWN";
}

const char* to_string(transparent_type_t value) noexcept {
    switch (value) {
    case transparent_type_t::none:
        return "NONE";
    case transparent_type_t::transparent_rgb:
        return "TRANSPARENT_RGB";
    }
    return "UNKNOWN";
}

namespace {

template <typename T, size_t N>
std::string join_bits(T value, const std::pair<T, const char*> (&names)[N]) {
    std::string txt{};
    for (const auto& [bit, name] : names) {
        if (contains(value, bit) == false)
            continue;
        if (txt.empty() == false)
            txt += '|';
        txt += name;
    }
    return txt.empty() ? "0" : txt;
}

} // namespace

std::string to_string(renderable_type_t value) noexcept(false) {
    constexpr std::pair<renderable_type_t, const char*> names[]{
        {renderable_type_t::opengl, "OPENGL"},         {renderable_type_t::opengl_es, "OPENGL_ES"},
        {renderable_type_t::opengl_es2, "OPENGL_ES2"}, {renderable_type_t::opengl_es3, "OPENGL_ES3"},
        {renderable_type_t::openvg, "OPENVG"},
    };
    return join_bits(value, names);
}

std::string to_string(surface_type_t value) noexcept(false) {
    constexpr std::pair<surface_type_t, const char*> names[]{
        {surface_type_t::pbuffer, "PBUFFER"},
        {surface_type_t::pixmap, "PIXMAP"},
        {surface_type_t::window, "WINDOW"},
        {surface_type_t::vg_colorspace_linear, "VG_COLORSPACE_LINEAR"},
        {surface_type_t::vg_alpha_format_pre, "VG_ALPHA_FORMAT_PRE"},
        {surface_type_t::multisample_resolve_box, "MULTISAMPLE_RESOLVE_BOX"},
        {surface_type_t::swap_behavior_preserved, "SWAP_BEHAVIOR_PRESERVED"},
    };
    return join_bits(value, names);
}

std::string to_string(const config_ref_t& config) noexcept(false) {
    try {
        return fmt::format("config_ref_t{{config_id: {}, red_size: {}, green_size: {}, blue_size: {}, alpha_size: {}, "
                           "buffer_size: {}, alpha_mask_size: {}, depth_size: {}, stencil_size: {}, "
                           "bind_to_texture_rgb: {}, bind_to_texture_rgba: {}, color_buffer_type: {}, "
                           "config_caveat: {}, conformant: {}, level: {}, luminance_size: {}, "
                           "max_pbuffer_width: {}, max_pbuffer_height: {}, max_pbuffer_pixels: {}, "
                           "max_swap_interval: {}, min_swap_interval: {}, native_renderable: {}, "
                           "native_visual_id: {}, native_visual_type: {}, renderable_type: {}, sample_buffers: {}, "
                           "samples: {}, surface_type: {}, transparent_type: {}, transparent_red_value: {}, "
                           "transparent_green_value: {}, transparent_blue_value: {}}}",
                           config.config_id(), config.red_size(), config.green_size(), config.blue_size(),
                           config.alpha_size(), config.buffer_size(), config.alpha_mask_size(), config.depth_size(),
                           config.stencil_size(), config.bind_to_texture_rgb(), config.bind_to_texture_rgba(),
                           to_string(config.color_buffer_type()), to_string(config.config_caveat()),
                           to_string(config.conformant()), config.level(), config.luminance_size(),
                           config.max_pbuffer_width(), config.max_pbuffer_height(), config.max_pbuffer_pixels(),
                           config.max_swap_interval(), config.min_swap_interval(), config.native_renderable(),
                           config.native_visual_id(), config.native_visual_type(),
                           to_string(config.renderable_type()), config.sample_buffers(), config.samples(),
                           to_string(config.surface_type()), to_string(config.transparent_type()),
                           config.transparent_red_value(), config.transparent_green_value(),
                           config.transparent_blue_value());
    } catch (const std::system_error& ex) {
        return fmt::format("config_ref_t{{error: {}}}", ex.code().message());
    }
}

} // namespace egli
