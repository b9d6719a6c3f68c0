#include <egli/config.hpp>
#include <egli/egl.hpp>

namespace egli {

config_ref_t::config_ref_t(EGLDisplay display, EGLConfig config) noexcept : display{display}, config{config} {
}

EGLConfig config_ref_t::handle() const noexcept {
    return config;
}

EGLDisplay config_ref_t::display_handle() const noexcept {
    return display;
}

EGLint config_ref_t::get_attrib(EGLint attribute) const noexcept(false) {
    EGLint value = 0;
    if (auto ec = egl::get_config_attrib(display, config, attribute, value))
        throw std::system_error{ec, "eglGetConfigAttrib"};
    return value;
}

EGLint config_ref_t::alpha_size() const noexcept(false) {
    return get_attrib(EGL_ALPHA_SIZE);
}

EGLint config_ref_t::alpha_mask_size() const noexcept(false) {
    return get_attrib(EGL_ALPHA_MASK_SIZE);
}

bool config_ref_t::bind_to_texture_rgb() const noexcept(false) {
    return get_attrib(EGL_BIND_TO_TEXTURE_RGB) == EGL_TRUE;
}

bool config_ref_t::bind_to_texture_rgba() const noexcept(false) {
    return get_attrib(EGL_BIND_TO_TEXTURE_RGBA) == EGL_TRUE;
}

EGLint config_ref_t::blue_size() const noexcept(false) {
    return get_attrib(EGL_BLUE_SIZE);
}

EGLint config_ref_t::buffer_size() const noexcept(false) {
    return get_attrib(EGL_BUFFER_SIZE);
}

color_buffer_type_t config_ref_t::color_buffer_type() const noexcept(false) {
    return static_cast<color_buffer_type_t>(get_attrib(EGL_COLOR_BUFFER_TYPE));
}

config_caveat_t config_ref_t::config_caveat() const noexcept(false) {
    return static_cast<config_caveat_t>(get_attrib(EGL_CONFIG_CAVEAT));
}

EGLint config_ref_t::config_id() const noexcept(false) {
    return get_attrib(EGL_CONFIG_ID);
}

renderable_type_t config_ref_t::conformant() const noexcept(false) {
    return truncate_bits<renderable_type_t>(get_attrib(EGL_CONFORMANT));
}

EGLint config_ref_t::depth_size() const noexcept(false) {
    return get_attrib(EGL_DEPTH_SIZE);
}

EGLint config_ref_t::green_size() const noexcept(false) {
    return get_attrib(EGL_GREEN_SIZE);
}

EGLint config_ref_t::level() const noexcept(false) {
    return get_attrib(EGL_LEVEL);
}

EGLint config_ref_t::luminance_size() const noexcept(false) {
    return get_attrib(EGL_LUMINANCE_SIZE);
}

EGLint config_ref_t::max_pbuffer_width() const noexcept(false) {
    return get_attrib(EGL_MAX_PBUFFER_WIDTH);
}

EGLint config_ref_t::max_pbuffer_height() const noexcept(false) {
    return get_attrib(EGL_MAX_PBUFFER_HEIGHT);
}

EGLint config_ref_t::max_pbuffer_pixels() const noexcept(false) {
    return get_attrib(EGL_MAX_PBUFFER_PIXELS);
}

EGLint config_ref_t::max_swap_interval() const noexcept(false) {
    return get_attrib(EGL_MAX_SWAP_INTERVAL);
}

EGLint config_ref_t::min_swap_interval() const noexcept(false) {
    return get_attrib(EGL_MIN_SWAP_INTERVAL);
}

bool config_ref_t::native_renderable() const noexcept(false) {
    return get_attrib(EGL_NATIVE_RENDERABLE) == EGL_TRUE;
}

EGLint config_ref_t::native_visual_id() const noexcept(false) {
    return get_attrib(EGL_NATIVE_VISUAL_ID);
}

EGLint config_ref_t::native_visual_type() const noexcept(false) {
    return get_attrib(EGL_NATIVE_VISUAL_TYPE);
}

EGLint config_ref_t::red_size() const noexcept(false) {
    return get_attrib(EGL_RED_SIZE);
}

renderable_type_t config_ref_t::renderable_type() const noexcept(false) {
    return truncate_bits<renderable_type_t>(get_attrib(EGL_RENDERABLE_TYPE));
}

EGLint config_ref_t::sample_buffers() const noexcept(false) {
    return get_attrib(EGL_SAMPLE_BUFFERS);
}

EGLint config_ref_t::samples() const noexcept(false) {
    return get_attrib(EGL_SAMPLES);
}

EGLint config_ref_t::stencil_size() const noexcept(false) {
    return get_attrib(EGL_STENCIL_SIZE);
}

surface_type_t config_ref_t::surface_type() const noexcept(false) {
    return truncate_bits<surface_type_t>(get_attrib(EGL_SURFACE_TYPE));
}

transparent_type_t config_ref_t::transparent_type() const noexcept(false) {
    return static_cast<transparent_type_t>(get_attrib(EGL_TRANSPARENT_TYPE));
}

EGLint config_ref_t::transparent_red_value() const noexcept(false) {
    return get_attrib(EGL_TRANSPARENT_RED_VALUE);
}

EGLint config_ref_t::transparent_green_value() const noexcept(false) {
    return get_attrib(EGL_TRANSPARENT_GREEN_VALUE);
}

EGLint config_ref_t::transparent_blue_value() const noexcept(false) {
    return get_attrib(EGL_TRANSPARENT_BLUE_VALUE);
}

} // namespace egli
