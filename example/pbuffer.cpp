#include <cstdlib>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <egli/egli.hpp>
#include <egli/format.hpp>

/// @brief Make an OpenGL ES 2 context current with a 640x480 pbuffer of the default display
int main(int, char*[]) {
    spdlog::cfg::load_env_levels();
    try {
        auto display = egli::display_t::from_default_display();
        display.initialize();

        auto filter = display.config_filter();
        filter.with_surface_type(egli::surface_type_t::pbuffer)
            .with_renderable_type(egli::renderable_type_t::opengl_es2)
            .with_red_size(8)
            .with_green_size(8)
            .with_blue_size(8)
            .with_alpha_size(8)
            .with_depth_size(24);
        const auto configs = filter.choose_configs();
        if (configs.empty()) {
            spdlog::error("{}: no RGBA8/D24 config for OpenGL ES 2 pbuffer", "eglChooseConfig");
            return EXIT_FAILURE;
        }
        const auto& config = configs.front();
        spdlog::debug("{}", config);

        egli::bind_api(EGL_OPENGL_ES_API);
        auto context = display.create_context_with_client_version(config, egli::context_client_version_t::opengl_es2);
        const EGLint attrs[]{EGL_WIDTH, 640, EGL_HEIGHT, 480, EGL_NONE};
        auto surface = display.create_pbuffer_surface(config, attrs);
        display.make_current(surface, surface, context);

        spdlog::info("pbuffer {}x{}", surface.query_width(), surface.query_height());
        spdlog::info("glClear: {}", reinterpret_cast<void*>(display.get_proc_address("glClear")));
        for (auto i = 0; i < 3; ++i)
            display.swap_buffers(surface);
        display.make_not_current();
    } catch (const std::system_error& ex) {
        spdlog::error("{}: {}", ex.what(), ex.code().value());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
