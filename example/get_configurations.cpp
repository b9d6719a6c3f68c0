#include <cstdlib>
#include <string_view>
#include <vector>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <egli/egli.hpp>
#include <egli/format.hpp>

/// @brief Print the EGLConfigs of the default display.
///        With "--rgba8", only the configs with 8 bits for each color channel.
int main(int argc, char* argv[]) {
    spdlog::cfg::load_env_levels();
    try {
        auto display = egli::display_t::from_default_display();
        const auto version = display.initialize_and_get_version();
        spdlog::info("EGL {}.{} {}", version.major, version.minor, display.query_vendor());
        spdlog::info("client APIs: {}", display.query_client_apis());
        spdlog::info("extensions: {}", display.query_extensions());

        std::vector<egli::config_ref_t> configs{};
        if (argc > 1 && std::string_view{argv[1]} == "--rgba8") {
            auto filter = display.config_filter();
            filter.with_red_size(8).with_green_size(8).with_blue_size(8).with_alpha_size(8);
            configs = filter.choose_configs();
        } else {
            configs = display.get_configs();
        }
        spdlog::info("{} configs", configs.size());
        for (const auto& config : configs)
            spdlog::info("{}", config);
    } catch (const std::system_error& ex) {
        spdlog::error("{}: {}", ex.what(), ex.code().value());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
