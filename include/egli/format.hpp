#pragma once
#include <string>

#include <spdlog/fmt/fmt.h>

#include <egli/config.hpp>
#include <egli/types.hpp>

namespace egli {

EGLI_API const char* to_string(color_buffer_type_t value) noexcept;
EGLI_API const char* to_string(config_caveat_t value) noexcept;
EGLI_API const char* to_string(transparent_type_t value) noexcept;
/// @return names of the bits joined with '|'. e.g. "OPENGL_ES2|OPENGL_ES3"
EGLI_API std::string to_string(renderable_type_t value) noexcept(false);
EGLI_API std::string to_string(surface_type_t value) noexcept(false);

/// @note  If an attribute query fails, the text describes the failure instead
EGLI_API std::string to_string(const config_ref_t& config) noexcept(false);

} // namespace egli

template <>
struct fmt::formatter<egli::config_ref_t> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const egli::config_ref_t& config, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string>::format(egli::to_string(config), ctx);
    }
};
