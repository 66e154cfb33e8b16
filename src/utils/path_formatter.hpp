/**
 * @file    path_formatter.hpp
 * @brief   fmt formatter for std::filesystem::path with UTF-8 output
 * @license MIT
 *
 * @details
 * On Windows path.string() returns the ANSI code page while spdlog/fmt
 * expect UTF-8. u8string() is UTF-8 everywhere; under C++20 it returns
 * std::u8string, so the bytes are reinterpreted as char.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Processing: {}", some_path);
 */

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace wit {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

}  // namespace wit

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        const std::string u8 = wit::to_utf8(p);
        return fmt::formatter<std::string_view>::format(std::string_view{u8}, ctx);
    }
};
