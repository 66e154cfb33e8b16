/**
 * @file    font_locator.hpp
 * @brief   Font file lookup through fontconfig
 * @license MIT
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace wit {

// Pattern used when no font is configured
inline constexpr const char* kDefaultFontPattern = "sans-serif";

/**
 * Best scalable font file for a fontconfig pattern ("sans-serif",
 * "DejaVu Sans:bold", ...), or nullopt if fontconfig has none
 */
[[nodiscard]] std::optional<std::filesystem::path> find_font(std::string_view pattern);

/**
 * Resolve a configured font to a file
 *
 * Empty means kDefaultFontPattern. Values that look like a path (a directory
 * separator or a font file extension) must name an existing file; anything
 * else is a fontconfig pattern.
 *
 * @throws FontNotFoundError if nothing matches
 */
[[nodiscard]] std::filesystem::path resolve_font(std::string_view font);

}  // namespace wit
