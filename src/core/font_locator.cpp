/**
 * @file    font_locator.cpp
 * @brief   Font file lookup implementation
 * @license MIT
 */

#include "core/font_locator.hpp"
#include "core/types.hpp"

#include <fontconfig/fontconfig.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <string>

namespace wit {

namespace {

using PatternPtr = std::unique_ptr<FcPattern, decltype(&FcPatternDestroy)>;

bool looks_like_path(std::string_view font) {
    if (font.find('/') != std::string_view::npos || font.find('\\') != std::string_view::npos) {
        return true;
    }

    std::string ext = std::filesystem::path(std::string(font)).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    static constexpr std::array<const char*, 5> kFontExtensions = {
        ".ttf", ".otf", ".ttc", ".otc", ".pfb"
    };
    return std::find(kFontExtensions.begin(), kFontExtensions.end(), ext) != kFontExtensions.end();
}

}  // anonymous namespace

std::optional<std::filesystem::path> find_font(std::string_view pattern) {
    if (!FcInit()) {
        return std::nullopt;
    }

    const std::string name(pattern);
    PatternPtr query(FcNameParse(reinterpret_cast<const FcChar8*>(name.c_str())), FcPatternDestroy);
    if (!query) {
        return std::nullopt;
    }

    // Glyphs are rendered from outlines at arbitrary sizes
    FcPatternAddBool(query.get(), FC_SCALABLE, FcTrue);
    FcConfigSubstitute(nullptr, query.get(), FcMatchPattern);
    FcDefaultSubstitute(query.get());

    FcResult result = FcResultNoMatch;
    PatternPtr match(FcFontMatch(nullptr, query.get(), &result), FcPatternDestroy);
    if (!match || result != FcResultMatch) {
        return std::nullopt;
    }

    FcChar8* file = nullptr;
    if (FcPatternGetString(match.get(), FC_FILE, 0, &file) != FcResultMatch || file == nullptr) {
        return std::nullopt;
    }

    std::filesystem::path path(reinterpret_cast<const char*>(file));
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    return path;
}

std::filesystem::path resolve_font(std::string_view font) {
    if (font.empty()) {
        font = kDefaultFontPattern;
    }

    if (looks_like_path(font)) {
        std::filesystem::path path(std::string{font});
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw FontNotFoundError(fmt::format("Could not find font '{}'", font));
        }
        return path;
    }

    if (auto path = find_font(font)) {
        return *path;
    }
    throw FontNotFoundError(fmt::format("No installed font matches '{}'", font));
}

}  // namespace wit
