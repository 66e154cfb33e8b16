/**
 * @file    text_rasterizer.hpp
 * @brief   TrueType text rendering for text watermarks
 * @license MIT
 *
 * @details
 * Text is rendered with FreeType into a transparent BGRA layer the size of
 * the background. The font size is found by a linear search from 1 upward
 * until the text is as wide as the requested fraction of the image width,
 * stepping back one size if the last step overshot.
 *
 * Fill is black on bright regions and white on dark ones, with the layer
 * alpha set from the opacity.
 */

#pragma once

#include "core/types.hpp"
#include "core/region_stats.hpp"

#include <opencv2/core.hpp>
#include <ft2build.h>
#include FT_FREETYPE_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wit {

// Upper bound for the font-size search
inline constexpr int kMaxFontSize = 1024;

/**
 * Calendar date an image was captured (from EXIF or the caller)
 */
struct CaptureDate {
    int year;
    int month;
    int day;
};

/**
 * Parse "YYYY:MM:DD[ HH:MM:SS]" (EXIF DateTimeOriginal) or "YYYY-MM-DD[...]"
 *
 * @return  Date, or nullopt if the string is not a valid date
 */
[[nodiscard]] std::optional<CaptureDate> parse_capture_date(std::string_view value);

/**
 * Current calendar year (UTC)
 */
[[nodiscard]] int current_year();

/**
 * Build the "© YYYY" prefix
 *
 * @param capture_date  Date the photo was taken, if known
 * @param fallback_year Year used when capture_date is empty
 */
[[nodiscard]] std::string copyright_prefix(const std::optional<CaptureDate>& capture_date, int fallback_year);

/**
 * Decode UTF-8 into code points; malformed sequences become U+FFFD
 */
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

/**
 * FreeType face loaded from a font file
 */
class FontFace {
public:
    /**
     * @param font_path  TrueType / OpenType font file
     * @throws FontNotFoundError if the file is missing, not a font, or has
     *         no scalable outlines
     */
    explicit FontFace(const std::filesystem::path& font_path);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;
    FontFace(FontFace&& other) noexcept;
    FontFace& operator=(FontFace&& other) noexcept;

    void set_pixel_size(int size);
    [[nodiscard]] int pixel_size() const noexcept { return pixel_size_; }

    /**
     * Size of a line of text at the current pixel size
     *
     * Width is the sum of advances plus kerning; height is ascender minus
     * descender.
     */
    [[nodiscard]] cv::Size measure(std::u32string_view text);

    /**
     * Draw text into a BGRA 8-bit layer
     *
     * @param layer   Destination (CV_8UC4)
     * @param text    Code points
     * @param origin  Top-left corner of the text box
     * @param color   Fill as (B, G, R, A); glyph coverage scales A
     */
    void draw(cv::Mat& layer, std::u32string_view text, cv::Point origin, const cv::Scalar& color);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    int pixel_size_ = 0;
    std::filesystem::path path_;

    FT_UInt load_glyph(char32_t code_point, FT_Int32 flags);
    void release() noexcept;
};

/**
 * Linear font-size search
 *
 * Grows the size from 1 until the text width reaches target_width, then
 * steps back one size if it overshot. Never returns less than 1 or more
 * than kMaxFontSize. Leaves the font set to the returned size.
 */
int fit_font_size(FontFace& font, std::u32string_view text, double target_width);

/**
 * Where the text box goes
 */
struct TextPlacement {
    int offset = 10;                    // Pixel offset from the top-left corner
    std::optional<Position> position;   // Anchor instead of the fixed offset
    double padding = 0.05;              // Margin fraction, used with position
};

/**
 * Rendered text layer and the decisions behind it
 */
struct TextRender {
    cv::Mat layer;       // CV_8UC4, background size, transparent except glyphs
    cv::Rect region;     // Text box
    int font_size = 0;
    RegionStat stat;     // Luminance of the text box
    bool dark_fill = false;
    int alpha = 0;       // Fill alpha, 0 - 255
};

/**
 * Render text as a transparent overlay sized to the background
 *
 * @param font                    Loaded font
 * @param text                    UTF-8 text
 * @param target_width_fraction   Text width as a fraction of the image width
 * @param background              Image the text will be composited onto
 * @param opacity                 0.0 - 1.0, applied as fill alpha
 * @param placement               Fixed offset or anchor
 */
[[nodiscard]] TextRender render_text(
    FontFace& font,
    std::string_view text,
    double target_width_fraction,
    const cv::Mat& background,
    double opacity,
    const TextPlacement& placement = {}
);

}  // namespace wit
