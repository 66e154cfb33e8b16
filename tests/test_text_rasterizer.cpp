/**
 * @file    test_text_rasterizer.cpp
 * @brief   Unit tests for copyright text and TrueType rendering
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/text_rasterizer.hpp"
#include "core/geometry.hpp"
#include "core/font_locator.hpp"

#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <fstream>

using namespace wit;
namespace fs = std::filesystem;

namespace {

// Writes a file under the temp directory and removes it on scope exit
class ScratchFile {
public:
    ScratchFile(const std::string& name, const std::string& contents)
        : path_(fs::temp_directory_path() / name) {
        std::ofstream out(path_, std::ios::binary);
        out << contents;
    }
    ~ScratchFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// One 8x8 glyph, no outlines
constexpr const char* kBitmapFont =
    "STARTFONT 2.1\n"
    "FONT -misc-fixed-medium-r-normal--8-80-75-75-c-80-iso10646-1\n"
    "SIZE 8 75 75\n"
    "FONTBOUNDINGBOX 8 8 0 0\n"
    "STARTPROPERTIES 2\n"
    "FONT_ASCENT 8\n"
    "FONT_DESCENT 0\n"
    "ENDPROPERTIES\n"
    "CHARS 1\n"
    "STARTCHAR A\n"
    "ENCODING 65\n"
    "SWIDTH 1000 0\n"
    "DWIDTH 8 0\n"
    "BBX 8 8 0 0\n"
    "BITMAP\n"
    "18\n24\n42\n42\n7E\n42\n42\n00\n"
    "ENDCHAR\n"
    "ENDFONT\n";

}  // anonymous namespace

// =============================================================================
// Copyright text
// =============================================================================

TEST(CopyrightPrefixTest, UsesCaptureYear) {
    EXPECT_EQ(copyright_prefix(CaptureDate{2019, 7, 4}, 2030), "\xC2\xA9 2019");
}

TEST(CopyrightPrefixTest, FallsBackToGivenYear) {
    EXPECT_EQ(copyright_prefix(std::nullopt, 2024), "\xC2\xA9 2024");
}

TEST(CurrentYearTest, IsPlausible) {
    const int year = current_year();
    EXPECT_GE(year, 2024);
    EXPECT_LT(year, 3000);
}

TEST(ParseCaptureDateTest, ExifFormat) {
    const auto date = parse_capture_date("2019:07:04 12:30:00");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year, 2019);
    EXPECT_EQ(date->month, 7);
    EXPECT_EQ(date->day, 4);
}

TEST(ParseCaptureDateTest, IsoFormat) {
    ASSERT_TRUE(parse_capture_date("2021-03-15").has_value());
    const auto date = parse_capture_date("2021-03-15T08:00:00Z");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year, 2021);
    EXPECT_EQ(date->day, 15);
}

TEST(ParseCaptureDateTest, RejectsMalformed) {
    EXPECT_FALSE(parse_capture_date("").has_value());
    EXPECT_FALSE(parse_capture_date("yesterday").has_value());
    EXPECT_FALSE(parse_capture_date("2021:03-15").has_value());
    EXPECT_FALSE(parse_capture_date("2021:13:01").has_value());
    EXPECT_FALSE(parse_capture_date("2021:00:10").has_value());
    EXPECT_FALSE(parse_capture_date("2021:1a:10").has_value());
    EXPECT_FALSE(parse_capture_date("2021-03-15x").has_value());
}

// =============================================================================
// UTF-8 decoding
// =============================================================================

TEST(DecodeUtf8Test, ValidSequences) {
    EXPECT_EQ(decode_utf8("abc"), U"abc");
    EXPECT_EQ(decode_utf8("\xC2\xA9 2020"), U"\u00A9 2020");
    EXPECT_EQ(decode_utf8("\xE2\x82\xAC"), U"\u20AC");
    EXPECT_EQ(decode_utf8("\xF0\x9F\x98\x80"), U"\U0001F600");
}

TEST(DecodeUtf8Test, MalformedBecomesReplacement) {
    EXPECT_EQ(decode_utf8("a\xFF" "b"), U"a\uFFFDb");
    EXPECT_EQ(decode_utf8("\xC2"), U"\uFFFD");
    EXPECT_EQ(decode_utf8("\xE2\x82"), U"\uFFFD\uFFFD");
    EXPECT_EQ(decode_utf8("\xC0\xAF"), U"\uFFFD");
    EXPECT_EQ(decode_utf8("\xED\xA0\x80"), U"\uFFFD");
}

// =============================================================================
// FontFace
// =============================================================================

TEST(FontFaceTest, MissingFontThrows) {
    EXPECT_THROW({ FontFace font("/nonexistent/fonts/missing.ttf"); }, FontNotFoundError);
}

TEST(FontFaceTest, NonFontFileThrows) {
    const ScratchFile file("wit_not_a_font.ttf", "this is plain text, not a font");
    EXPECT_THROW({ FontFace font(file.path()); }, FontNotFoundError);
}

TEST(FontFaceTest, BitmapOnlyFontThrows) {
    const ScratchFile file("wit_bitmap_only.bdf", kBitmapFont);
    EXPECT_THROW({ FontFace font(file.path()); }, FontNotFoundError);
}

TEST(FontFaceTest, WidthNeverShrinksAsSizeGrows) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    int previous = 0;
    for (int size = 1; size <= 120; ++size) {
        font.set_pixel_size(size);
        const int width = font.measure(U"\u00A9 2024 Example").width;
        EXPECT_GE(width, previous) << "size " << size;
        previous = width;
    }
}

TEST(FontFaceTest, DrawIsAntiAliased) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    font.set_pixel_size(32);
    cv::Mat layer(64, 256, CV_8UC4, cv::Scalar::all(0));
    font.draw(layer, U"Soft edges", cv::Point(4, 4), cv::Scalar(0, 0, 0, 255));

    cv::Mat alpha;
    cv::extractChannel(layer, alpha, 3);
    cv::Mat partial;
    cv::inRange(alpha, cv::Scalar(1), cv::Scalar(254), partial);

    EXPECT_GT(cv::countNonZero(alpha), 0);
    EXPECT_GT(cv::countNonZero(partial), 0);
}

TEST(FontFaceTest, MeasureGrowsWithSize) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    font.set_pixel_size(12);
    const cv::Size small = font.measure(U"Watermark");
    font.set_pixel_size(48);
    const cv::Size large = font.measure(U"Watermark");

    EXPECT_GT(small.width, 0);
    EXPECT_GT(small.height, 0);
    EXPECT_GT(large.width, small.width);
    EXPECT_GT(large.height, small.height);
}

TEST(FitFontSizeTest, LargestSizeNotExceedingTarget) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    const std::u32string text = U"\u00A9 2024 Example Studio";

    for (double fraction : {0.1, 0.2, 0.5}) {
        const double target = fraction * 800;
        const int n = fit_font_size(font, text, target);
        ASSERT_GE(n, 1);
        ASSERT_LT(n, kMaxFontSize);
        EXPECT_EQ(font.pixel_size(), n);

        font.set_pixel_size(n);
        const int width_n = font.measure(text).width;
        font.set_pixel_size(n + 1);
        const int width_next = font.measure(text).width;

        EXPECT_LE(width_n, target) << "fraction " << fraction;
        EXPECT_GE(width_next, target) << "fraction " << fraction;
    }
}

// =============================================================================
// render_text
// =============================================================================

TEST(RenderTextTest, DarkFillOnBrightBackground) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    const cv::Mat bg(300, 400, CV_8UC3, cv::Scalar::all(220));

    const TextRender render = render_text(font, "Sample", 0.2, bg, 0.3);

    EXPECT_TRUE(render.dark_fill);
    EXPECT_EQ(render.alpha, 77);
    EXPECT_EQ(render.region.tl(), cv::Point(10, 10));
    EXPECT_EQ(render.layer.type(), CV_8UC4);
    EXPECT_EQ(render.layer.size(), bg.size());

    double max_alpha = 0.0;
    cv::Mat alpha;
    cv::extractChannel(render.layer, alpha, 3);
    cv::minMaxLoc(alpha, nullptr, &max_alpha);
    EXPECT_GT(max_alpha, 0.0);
    EXPECT_LE(max_alpha, 77.0);
}

TEST(RenderTextTest, LightFillOnDarkBackground) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    const cv::Mat bg(300, 400, CV_8UC3, cv::Scalar::all(20));

    const TextRender render = render_text(font, "Sample", 0.2, bg, 1.0);

    EXPECT_FALSE(render.dark_fill);
    EXPECT_EQ(render.alpha, 255);
}

TEST(RenderTextTest, AnchoredPlacementFits) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    const cv::Mat bg(300, 400, CV_8UC3, cv::Scalar::all(128));

    TextPlacement placement;
    placement.position = Position::BottomRight;
    const TextRender render = render_text(font, "Sample", 0.3, bg, 0.5, placement);

    EXPECT_TRUE(fits_within(render.region, bg.size()));
    EXPECT_GT(render.region.x, bg.cols / 2);
    EXPECT_GT(render.region.y, bg.rows / 2);
}

TEST(RenderTextTest, EmptyTextThrows) {
    const auto font_path = find_font(kDefaultFontPattern);
    ASSERT_TRUE(font_path.has_value()) << "fontconfig has no scalable sans-serif font";

    FontFace font(*font_path);
    const cv::Mat bg(100, 100, CV_8UC3, cv::Scalar::all(0));

    EXPECT_THROW((void)render_text(font, "", 0.2, bg, 0.3), std::invalid_argument);
}
