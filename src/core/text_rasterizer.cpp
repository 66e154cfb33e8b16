/**
 * @file    text_rasterizer.cpp
 * @brief   TrueType text rendering implementation
 * @license MIT
 */

#include "core/text_rasterizer.hpp"
#include "core/geometry.hpp"
#include "utils/path_formatter.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace wit {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// Unhinted outlines scale linearly with the pixel size, which keeps the
// measured width monotonic for the font-size search. Embedded bitmap strikes
// are skipped so every rendered glyph is an 8-bit coverage map.
constexpr FT_Int32 kMeasureFlags = FT_LOAD_DEFAULT | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;
constexpr FT_Int32 kRenderFlags  = FT_LOAD_RENDER | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

std::optional<int> parse_field(std::string_view value, size_t pos, size_t len) {
    int out = 0;
    const char* first = value.data() + pos;
    const char* last = first + len;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return out;
}

}  // anonymous namespace

// =============================================================================
// Copyright text
// =============================================================================

std::optional<CaptureDate> parse_capture_date(std::string_view value) {
    if (value.size() < 10) return std::nullopt;

    const char sep = value[4];
    if ((sep != ':' && sep != '-') || value[7] != sep) return std::nullopt;
    if (value.size() > 10 && value[10] != ' ' && value[10] != 'T') return std::nullopt;

    const auto year = parse_field(value, 0, 4);
    const auto month = parse_field(value, 5, 2);
    const auto day = parse_field(value, 8, 2);
    if (!year || !month || !day) return std::nullopt;
    if (*year < 1 || *month < 1 || *month > 12 || *day < 1 || *day > 31) return std::nullopt;

    return CaptureDate{*year, *month, *day};
}

int current_year() {
    const auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    return static_cast<int>(std::chrono::year_month_day{today}.year());
}

std::string copyright_prefix(const std::optional<CaptureDate>& capture_date, int fallback_year) {
    const int year = capture_date ? capture_date->year : fallback_year;
    return fmt::format("\u00A9 {:04d}", year);
}

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        } else {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        bool valid = i + extra < text.size();
        for (size_t k = 1; valid && k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        // Overlong forms, surrogates and out-of-range values
        const bool overlong = (extra == 1 && cp < 0x80) ||
                              (extra == 2 && cp < 0x800) ||
                              (extra == 3 && cp < 0x10000);
        if (overlong || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            cp = kReplacementChar;
        }

        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

// =============================================================================
// FontFace
// =============================================================================

FontFace::FontFace(const std::filesystem::path& font_path)
    : path_(font_path) {

    std::error_code ec;
    if (!std::filesystem::is_regular_file(font_path, ec)) {
        throw FontNotFoundError(fmt::format("Could not find font '{}'", font_path));
    }

    if (FT_Init_FreeType(&library_) != 0) {
        library_ = nullptr;
        throw std::runtime_error("Failed to initialize FreeType");
    }

    if (FT_New_Face(library_, font_path.string().c_str(), 0, &face_) != 0) {
        face_ = nullptr;
        release();
        throw FontNotFoundError(fmt::format("Could not load font '{}'", font_path));
    }

    // Bitmap-only faces (PCF, BDF, fixed strikes) cannot be sized freely
    if (!FT_IS_SCALABLE(face_)) {
        release();
        throw FontNotFoundError(fmt::format("Font '{}' is not a scalable outline font", font_path));
    }

    try {
        set_pixel_size(1);
    } catch (const std::runtime_error& e) {
        release();
        throw FontNotFoundError(fmt::format("Could not use font '{}': {}", font_path, e.what()));
    }
}

FontFace::~FontFace() {
    release();
}

FontFace::FontFace(FontFace&& other) noexcept
    : library_(std::exchange(other.library_, nullptr)),
      face_(std::exchange(other.face_, nullptr)),
      pixel_size_(std::exchange(other.pixel_size_, 0)),
      path_(std::move(other.path_)) {}

FontFace& FontFace::operator=(FontFace&& other) noexcept {
    if (this != &other) {
        release();
        library_ = std::exchange(other.library_, nullptr);
        face_ = std::exchange(other.face_, nullptr);
        pixel_size_ = std::exchange(other.pixel_size_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

void FontFace::release() noexcept {
    if (face_) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }
    if (library_) {
        FT_Done_FreeType(library_);
        library_ = nullptr;
    }
}

void FontFace::set_pixel_size(int size) {
    if (size < 1) {
        throw std::invalid_argument(fmt::format("Font size must be at least 1, got {}", size));
    }
    if (FT_Set_Pixel_Sizes(face_, 0, static_cast<FT_UInt>(size)) != 0) {
        throw std::runtime_error(fmt::format("Font '{}' does not support size {}", path_, size));
    }
    pixel_size_ = size;
}

FT_UInt FontFace::load_glyph(char32_t code_point, FT_Int32 flags) {
    const FT_UInt index = FT_Get_Char_Index(face_, static_cast<FT_ULong>(code_point));
    if (FT_Load_Glyph(face_, index, flags) != 0) {
        throw std::runtime_error(fmt::format("Failed to load glyph U+{:04X} from '{}'",
                                             static_cast<uint32_t>(code_point), path_));
    }
    return index;
}

cv::Size FontFace::measure(std::u32string_view text) {
    const bool kerning = FT_HAS_KERNING(face_);
    FT_Pos pen = 0;
    FT_UInt previous = 0;

    for (char32_t cp : text) {
        const FT_UInt index = load_glyph(cp, kMeasureFlags);
        if (kerning && previous != 0 && index != 0) {
            FT_Vector delta{};
            if (FT_Get_Kerning(face_, previous, index, FT_KERNING_UNFITTED, &delta) == 0) {
                pen += delta.x;
            }
        }
        pen += face_->glyph->advance.x;
        previous = index;
    }

    const FT_Size_Metrics& metrics = face_->size->metrics;
    return cv::Size(
        static_cast<int>((pen + 32) >> 6),
        static_cast<int>((metrics.ascender - metrics.descender + 32) >> 6)
    );
}

void FontFace::draw(cv::Mat& layer, std::u32string_view text, cv::Point origin, const cv::Scalar& color) {
    if (layer.type() != CV_8UC4) {
        throw std::invalid_argument("Text layer must be 8-bit BGRA");
    }

    const bool kerning = FT_HAS_KERNING(face_);
    const FT_Pos baseline = (static_cast<FT_Pos>(origin.y) << 6) + face_->size->metrics.ascender;
    FT_Pos pen = static_cast<FT_Pos>(origin.x) << 6;
    FT_UInt previous = 0;

    const auto fill_b = cv::saturate_cast<uchar>(color[0]);
    const auto fill_g = cv::saturate_cast<uchar>(color[1]);
    const auto fill_r = cv::saturate_cast<uchar>(color[2]);

    for (char32_t cp : text) {
        const FT_UInt index = load_glyph(cp, kRenderFlags);
        if (kerning && previous != 0 && index != 0) {
            FT_Vector delta{};
            if (FT_Get_Kerning(face_, previous, index, FT_KERNING_UNFITTED, &delta) == 0) {
                pen += delta.x;
            }
        }

        const FT_GlyphSlot slot = face_->glyph;
        const FT_Bitmap& bitmap = slot->bitmap;
        if (bitmap.pixel_mode != FT_PIXEL_MODE_GRAY && bitmap.rows > 0) {
            throw std::runtime_error(fmt::format(
                "Unexpected glyph pixel mode {} for U+{:04X} in '{}'",
                static_cast<int>(bitmap.pixel_mode), static_cast<uint32_t>(cp), path_));
        }
        const int left = static_cast<int>((pen + 32) >> 6) + slot->bitmap_left;
        const int top = static_cast<int>((baseline + 32) >> 6) - slot->bitmap_top;

        for (unsigned int row = 0; row < bitmap.rows; ++row) {
            const int y = top + static_cast<int>(row);
            if (y < 0 || y >= layer.rows) continue;

            const unsigned char* src = bitmap.buffer + static_cast<ptrdiff_t>(row) * bitmap.pitch;
            auto* dst = layer.ptr<cv::Vec4b>(y);

            for (unsigned int col = 0; col < bitmap.width; ++col) {
                const int x = left + static_cast<int>(col);
                if (x < 0 || x >= layer.cols || src[col] == 0) continue;

                // Overlapping glyph edges keep the stronger coverage
                const auto a = cv::saturate_cast<uchar>(src[col] * color[3] / 255.0);
                cv::Vec4b& px = dst[x];
                if (a > px[3]) {
                    px = cv::Vec4b(fill_b, fill_g, fill_r, a);
                }
            }
        }

        pen += slot->advance.x;
        previous = index;
    }
}

// =============================================================================
// Font-size search and rendering
// =============================================================================

int fit_font_size(FontFace& font, std::u32string_view text, double target_width) {
    int size = 1;
    font.set_pixel_size(size);
    int width = font.measure(text).width;

    while (width < target_width && size < kMaxFontSize) {
        ++size;
        font.set_pixel_size(size);
        width = font.measure(text).width;
    }

    if (width > target_width && size > 1) {
        --size;
        font.set_pixel_size(size);
    }
    return size;
}

TextRender render_text(
    FontFace& font,
    std::string_view text,
    double target_width_fraction,
    const cv::Mat& background,
    double opacity,
    const TextPlacement& placement)
{
    if (background.empty()) {
        throw std::invalid_argument("Empty image provided");
    }

    const std::u32string code_points = decode_utf8(text);
    if (code_points.empty()) {
        throw std::invalid_argument("Watermark text is empty");
    }

    TextRender out;
    out.font_size = fit_font_size(font, code_points, target_width_fraction * background.cols);
    const cv::Size box = font.measure(code_points);

    cv::Point origin(placement.offset, placement.offset);
    if (placement.position) {
        origin = rectangle_for_position(*placement.position, background.size(), box, placement.padding).tl();
    }
    out.region = cv::Rect(origin, box);

    out.stat = region_stats(background, out.region);
    out.dark_fill = out.stat.mean / max_intensity(background.depth()) >= 0.5;
    out.alpha = static_cast<int>(std::lround(std::clamp(opacity, 0.0, 1.0) * 255.0));

    const double fill = out.dark_fill ? 0.0 : 255.0;
    out.layer = cv::Mat(background.size(), CV_8UC4, cv::Scalar::all(0));
    font.draw(out.layer, code_points, origin, cv::Scalar(fill, fill, fill, out.alpha));

    return out;
}

}  // namespace wit
