#pragma once

#include "core/types.hpp"
#include "core/compositor.hpp"
#include "core/font_locator.hpp"
#include "core/placement.hpp"
#include "core/resize.hpp"
#include "core/text_rasterizer.hpp"

#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace wit {

/**
 * Image watermark configuration
 */
struct WatermarkOptions {
    double scale = 0.2;          // Max overlay size as a fraction of the image
    double opacity = 0.3;        // 0.0 - 1.0
    double padding = 0.05;       // Margin as a fraction of the image dimensions
    bool invert = false;         // XORed with the automatic inversion
    std::optional<Position> position;   // Automatic placement if empty
    MaskSource mask_source = MaskSource::ColorMagnitude;
};

/**
 * Text watermark configuration
 */
struct TextOptions {
    std::string text;
    bool copyright = false;                   // Prefix with "© YYYY"
    std::optional<CaptureDate> capture_date;  // Year source for the prefix
    double scale = 0.2;                       // Text width as a fraction of image width
    double opacity = 0.3;
    int padding = 10;                         // Pixel offset from the top-left corner
    std::optional<Position> position;         // Anchor instead of the fixed offset
    double margin = 0.05;                     // Margin fraction used with position
    std::string font;                         // File or fontconfig pattern; empty for sans-serif
};

/**
 * Outcome of an image watermark
 */
struct WatermarkReport {
    Position position;
    cv::Rect region;
    RegionStat stat;
    BlendReport blend;
    bool forced;
};

/**
 * Outcome of a text watermark
 */
struct TextReport {
    bool applied = false;   // False when the font was missing
    std::string text;       // Final text, including any copyright prefix
    cv::Rect region;
    int font_size = 0;
    bool dark_fill = false;
    std::string message;
};

/**
 * Watermark engine
 *
 * Owns the overlay image and the logger used for placement diagnostics.
 * Images passed in are modified in place; the caller keeps ownership and
 * must not share them with another call while it runs.
 */
class WatermarkEngine {
public:
    explicit WatermarkEngine(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Load the overlay image from a file, keeping any alpha channel
     *
     * @throws std::runtime_error if the file cannot be decoded
     */
    void load_overlay(const std::filesystem::path& path);

    void set_overlay(cv::Mat overlay);
    [[nodiscard]] bool has_overlay() const noexcept { return !overlay_.empty(); }
    [[nodiscard]] const cv::Mat& overlay() const noexcept { return overlay_; }

    /**
     * Blend the stored overlay into an image
     *
     * The overlay is shrunk to fit options.scale, placed on the flattest
     * anchor (or options.position), and blended with auto-inversion.
     *
     * @throws OverlaySizeError if the overlay cannot be placed
     */
    WatermarkReport add_image_watermark(cv::Mat& image, const WatermarkOptions& options) const;

    WatermarkReport add_image_watermark(
        cv::Mat& image,
        const cv::Mat& overlay,
        const WatermarkOptions& options
    ) const;

    /**
     * Render and composite a text watermark
     *
     * A missing font is logged and the image is left untouched
     * (report.applied == false).
     */
    TextReport add_text_watermark(cv::Mat& image, const TextOptions& options) const;

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    cv::Mat overlay_;

    void log_candidates(const PlacementResult& placement) const;
};

/**
 * Per-file pipeline configuration
 */
struct ProcessOptions {
    ResizeOptions resize;
    WatermarkOptions watermark;      // Used when the engine has an overlay
    std::optional<TextOptions> text;
    int jpeg_quality = 75;
    bool force = false;              // Overwrite an existing output
    bool no_op = false;              // Process and report, do not write
};

/**
 * Result of processing an image
 */
struct ProcessResult {
    bool success = false;
    ResultCode code = ResultCode::ProcessingFailed;
    cv::Size input_size;
    cv::Size output_size;
    std::uintmax_t input_bytes = 0;
    std::uintmax_t output_bytes = 0;
    std::optional<WatermarkReport> watermark;
    std::optional<TextReport> text;
    std::string message;
};

/**
 * Process a single image file
 *
 * Load, resize, watermark (image then text), encode and write.
 *
 * @param input_path   Input image path
 * @param output_path  Output image path
 * @param options      Pipeline configuration
 * @param engine       The watermark engine to use
 * @return             Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const ProcessOptions& options,
    const WatermarkEngine& engine
);

}  // namespace wit
