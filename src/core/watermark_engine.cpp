/**
 * @file    watermark_engine.cpp
 * @brief   Web Image Tool - Watermark Engine
 * @license MIT
 *
 * @details
 * Ties placement, blending and text rendering together and runs the
 * per-file pipeline (load, resize, watermark, encode, write).
 */

#include "core/watermark_engine.hpp"
#include "core/geometry.hpp"
#include "utils/byte_format.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace wit {

WatermarkEngine::WatermarkEngine(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

void WatermarkEngine::load_overlay(const std::filesystem::path& path) {
    cv::Mat overlay = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (overlay.empty()) {
        throw std::runtime_error(fmt::format("Failed to load watermark image: {}", path));
    }
    logger_->info("Loaded watermark {} ({}x{}, {} channels)",
                  path.filename(), overlay.cols, overlay.rows, overlay.channels());
    set_overlay(std::move(overlay));
}

void WatermarkEngine::set_overlay(cv::Mat overlay) {
    if (overlay.empty()) {
        throw std::invalid_argument("Empty overlay provided");
    }
    // Validates depth
    (void)max_intensity(overlay.depth());
    overlay_ = std::move(overlay);
}

void WatermarkEngine::log_candidates(const PlacementResult& placement) const {
    for (const Candidate& c : placement.candidates) {
        if (c.fits) {
            logger_->debug("  {:<13} ({},{})-({},{}) mean={:.2f} stddev={:.2f}",
                           to_string(c.position),
                           c.region.x, c.region.y, c.region.br().x, c.region.br().y,
                           c.stat.mean, c.stat.stddev);
        } else {
            logger_->debug("  {:<13} ({},{})-({},{}) does not fit, skipped",
                           to_string(c.position),
                           c.region.x, c.region.y, c.region.br().x, c.region.br().y);
        }
    }
}

WatermarkReport WatermarkEngine::add_image_watermark(cv::Mat& image, const WatermarkOptions& options) const {
    if (!has_overlay()) {
        throw std::runtime_error("No watermark image loaded");
    }
    return add_image_watermark(image, overlay_, options);
}

WatermarkReport WatermarkEngine::add_image_watermark(
    cv::Mat& image,
    const cv::Mat& overlay,
    const WatermarkOptions& options) const
{
    if (image.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    const cv::Mat fitted = fit_overlay(overlay, image.size(), options.scale);
    if (fitted.size() != overlay.size()) {
        logger_->debug("Resized watermark from {}x{} to {}x{} (scale {:.3f})",
                       overlay.cols, overlay.rows, fitted.cols, fitted.rows, options.scale);
    }

    const PlacementResult placement = select_position(image, fitted.size(), options.padding, options.position);

    logger_->debug("{} placement candidates for {}x{} overlay:",
                   placement.forced ? "Forced" : "Automatic", fitted.cols, fitted.rows);
    log_candidates(placement);

    WatermarkReport report{};
    report.position = placement.position;
    report.region = placement.region;
    report.stat = placement.stat;
    report.forced = placement.forced;
    report.blend = blend_overlay(image, fitted, placement.region,
                                 options.opacity, options.invert,
                                 options.mask_source, placement.stat);

    logger_->info("Watermark at {} ({},{})-({},{}), luminance {:.3f}, inverted: {}",
                  to_string(report.position),
                  report.region.x, report.region.y, report.region.br().x, report.region.br().y,
                  report.blend.luminance_factor, report.blend.inverted ? "yes" : "no");
    return report;
}

TextReport WatermarkEngine::add_text_watermark(cv::Mat& image, const TextOptions& options) const {
    if (image.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    TextReport report;
    report.text = options.text;
    if (options.copyright) {
        const std::string prefix = copyright_prefix(options.capture_date, current_year());
        report.text = options.text.empty() ? prefix : fmt::format("{} {}", prefix, options.text);
        logger_->info("Using copyright text: {}", report.text);
    }

    std::optional<FontFace> font;
    try {
        font.emplace(resolve_font(options.font));
    } catch (const FontNotFoundError& e) {
        report.message = fmt::format("{}, text watermark skipped", e.what());
        logger_->error("{}", report.message);
        return report;
    }
    logger_->debug("Found font '{}'", font->path());

    const TextPlacement placement{options.padding, options.position, options.margin};
    const TextRender render = render_text(*font, report.text, options.scale, image, options.opacity, placement);

    logger_->debug("Final text dims: {} x {} px; Font size: {}",
                   render.region.width, render.region.height, render.font_size);
    logger_->debug("Region luminance: {:.2f}, stddev: {:.2f}", render.stat.mean, render.stat.stddev);
    logger_->info("Text opacity: {}/255, fill: {}", render.alpha, render.dark_fill ? "dark" : "light");

    composite_layer(image, render.layer);

    report.applied = true;
    report.region = render.region;
    report.font_size = render.font_size;
    report.dark_fill = render.dark_fill;
    report.message = "Text watermark added";
    return report;
}

// =============================================================================
// File pipeline
// =============================================================================

namespace {

std::vector<int> encode_params(const std::string& ext, const ProcessOptions& options, std::uintmax_t input_bytes) {
    std::vector<int> params;
    if (ext == ".jpg" || ext == ".jpeg") {
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(options.jpeg_quality, 0, 100),
                  cv::IMWRITE_JPEG_OPTIMIZE, 1};
        // Progressive scans pay off only for larger files
        if (input_bytes > 10000) {
            params.insert(params.end(), {cv::IMWRITE_JPEG_PROGRESSIVE, 1});
        }
    } else if (ext == ".png") {
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    } else if (ext == ".webp") {
        params = {cv::IMWRITE_WEBP_QUALITY, std::clamp(options.jpeg_quality, 1, 100)};
    }
    return params;
}

}  // anonymous namespace

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const ProcessOptions& options,
    const WatermarkEngine& engine)
{
    const auto& log = engine.logger();
    ProcessResult result{};

    try {
        if (!std::filesystem::is_regular_file(input_path)) {
            result.code = ResultCode::FileNotFound;
            result.message = "File not found";
            log->error("File not found: {}", input_path);
            return result;
        }

        if (!options.no_op && !options.force && std::filesystem::exists(output_path)) {
            result.code = ResultCode::OutputExists;
            result.message = fmt::format("File '{}' exists; use -f option to force overwrite", output_path);
            log->error("{}", result.message);
            return result;
        }

        // Read image
        cv::Mat image = cv::imread(input_path.string(), cv::IMREAD_COLOR);
        if (image.empty()) {
            result.code = ResultCode::InvalidFormat;
            result.message = "Failed to load image";
            log->error("Failed to load image: {}", input_path);
            return result;
        }

        result.input_size = image.size();
        result.input_bytes = std::filesystem::file_size(input_path);
        log->info("Processing: {} ({}x{}, {})",
                  input_path.filename(), image.cols, image.rows,
                  format_bytes(static_cast<std::int64_t>(result.input_bytes)));

        // Resize
        const cv::Size new_size = calculate_new_size(image.size(), options.resize);
        if (new_size != image.size()) {
            log->info("Resizing {}x{} -> {}x{}", image.cols, image.rows, new_size.width, new_size.height);
            image = resize_image(image, new_size);
        }

        // Watermarks
        if (engine.has_overlay()) {
            result.watermark = engine.add_image_watermark(image, options.watermark);
        }
        if (options.text) {
            result.text = engine.add_text_watermark(image, *options.text);
        }
        result.output_size = image.size();

        // Encode
        std::string ext = output_path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        if (ext.empty()) {
            ext = ".jpg";
        }

        std::vector<uchar> buffer;
        if (!cv::imencode(ext, image, buffer, encode_params(ext, options, result.input_bytes))) {
            result.code = ResultCode::SaveFailed;
            result.message = "Failed to encode image";
            log->error("Failed to encode image as {}", ext);
            return result;
        }
        result.output_bytes = buffer.size();

        if (options.no_op) {
            result.success = true;
            result.code = ResultCode::Skipped;
            result.message = "Displaying results only, not saved";
            log->info("{}: {}", input_path.filename(), result.message);
            return result;
        }

        // Create output directory if needed
        auto output_dir = output_path.parent_path();
        if (!output_dir.empty() && !std::filesystem::exists(output_dir)) {
            std::filesystem::create_directories(output_dir);
        }

        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (!out) {
            result.code = ResultCode::SaveFailed;
            result.message = "Failed to write image";
            log->error("Failed to write image: {}", output_path);
            return result;
        }

        result.success = true;
        result.code = ResultCode::Success;
        result.message = "Saved";
        log->info("Saved: {} ({}x{}, {})",
                  output_path.filename(), image.cols, image.rows,
                  format_bytes(static_cast<std::int64_t>(result.output_bytes)));
        return result;

    } catch (const OverlaySizeError& e) {
        result.code = ResultCode::ProcessingFailed;
        result.message = std::string("Watermark failed: ") + e.what();
        log->error("{}: {}", input_path.filename(), result.message);
        return result;
    } catch (const std::exception& e) {
        result.code = ResultCode::ProcessingFailed;
        result.message = std::string("Error: ") + e.what();
        log->error("Error processing {}: {}", input_path, e.what());
        return result;
    }
}

}  // namespace wit
