/**
 * @file    compositor.cpp
 * @brief   Overlay blending implementation
 * @license MIT
 */

#include "core/compositor.hpp"
#include "core/geometry.hpp"
#include "core/types.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace wit {

namespace {

// Color planes and optional alpha plane as CV_32F
struct FloatPlanes {
    cv::Mat color;  // CV_32FC1 or CV_32FC3
    cv::Mat alpha;  // CV_32FC1, empty when the source has no alpha
};

FloatPlanes split_color_alpha(const cv::Mat& image, double scale) {
    FloatPlanes planes;
    cv::Mat color = image;

    if (image.channels() == 4) {
        cv::cvtColor(image, color, cv::COLOR_BGRA2BGR);
        cv::Mat alpha;
        cv::extractChannel(image, alpha, 3);
        alpha.convertTo(planes.alpha, CV_32F, scale);
    }

    color.convertTo(planes.color, CV_32F, scale);
    return planes;
}

// Convert back to the destination depth and write into it
void store(cv::Mat& dst, const cv::Mat& color_f, const cv::Mat& alpha_f) {
    cv::Mat color;
    color_f.convertTo(color, dst.depth());

    if (dst.channels() == 4) {
        cv::Mat alpha;
        alpha_f.convertTo(alpha, dst.depth());

        std::vector<cv::Mat> channels;
        cv::split(color, channels);
        channels.push_back(alpha);

        cv::Mat merged;
        cv::merge(channels, merged);
        merged.copyTo(dst);
    } else {
        color.copyTo(dst);
    }
}

// Match an overlay color plane to the background channel layout
cv::Mat match_channels(const cv::Mat& color_f, int background_channels) {
    if (background_channels == 1 && color_f.channels() == 3) {
        cv::Mat gray;
        cv::cvtColor(color_f, gray, cv::COLOR_BGR2GRAY);
        return gray;
    }
    return color_f;
}

cv::Mat replicate(const cv::Mat& plane, int channels) {
    if (channels == 1) return plane;
    cv::Mat out;
    cv::merge(std::vector<cv::Mat>(static_cast<size_t>(channels), plane), out);
    return out;
}

void check_background(const cv::Mat& background) {
    if (background.empty()) {
        throw std::invalid_argument("Empty image provided");
    }
    const int ch = background.channels();
    if (ch != 1 && ch != 3 && ch != 4) {
        throw std::invalid_argument(fmt::format("Unsupported channel count {}", ch));
    }
}

}  // anonymous namespace

cv::Mat ensure_alpha(const cv::Mat& overlay) {
    if (overlay.empty()) {
        throw std::invalid_argument("Empty overlay provided");
    }

    // cvtColor fills the new alpha channel with the depth's maximum value
    cv::Mat rgba;
    switch (overlay.channels()) {
        case 1:  cv::cvtColor(overlay, rgba, cv::COLOR_GRAY2BGRA); break;
        case 3:  cv::cvtColor(overlay, rgba, cv::COLOR_BGR2BGRA); break;
        case 4:  rgba = overlay; break;
        default:
            throw std::invalid_argument(fmt::format(
                "Unsupported overlay channel count {}", overlay.channels()));
    }
    return rgba;
}

cv::Mat fit_overlay(const cv::Mat& overlay, const cv::Size& background_size, double scale) {
    if (overlay.empty()) {
        throw std::invalid_argument("Empty overlay provided");
    }
    if (scale <= 0.0) {
        throw std::invalid_argument(fmt::format("Overlay scale must be positive, got {}", scale));
    }

    const double limit_w = scale * background_size.width;
    const double limit_h = scale * background_size.height;

    if (overlay.cols <= limit_w && overlay.rows <= limit_h) {
        return overlay;
    }

    const double factor = std::min(limit_w / overlay.cols, limit_h / overlay.rows);
    const cv::Size target(
        std::max(1, static_cast<int>(std::lround(overlay.cols * factor))),
        std::max(1, static_cast<int>(std::lround(overlay.rows * factor)))
    );

    cv::Mat resized;
    cv::resize(overlay, resized, target, 0, 0, cv::INTER_AREA);
    return resized;
}

BlendReport blend_overlay(
    cv::Mat& background,
    const cv::Mat& overlay,
    const cv::Rect& region,
    double opacity,
    bool invert,
    MaskSource mask_source,
    std::optional<RegionStat> stat)
{
    check_background(background);
    if (overlay.empty()) {
        throw std::invalid_argument("Empty overlay provided");
    }

    const double bg_max = max_intensity(background.depth());
    const double ov_max = max_intensity(overlay.depth());

    // Re-checked here even when the selector already validated the region
    if (!fits_within(region, background.size())) {
        throw OverlaySizeError(fmt::format(
            "Overlay region {}x{} at ({}, {}) does not fit image size {}x{}",
            region.width, region.height, region.x, region.y,
            background.cols, background.rows));
    }
    if (overlay.size() != region.size()) {
        throw std::invalid_argument(fmt::format(
            "Overlay size {}x{} does not match region size {}x{}",
            overlay.cols, overlay.rows, region.width, region.height));
    }

    // Overlay in the background's intensity scale
    const FloatPlanes ov = split_color_alpha(ensure_alpha(overlay), bg_max / ov_max);
    const int channels = (background.channels() == 1) ? 1 : 3;
    cv::Mat ov_color = match_channels(ov.color, channels);

    cv::Mat mask;
    if (mask_source == MaskSource::ColorMagnitude) {
        mask = ov_color * (opacity / bg_max);
    } else {
        mask = replicate(ov.alpha * (opacity / bg_max), channels);
    }

    BlendReport report;
    const RegionStat region_stat = stat ? *stat : region_stats(background, region);
    report.luminance_factor = region_stat.mean / bg_max;
    report.auto_inverted = report.luminance_factor > 0.5;
    report.inverted = report.auto_inverted != invert;

    if (report.inverted) {
        ov_color = cv::Scalar::all(bg_max) - ov_color;
    }

    cv::Mat roi = background(region);
    const FloatPlanes bg = split_color_alpha(roi, 1.0);

    const cv::Mat blended = (cv::Scalar::all(1.0) - mask).mul(bg.color) + mask.mul(ov_color);
    store(roi, blended, bg.alpha);

    return report;
}

void composite_layer(cv::Mat& background, const cv::Mat& layer) {
    check_background(background);
    if (layer.type() != CV_8UC4) {
        throw std::invalid_argument("Text layer must be 8-bit BGRA");
    }
    if (layer.size() != background.size()) {
        throw std::invalid_argument(fmt::format(
            "Layer size {}x{} does not match image size {}x{}",
            layer.cols, layer.rows, background.cols, background.rows));
    }

    const double bg_max = max_intensity(background.depth());
    const int channels = (background.channels() == 1) ? 1 : 3;

    const FloatPlanes src = split_color_alpha(layer, bg_max / 255.0);
    const cv::Mat src_color = match_channels(src.color, channels);
    const cv::Mat alpha = src.alpha / bg_max;
    const cv::Mat weight = replicate(alpha, channels);

    const FloatPlanes dst = split_color_alpha(background, 1.0);

    const cv::Mat out_color = weight.mul(src_color) + (cv::Scalar::all(1.0) - weight).mul(dst.color);

    cv::Mat out_alpha;
    if (!dst.alpha.empty()) {
        out_alpha = alpha * bg_max + (cv::Scalar::all(1.0) - alpha).mul(dst.alpha);
    }

    store(background, out_color, out_alpha);
}

}  // namespace wit
