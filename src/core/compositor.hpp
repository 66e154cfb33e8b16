/**
 * @file    compositor.hpp
 * @brief   Overlay blending with contrast-aware inversion
 * @license MIT
 *
 * @details
 * Blend formula over the target rectangle, per channel:
 *
 *   result = (1 - mask) * background + mask * overlay
 *
 * With MaskSource::ColorMagnitude the mask is the overlay's own color
 * value scaled by opacity (mask = overlay / max * opacity), so black
 * overlay pixels leave the background untouched. With
 * MaskSource::AlphaChannel it is the overlay's alpha channel instead.
 *
 * The mask is taken from the overlay before any inversion. The overlay
 * colors are inverted when the region is bright (mean / max > 0.5), and
 * the configured invert flag flips that decision again (XOR).
 *
 * The background is modified in place and keeps its depth and channels.
 */

#pragma once

#include "core/region_stats.hpp"

#include <opencv2/core.hpp>
#include <optional>

namespace wit {

/**
 * Where the per-pixel blend weight comes from
 */
enum class MaskSource {
    ColorMagnitude,  // overlay color / max * opacity
    AlphaChannel     // overlay alpha / max * opacity
};

/**
 * What blend_overlay() decided
 */
struct BlendReport {
    double luminance_factor = 0.0;  // Region mean / max intensity
    bool auto_inverted = false;     // Region was bright enough to invert
    bool inverted = false;          // Final decision (auto XOR configured)
};

/**
 * Add a fully opaque alpha channel if the overlay has none
 *
 * 1- and 3-channel inputs become BGRA of the same depth; 4-channel inputs
 * are returned as-is.
 */
[[nodiscard]] cv::Mat ensure_alpha(const cv::Mat& overlay);

/**
 * Shrink an overlay to fit inside scale * background (never enlarges)
 *
 * Aspect ratio is preserved and INTER_AREA is used.
 *
 * @throws std::invalid_argument if scale <= 0
 */
[[nodiscard]] cv::Mat fit_overlay(const cv::Mat& overlay, const cv::Size& background_size, double scale);

/**
 * Blend an overlay into the background at a rectangle
 *
 * @param background   Image to modify in place (CV_8U or CV_16U, 1/3/4 channels)
 * @param overlay      Overlay, same size as region (CV_8U or CV_16U, 1/3/4 channels)
 * @param region       Target rectangle in background coordinates
 * @param opacity      Blend opacity, 0.0 - 1.0
 * @param invert       Configured inversion, XORed with the automatic decision
 * @param mask_source  Source of the blend weight
 * @param stat         Region luminance, computed from the background if absent
 * @return             Inversion decision and luminance factor
 * @throws OverlaySizeError if region does not lie inside the background
 */
BlendReport blend_overlay(
    cv::Mat& background,
    const cv::Mat& overlay,
    const cv::Rect& region,
    double opacity,
    bool invert,
    MaskSource mask_source = MaskSource::ColorMagnitude,
    std::optional<RegionStat> stat = std::nullopt
);

/**
 * Straight alpha compositing of a BGRA 8-bit layer onto the background
 *
 * The layer must have the same size as the background.
 */
void composite_layer(cv::Mat& background, const cv::Mat& layer);

}  // namespace wit
