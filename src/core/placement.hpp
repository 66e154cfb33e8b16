/**
 * @file    placement.hpp
 * @brief   Automatic overlay placement by luminance flatness
 * @license MIT
 *
 * @details
 * The best anchor is the candidate whose region has the lowest luminance
 * standard deviation: a flat region is where an overlay distracts least.
 *
 * Candidates are evaluated in kAutoPositions order and the first minimum
 * wins, so equal scores always resolve to the same anchor.
 */

#pragma once

#include "core/types.hpp"
#include "core/region_stats.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace wit {

/**
 * One evaluated anchor
 */
struct Candidate {
    Position position;
    cv::Rect region;
    RegionStat stat;
    bool fits;           // Rectangle lies inside the background
};

/**
 * Placement decision
 */
struct PlacementResult {
    Position position;                  // Chosen anchor
    cv::Rect region;                    // Rectangle for the overlay
    RegionStat stat;                    // Luminance statistics of that rectangle
    bool forced;                        // Anchor came from configuration
    std::vector<Candidate> candidates;  // Every evaluated anchor, in search order
};

/**
 * Select where to place an overlay
 *
 * Auto mode (forced_position empty): every anchor except Center is scored;
 * anchors whose rectangle does not fit the background are skipped.
 * Forced mode: only the given anchor is evaluated.
 *
 * @param background       Background image (color or luminance)
 * @param overlay_size     Overlay size
 * @param padding          Margin as a fraction of background dimensions
 * @param forced_position  Explicit anchor, or nullopt for automatic search
 * @return                 Chosen position, rectangle and statistics
 * @throws OverlaySizeError if no candidate rectangle fits the background
 */
[[nodiscard]] PlacementResult select_position(
    const cv::Mat& background,
    const cv::Size& overlay_size,
    double padding,
    std::optional<Position> forced_position = std::nullopt
);

}  // namespace wit
