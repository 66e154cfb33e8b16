/**
 * @file    geometry.hpp
 * @brief   Overlay rectangle calculation for named anchor positions
 * @license MIT
 *
 * @details
 * All functions here are pure. A returned rectangle is not clipped; it may
 * extend past the background when the overlay is too large, and callers
 * check containment with fits_within().
 */

#pragma once

#include "core/types.hpp"

#include <opencv2/core.hpp>
#include <array>
#include <string_view>

namespace wit {

// Every anchor, in declaration order
inline constexpr std::array<Position, 6> kAllPositions = {
    Position::TopLeft,
    Position::TopRight,
    Position::BottomLeft,
    Position::BottomRight,
    Position::BottomCenter,
    Position::Center,
};

// Anchors considered by automatic placement (Center is explicit-only)
inline constexpr std::array<Position, 5> kAutoPositions = {
    Position::TopLeft,
    Position::TopRight,
    Position::BottomLeft,
    Position::BottomRight,
    Position::BottomCenter,
};

/**
 * Compute the overlay rectangle for a named anchor
 *
 * Corners sit flush against their edges, inset by
 * trunc(padding * background dimension) on each axis. BottomCenter is
 * centered horizontally and inset from the bottom. Center is centered on
 * both axes with no inset.
 *
 * @param position         Anchor
 * @param background_size  Background image size
 * @param overlay_size     Overlay size (becomes the rectangle size)
 * @param padding          Margin as a fraction of the background dimensions
 * @return                 Rectangle in background pixel coordinates
 */
[[nodiscard]] cv::Rect rectangle_for_position(
    Position position,
    const cv::Size& background_size,
    const cv::Size& overlay_size,
    double padding
);

/**
 * Whether a rectangle lies entirely inside an image of the given size
 */
[[nodiscard]] bool fits_within(const cv::Rect& rect, const cv::Size& background_size) noexcept;

/**
 * Parse a position name
 *
 * Case-insensitive; '-' and '_' are interchangeable, so "top-left",
 * "TOP_LEFT" and "Top_Left" all parse.
 *
 * @throws InvalidPositionError for unknown names
 */
[[nodiscard]] Position parse_position(std::string_view name);

}  // namespace wit
