/**
 * @file    geometry.cpp
 * @brief   Overlay rectangle calculation
 * @license MIT
 */

#include "core/geometry.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace wit {

namespace {

// Margin in whole pixels. Truncating the margin before the subtraction keeps
// right/bottom anchors symmetric with left/top ones (0.05 * 800 is 40 on
// both sides, never 39 through rounding noise).
int margin(double padding, int dimension) {
    return static_cast<int>(padding * static_cast<double>(dimension));
}

}  // anonymous namespace

cv::Rect rectangle_for_position(
    Position position,
    const cv::Size& background_size,
    const cv::Size& overlay_size,
    double padding)
{
    const int bg_w = background_size.width;
    const int bg_h = background_size.height;
    const int w = overlay_size.width;
    const int h = overlay_size.height;

    const int mx = margin(padding, bg_w);
    const int my = margin(padding, bg_h);

    const int left   = mx;
    const int right  = bg_w - w - mx;
    const int top    = my;
    const int bottom = bg_h - h - my;
    const int center_x = (bg_w - w) / 2;
    const int center_y = (bg_h - h) / 2;

    switch (position) {
        case Position::TopLeft:      return {left, top, w, h};
        case Position::TopRight:     return {right, top, w, h};
        case Position::BottomLeft:   return {left, bottom, w, h};
        case Position::BottomRight:  return {right, bottom, w, h};
        case Position::BottomCenter: return {center_x, bottom, w, h};
        case Position::Center:       return {center_x, center_y, w, h};
    }
    return {left, top, w, h};
}

bool fits_within(const cv::Rect& rect, const cv::Size& background_size) noexcept {
    return rect.width > 0 && rect.height > 0 &&
           rect.x >= 0 && rect.y >= 0 &&
           rect.x + rect.width <= background_size.width &&
           rect.y + rect.height <= background_size.height;
}

Position parse_position(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    for (Position p : kAllPositions) {
        if (key == to_string(p)) {
            return p;
        }
    }

    std::string choices;
    for (Position p : kAllPositions) {
        if (!choices.empty()) choices += ", ";
        choices += to_string(p);
    }
    throw InvalidPositionError(fmt::format(
        "{} is an invalid position. Valid choices are: {}", name, choices));
}

}  // namespace wit
