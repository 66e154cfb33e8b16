/**
 * @file    resize.cpp
 * @brief   Output size calculation and resampling
 * @license MIT
 */

#include "core/resize.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace wit {

namespace {

int scaled(int value, double factor) {
    return std::max(1, static_cast<int>(std::lround(value * factor)));
}

void require_positive(const std::optional<int>& value, const char* name) {
    if (value && *value <= 0) {
        throw std::invalid_argument(fmt::format("{} must be positive, got {}", name, *value));
    }
}

}  // anonymous namespace

cv::Size calculate_new_size(const cv::Size& original, const ResizeOptions& options) {
    if (original.width <= 0 || original.height <= 0) {
        throw std::invalid_argument("Original size must be positive");
    }
    require_positive(options.width, "Width");
    require_positive(options.height, "Height");
    require_positive(options.longest, "Longest edge");
    require_positive(options.shortest, "Shortest edge");

    const int w = original.width;
    const int h = original.height;

    if (options.scale) {
        if (*options.scale <= 0.0) {
            throw std::invalid_argument(fmt::format("Scale must be positive, got {}", *options.scale));
        }
        return {scaled(w, *options.scale), scaled(h, *options.scale)};
    }

    if (options.width && options.height) {
        // Fit inside the box
        const double factor = std::min(static_cast<double>(*options.width) / w,
                                       static_cast<double>(*options.height) / h);
        return {scaled(w, factor), scaled(h, factor)};
    }
    if (options.width) {
        return {*options.width, scaled(h, static_cast<double>(*options.width) / w)};
    }
    if (options.height) {
        return {scaled(w, static_cast<double>(*options.height) / h), *options.height};
    }
    if (options.longest) {
        return (w >= h)
            ? cv::Size(*options.longest, scaled(h, static_cast<double>(*options.longest) / w))
            : cv::Size(scaled(w, static_cast<double>(*options.longest) / h), *options.longest);
    }
    if (options.shortest) {
        return (w <= h)
            ? cv::Size(*options.shortest, scaled(h, static_cast<double>(*options.shortest) / w))
            : cv::Size(scaled(w, static_cast<double>(*options.shortest) / h), *options.shortest);
    }
    return original;
}

cv::Mat resize_image(const cv::Mat& image, const cv::Size& size) {
    if (image.empty()) {
        throw std::invalid_argument("Empty image provided");
    }
    if (image.size() == size) {
        return image;
    }

    const bool enlarging = size.width > image.cols || size.height > image.rows;
    cv::Mat resized;
    cv::resize(image, resized, size, 0, 0, enlarging ? cv::INTER_CUBIC : cv::INTER_AREA);
    return resized;
}

}  // namespace wit
