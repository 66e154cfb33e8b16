/**
 * @file    resize.hpp
 * @brief   Output size calculation and resampling
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>
#include <optional>

namespace wit {

/**
 * Requested output dimensions
 *
 * Precedence: scale, then width/height, then longest, then shortest.
 * Width and height together fit the image inside that box.
 */
struct ResizeOptions {
    std::optional<double> scale;   // Factor of the original size (0.5 = half)
    std::optional<int> width;
    std::optional<int> height;
    std::optional<int> longest;    // Length of the longer edge
    std::optional<int> shortest;   // Length of the shorter edge

    [[nodiscard]] bool empty() const noexcept {
        return !scale && !width && !height && !longest && !shortest;
    }
};

/**
 * Compute output size, preserving aspect ratio
 *
 * @throws std::invalid_argument for non-positive requests
 */
[[nodiscard]] cv::Size calculate_new_size(const cv::Size& original, const ResizeOptions& options);

/**
 * Resample to the given size
 *
 * INTER_AREA when shrinking, INTER_CUBIC when enlarging. Returns the input
 * unchanged when the size already matches.
 */
[[nodiscard]] cv::Mat resize_image(const cv::Mat& image, const cv::Size& size);

}  // namespace wit
