/**
 * @file    region_stats.hpp
 * @brief   Luminance statistics over image regions
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

namespace wit {

/**
 * Single-channel luminance statistics over a rectangle
 */
struct RegionStat {
    double mean = 0.0;      // Arithmetic mean intensity
    double stddev = 0.0;    // Population standard deviation
};

/**
 * Maximum representable channel value for a buffer depth
 *
 * @throws std::invalid_argument for depths other than CV_8U and CV_16U
 */
[[nodiscard]] double max_intensity(int depth);

/**
 * Convert an image to a single-channel luminance plane
 *
 * Accepts 1, 3 (BGR) or 4 (BGRA) channel buffers of depth CV_8U or CV_16U.
 * The result is CV_64F in the source intensity scale (0-255 for 8-bit).
 */
[[nodiscard]] cv::Mat to_luminance(const cv::Mat& image);

/**
 * Mean and population standard deviation inside a rectangle
 *
 * The rectangle is clipped to the image; an empty intersection gives {0, 0}.
 * Multi-channel input is converted with to_luminance() first.
 *
 * @param image   Luminance plane or color image
 * @param region  Rectangle in image coordinates
 */
[[nodiscard]] RegionStat region_stats(const cv::Mat& image, const cv::Rect& region);

}  // namespace wit
