/**
 * @file    region_stats.cpp
 * @brief   Luminance statistics implementation
 * @license MIT
 */

#include "core/region_stats.hpp"

#include <opencv2/imgproc.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace wit {

double max_intensity(int depth) {
    switch (depth) {
        case CV_8U:  return 255.0;
        case CV_16U: return 65535.0;
        default:
            throw std::invalid_argument(fmt::format(
                "Unsupported pixel depth {} (expected 8-bit or 16-bit unsigned)", depth));
    }
}

cv::Mat to_luminance(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("Empty image provided");
    }
    // Validates depth
    (void)max_intensity(image.depth());

    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw std::invalid_argument(fmt::format(
                "Unsupported channel count {}", image.channels()));
    }

    cv::Mat luminance;
    gray.convertTo(luminance, CV_64F);
    return luminance;
}

RegionStat region_stats(const cv::Mat& image, const cv::Rect& region) {
    const cv::Rect clipped = region & cv::Rect(0, 0, image.cols, image.rows);
    if (clipped.empty()) {
        return {};
    }

    const cv::Mat plane = (image.channels() == 1) ? image : to_luminance(image);

    // meanStdDev divides by N, not N - 1
    cv::Scalar mean, stddev;
    cv::meanStdDev(plane(clipped), mean, stddev);
    return RegionStat{mean[0], stddev[0]};
}

}  // namespace wit
