/**
 * @file    placement.cpp
 * @brief   Automatic overlay placement implementation
 * @license MIT
 */

#include "core/placement.hpp"
#include "core/geometry.hpp"

#include <fmt/format.h>

namespace wit {

namespace {

std::string oversize_message(const cv::Size& overlay, const cv::Size& background) {
    return fmt::format("Overlay size of {}x{} is too large for image size {}x{}",
                       overlay.width, overlay.height,
                       background.width, background.height);
}

}  // anonymous namespace

PlacementResult select_position(
    const cv::Mat& background,
    const cv::Size& overlay_size,
    double padding,
    std::optional<Position> forced_position)
{
    if (background.empty()) {
        throw std::invalid_argument("Empty image provided");
    }

    const cv::Size bg_size = background.size();
    const cv::Mat luminance = to_luminance(background);

    PlacementResult result{};
    result.forced = forced_position.has_value();

    // =========================================================================
    // Forced mode: evaluate the requested anchor only
    // =========================================================================
    if (forced_position) {
        const cv::Rect region = rectangle_for_position(*forced_position, bg_size, overlay_size, padding);
        const bool fits = fits_within(region, bg_size);
        if (!fits) {
            throw OverlaySizeError(oversize_message(overlay_size, bg_size));
        }

        const RegionStat stat = region_stats(luminance, region);
        result.position = *forced_position;
        result.region = region;
        result.stat = stat;
        result.candidates.push_back(Candidate{*forced_position, region, stat, fits});
        return result;
    }

    // =========================================================================
    // Auto mode: lowest stddev wins, first one on ties
    // =========================================================================
    if (overlay_size.width > bg_size.width || overlay_size.height > bg_size.height) {
        throw OverlaySizeError(oversize_message(overlay_size, bg_size));
    }

    const Candidate* best = nullptr;
    result.candidates.reserve(kAutoPositions.size());

    for (Position p : kAutoPositions) {
        const cv::Rect region = rectangle_for_position(p, bg_size, overlay_size, padding);
        Candidate c{p, region, RegionStat{}, fits_within(region, bg_size)};
        if (c.fits) {
            c.stat = region_stats(luminance, region);
        }
        result.candidates.push_back(c);
    }

    for (const Candidate& c : result.candidates) {
        if (!c.fits) continue;
        if (best == nullptr || c.stat.stddev < best->stat.stddev) {
            best = &c;
        }
    }

    if (best == nullptr) {
        throw OverlaySizeError(oversize_message(overlay_size, bg_size) +
                               fmt::format(" with padding {:.3f}", padding));
    }

    result.position = best->position;
    result.region = best->region;
    result.stat = best->stat;
    return result;
}

}  // namespace wit
