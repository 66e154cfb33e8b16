/**
 * @file    byte_format.hpp
 * @brief   Human-readable byte sizes for the processing summary
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <fmt/format.h>

namespace wit {

/**
 * Format a byte count with binary prefixes ("1.50 KiB")
 *
 * Values below 1024 are printed as whole bytes; negative counts (a size
 * increase shown as a reduction) keep their sign.
 */
inline std::string format_bytes(std::int64_t bytes, int decimals = 2) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    const bool negative = bytes < 0;
    double value = negative ? -static_cast<double>(bytes) : static_cast<double>(bytes);

    if (value < 1024.0) {
        return fmt::format("{}{} B", negative ? "-" : "", static_cast<std::int64_t>(value));
    }

    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{}{:.{}f} {}", negative ? "-" : "", value, decimals, kUnits[unit]);
}

}  // namespace wit
