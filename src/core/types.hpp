/**
 * @file    types.hpp
 * @brief   Shared type definitions for Web Image Tool
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wit {

// Version info
inline constexpr const char* kVersion = "0.3.0";

// Result type for operations
enum class [[nodiscard]] ResultCode {
    Success,
    FileNotFound,
    InvalidFormat,
    ProcessingFailed,
    SaveFailed,
    OutputExists,
    Skipped
};

// Convert result code to string
[[nodiscard]] constexpr const char* to_string(ResultCode code) noexcept {
    switch (code) {
        case ResultCode::Success:          return "Success";
        case ResultCode::FileNotFound:     return "File not found";
        case ResultCode::InvalidFormat:    return "Invalid format";
        case ResultCode::ProcessingFailed: return "Processing failed";
        case ResultCode::SaveFailed:       return "Save failed";
        case ResultCode::OutputExists:     return "Output exists";
        case ResultCode::Skipped:          return "Skipped";
        default:                           return "Unknown";
    }
}

/**
 * Named anchors for an overlay inside a background image.
 *
 * Declaration order is the search order of the placement selector.
 * Center is only ever used when requested explicitly.
 */
enum class Position {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    BottomCenter,
    Center
};

[[nodiscard]] constexpr const char* to_string(Position position) noexcept {
    switch (position) {
        case Position::TopLeft:      return "top-left";
        case Position::TopRight:     return "top-right";
        case Position::BottomLeft:   return "bottom-left";
        case Position::BottomRight:  return "bottom-right";
        case Position::BottomCenter: return "bottom-center";
        case Position::Center:       return "center";
        default:                     return "unknown";
    }
}

// =============================================================================
// Errors
// =============================================================================

// Overlay rectangle does not fit inside the background
class OverlaySizeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Configured font file could not be opened
class FontNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unrecognized position name in configuration
class InvalidPositionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace wit
