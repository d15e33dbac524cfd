#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for PixOps
 */

#include <PixOps/Core/Export.h>

#include <cstdint>

namespace Pix::Ops {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported pixel data types
 *
 * Every operation returns UInt8. Float32 is used for auxiliary
 * visualization data (log-magnitude spectra, [0,1] normalization).
 */
enum class PixelType {
    UInt8,      ///< 8-bit unsigned [0, 255]
    Float32     ///< 32-bit float
};

/**
 * @brief Image channel layouts
 */
enum class ChannelType {
    Gray,       ///< Single channel grayscale
    RGB,        ///< 3 channels, interleaved R,G,B
    BGR         ///< 3 channels, interleaved B,G,R
};

// =============================================================================
// Size Type
// =============================================================================

/**
 * @brief 2D size with integer dimensions
 */
struct PIXOPS_API Size2i {
    int32_t width = 0;
    int32_t height = 0;

    Size2i() = default;
    Size2i(int32_t w, int32_t h) : width(w), height(h) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size2i& other) const { return !(*this == other); }
};

// =============================================================================
// Border Handling
// =============================================================================

/**
 * @brief Border handling for windowed operations
 */
enum class BorderMode {
    Replicate,  ///< aaa|abcd|ddd (edge replication)
    Constant    ///< 000|abcd|000 (constant value, usually 0)
};

} // namespace Pix::Ops
