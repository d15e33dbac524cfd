#pragma once

/**
 * @file ImagePlane.h
 * @brief Conversion between PImage channels and double planes
 *
 * Algorithms in the Internal layer work on tightly packed double
 * planes (width*height, row-major). These helpers move a single
 * channel in and out of a strided PImage and apply the 8-bit
 * quantization rule shared by every operation.
 */

#include <PixOps/Core/PImage.h>

#include <cmath>
#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/**
 * @brief Clip to [0, 255] and round to nearest (NaN maps to 0)
 */
inline uint8_t SaturateU8(double value) {
    if (!(value > 0.0)) return 0;
    if (value >= 255.0) return 255;
    return static_cast<uint8_t>(std::lround(value));
}

/**
 * @brief Copy one channel of a UInt8 or Float32 image into a plane
 */
std::vector<double> ExtractPlane(const PImage& image, int channel);

/**
 * @brief Write a plane into one channel of an existing UInt8 image
 */
void StorePlaneU8(const std::vector<double>& plane, PImage& image, int channel);

/**
 * @brief Build a grayscale UInt8 image from a plane
 */
PImage PlaneToU8(const std::vector<double>& plane, int32_t width, int32_t height);

/**
 * @brief Build a grayscale Float32 image from a plane (no clipping)
 */
PImage PlaneToFloat(const std::vector<double>& plane, int32_t width, int32_t height);

/**
 * @brief Scale so the largest value becomes 255 (v * 255 / max)
 *
 * Left untouched when max <= 0.
 */
void RescaleByMax(std::vector<double>& plane);

/**
 * @brief Min-max rescale to [0, 255]
 *
 * Left untouched when max - min is below RESCALE_EPSILON.
 */
void RescaleMinMax(std::vector<double>& plane);

} // namespace Pix::Ops::Internal
