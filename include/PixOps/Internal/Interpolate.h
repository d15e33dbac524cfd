#pragma once

/**
 * @file Interpolate.h
 * @brief Bilinear sampling and resampling of planes
 *
 * Used by:
 * - Hybrid image synthesis (size alignment of the second input)
 */

#include <PixOps/Core/PImage.h>

#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/**
 * @brief Bilinear sample at (x, y), coordinates clamped to the plane
 */
double InterpolateBilinear(const double* data, int32_t width, int32_t height,
                           double x, double y);

/**
 * @brief Resize a plane with bilinear interpolation
 *
 * Pixel centers are aligned: destination pixel d samples the source at
 * (d + 0.5) * srcSize / dstSize - 0.5.
 */
std::vector<double> ResizeBilinear(const std::vector<double>& src,
                                   int32_t srcWidth, int32_t srcHeight,
                                   int32_t dstWidth, int32_t dstHeight);

/**
 * @brief Resize every channel of a UInt8 image
 * @return New image, or a clone when the size already matches
 */
PImage ScaleImage(const PImage& image, int32_t dstWidth, int32_t dstHeight);

} // namespace Pix::Ops::Internal
