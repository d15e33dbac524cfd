#pragma once

/**
 * @file Filter.h
 * @brief Spatial filtering operations (Halcon-style API)
 *
 * API Style: void Func(const PImage& in, PImage& out, params...)
 *
 * - Convolve:    correlation with an arbitrary odd square kernel
 * - MeanImage:   uniform K x K average
 * - GaussFilter: normalized 2D Gaussian of side K
 * - MedianImage: K x K order statistic
 *
 * All filters accept gray or 3-channel UInt8 input and process each
 * channel independently. Border handling is edge replication. Even
 * kernel sizes are forced to the next odd size. Results are clipped
 * to [0, 255] and rounded.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/Kernel.h>
#include <PixOps/Core/PImage.h>

#include <cstdint>

namespace Pix::Ops::Filter {

// =============================================================================
// Convolution
// =============================================================================

/**
 * @brief Correlate every channel with a kernel
 *
 * @param image Input image
 * @param output Output image (same size and layout)
 * @param kernel Odd square kernel, applied without flipping
 *
 * @throws InvalidArgumentException if the kernel is malformed
 *
 * @code
 * PImage sharpened;
 * Convolve(image, sharpened, Kernel::FromRows({{0, -1, 0}, {-1, 5, -1}, {0, -1, 0}}));
 * @endcode
 */
PIXOPS_API void Convolve(const PImage& image, PImage& output, const Kernel& kernel);

// =============================================================================
// Smoothing Filters
// =============================================================================

/**
 * @brief Apply mean (box) filter
 *
 * @param size Kernel side (>= 1, forced odd)
 */
PIXOPS_API void MeanImage(const PImage& image, PImage& output, int32_t size);

/**
 * @brief Apply Gaussian filter with explicit kernel side
 *
 * @param size Kernel side (>= 1, forced odd)
 * @param sigma Standard deviation (> 0)
 *
 * @code
 * PImage smooth;
 * GaussFilter(image, smooth, 5, 1.0);
 * @endcode
 */
PIXOPS_API void GaussFilter(const PImage& image, PImage& output, int32_t size, double sigma);

/**
 * @brief Apply median filter with square window
 *
 * @param size Window side (>= 1, forced odd)
 */
PIXOPS_API void MedianImage(const PImage& image, PImage& output, int32_t size);

} // namespace Pix::Ops::Filter
