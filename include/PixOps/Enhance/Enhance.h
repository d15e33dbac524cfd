#pragma once

/**
 * @file Enhance.h
 * @brief Histogram equalization, range normalization and histograms
 *
 * API Style: void Func(const PImage& in, PImage& out, params...)
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Pix::Ops::Enhance {

// =============================================================================
// Histogram Equalization
// =============================================================================

/**
 * @brief Global histogram equalization
 *
 * Gray input is remapped through lut[i] = round(255 * CDF(i)).
 * 3-channel input is converted to YCrCb, only the luma channel is
 * equalized, and the result is converted back to the input layout.
 */
PIXOPS_API void HistogramEqualize(const PImage& image, PImage& output);

// =============================================================================
// Normalization
// =============================================================================

enum class NormalizeRange {
    Unit,   ///< "0-1": [min, max] -> [0, 1], stored x255 in UInt8 output
    Byte    ///< "0-255": [min, max] -> [0, 255]
};

/**
 * @brief Parse "0-1" or "0-255"
 * @throws InvalidArgumentException for any other string
 */
PIXOPS_API NormalizeRange ParseNormalizeRange(const std::string& name);

/**
 * @brief Linear min-max normalization to UInt8
 *
 * min and max are taken over all channels. When max <= 0 or
 * max == min the output is an unchanged copy.
 */
PIXOPS_API void NormalizeImage(const PImage& image, PImage& output,
                               NormalizeRange range = NormalizeRange::Unit);

/**
 * @brief Min-max normalization to a Float32 image in [0, 1]
 *
 * Same layout as the input. In the degenerate case (max <= 0 or
 * max == min) each sample is divided by 255, which keeps the UInt8
 * view of the result equal to the input.
 */
PIXOPS_API void NormalizeToUnit(const PImage& image, PImage& output);

// =============================================================================
// Histograms
// =============================================================================

/**
 * @brief 256-bin histogram of the gray version of the image
 */
PIXOPS_API std::vector<uint32_t> GrayHistogram(const PImage& image);

/**
 * @brief One 256-bin histogram per channel, in storage order
 */
PIXOPS_API std::vector<std::vector<uint32_t>> ChannelHistograms(const PImage& image);

/**
 * @brief Running sum normalized by the total (all zeros if empty)
 */
PIXOPS_API std::vector<double> CumulativeDistribution(const std::vector<uint32_t>& histogram);

} // namespace Pix::Ops::Enhance
