#pragma once

/**
 * @file Hybrid.h
 * @brief Hybrid image synthesis (low frequencies of A + high frequencies of B)
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

namespace Pix::Ops::Frequency {

constexpr double DEFAULT_HYBRID_CUTOFF_LOW = 30.0;
constexpr double DEFAULT_HYBRID_CUTOFF_HIGH = 10.0;

/**
 * @brief Hybrid output, all UInt8 gray with the size of image A
 */
struct PIXOPS_API HybridResult {
    PImage hybrid;          ///< 0.5 * low + 0.5 * high, clipped and rounded
    PImage lowComponent;    ///< low-pass magnitude of A, min-max rescaled
    PImage highComponent;   ///< high-pass magnitude of B, min-max rescaled
};

/**
 * @brief Combine the low-pass of imageA with the high-pass of imageB
 *
 * Both inputs are converted to gray; imageB is resized (bilinear) to
 * the size of imageA. The combination uses the unscaled magnitudes;
 * the rescaled components are for display only.
 *
 * @param cutoffLow Low-pass radius applied to imageA (finite, >= 0)
 * @param cutoffHigh High-pass radius applied to imageB (finite, >= 0)
 * @return Empty images if either input is empty
 */
PIXOPS_API HybridResult MakeHybrid(const PImage& imageA, const PImage& imageB,
                                   double cutoffLow = DEFAULT_HYBRID_CUTOFF_LOW,
                                   double cutoffHigh = DEFAULT_HYBRID_CUTOFF_HIGH);

} // namespace Pix::Ops::Frequency
