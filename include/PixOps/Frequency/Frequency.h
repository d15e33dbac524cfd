#pragma once

/**
 * @file Frequency.h
 * @brief Ideal (hard cutoff) frequency-domain filtering
 *
 * Pipeline for one gray plane:
 * 1. 2D DFT, quadrant shift so the zero frequency sits at (w/2, h/2)
 * 2. Multiply by a circular pass mask of radius `cutoff`
 * 3. Inverse shift, inverse DFT, complex magnitude
 * 4. Min-max rescale to [0, 255]
 *
 * Ringing around strong edges is expected from the hard cutoff.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

namespace Pix::Ops::Frequency {

// =============================================================================
// Types
// =============================================================================

enum class PassMode {
    LowPass,    ///< keep distance <= cutoff
    HighPass    ///< keep distance > cutoff
};

/**
 * @brief Parse "low" or "high"
 * @throws InvalidArgumentException for any other string
 */
PIXOPS_API PassMode ParsePassMode(const std::string& name);

/**
 * @brief Circular pass mask over a centered spectrum
 */
struct PIXOPS_API FrequencyMask {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<uint8_t> pass;      ///< 1 = frequency kept, row-major

    bool At(int32_t x, int32_t y) const {
        return pass[static_cast<size_t>(y) * width + x] != 0;
    }
};

/**
 * @brief Build a mask centered at (width/2, height/2)
 *
 * @param cutoff Euclidean radius in frequency pixels (finite, >= 0)
 * @throws InvalidArgumentException on invalid size or cutoff
 */
PIXOPS_API FrequencyMask BuildFrequencyMask(int32_t width, int32_t height,
                                            double cutoff, PassMode mode);

/**
 * @brief Frequency filter output
 */
struct PIXOPS_API FrequencyResult {
    PImage filtered;            ///< UInt8 gray, min-max rescaled magnitude
    PImage spectrum;            ///< Float32, 20 ln(|F| + 1) of the centered spectrum
    PImage filteredSpectrum;    ///< Float32, same after masking
    PImage mask;                ///< UInt8, 255 inside the pass band
};

// =============================================================================
// Filtering
// =============================================================================

/**
 * @brief Masked inverse transform of a real plane (no magnitude, no rescale)
 *
 * Summing the low-pass and high-pass results for one cutoff gives back
 * the input plane up to rounding.
 *
 * @param plane Real samples (mask.width * mask.height)
 */
PIXOPS_API std::vector<std::complex<double>> ApplyIdealFilter(
    const std::vector<double>& plane, const FrequencyMask& mask);

/**
 * @brief Ideal low/high-pass filter of a UInt8 image
 *
 * Color input is converted to gray first. When the filtered magnitude
 * is constant (spread below 1e-6) it is clipped and rounded instead of
 * rescaled, so a cutoff 0 low-pass yields the mean intensity.
 *
 * @code
 * auto result = FilterFrequency(image, PassMode::LowPass, 30.0);
 * result.filtered.SaveToFile("low.png");
 * @endcode
 */
PIXOPS_API FrequencyResult FilterFrequency(const PImage& image, PassMode mode, double cutoff);

/**
 * @brief Min-max rescale a Float32 gray image to UInt8 for display
 */
PIXOPS_API void SpectrumToDisplay(const PImage& spectrum, PImage& output);

} // namespace Pix::Ops::Frequency
