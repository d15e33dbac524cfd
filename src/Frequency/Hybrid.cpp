/**
 * @file Hybrid.cpp
 * @brief Hybrid image synthesis
 */

#include <PixOps/Frequency/Hybrid.h>
#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/ImagePlane.h>
#include <PixOps/Internal/Interpolate.h>

#include <complex>
#include <vector>

namespace Pix::Ops::Frequency {

namespace {

std::vector<double> FilteredMagnitude(const std::vector<double>& plane,
                                      const FrequencyMask& mask) {
    auto spatial = ApplyIdealFilter(plane, mask);
    std::vector<double> magnitude(spatial.size());
    for (size_t i = 0; i < spatial.size(); ++i) {
        magnitude[i] = std::abs(spatial[i]);
    }
    return magnitude;
}

} // anonymous namespace

HybridResult MakeHybrid(const PImage& imageA, const PImage& imageB,
                        double cutoffLow, double cutoffHigh) {
    PIXOPS_REQUIRE_FINITE(cutoffLow);
    PIXOPS_REQUIRE_FINITE(cutoffHigh);
    PIXOPS_REQUIRE_NON_NEGATIVE(cutoffLow);
    PIXOPS_REQUIRE_NON_NEGATIVE(cutoffHigh);
    PIXOPS_REQUIRE_IMAGE_U8(imageA);
    PIXOPS_REQUIRE_IMAGE_U8(imageB);

    PImage grayA = Color::Rgb1ToGray(imageA);
    const int32_t w = grayA.Width();
    const int32_t h = grayA.Height();
    PImage grayB = Internal::ScaleImage(Color::Rgb1ToGray(imageB), w, h);

    auto low = FilteredMagnitude(Internal::ExtractPlane(grayA, 0),
                                 BuildFrequencyMask(w, h, cutoffLow, PassMode::LowPass));
    auto high = FilteredMagnitude(Internal::ExtractPlane(grayB, 0),
                                  BuildFrequencyMask(w, h, cutoffHigh, PassMode::HighPass));

    std::vector<double> combined(low.size());
    for (size_t i = 0; i < low.size(); ++i) {
        combined[i] = 0.5 * low[i] + 0.5 * high[i];
    }

    HybridResult result;
    result.hybrid = Internal::PlaneToU8(combined, w, h);

    // Display copies only, the combination above uses the raw magnitudes
    Internal::RescaleMinMax(low);
    Internal::RescaleMinMax(high);
    result.lowComponent = Internal::PlaneToU8(low, w, h);
    result.highComponent = Internal::PlaneToU8(high, w, h);
    return result;
}

} // namespace Pix::Ops::Frequency
