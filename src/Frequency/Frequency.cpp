/**
 * @file Frequency.cpp
 * @brief Ideal frequency-domain filter implementation
 */

#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/FFT.h>
#include <PixOps/Internal/ImagePlane.h>

#include <cmath>

namespace Pix::Ops::Frequency {

using Internal::Complex;

namespace {

// 20 ln(|F| + 1), natural log as in the classic spectrum display
std::vector<double> LogMagnitude(const std::vector<Complex>& spectrum) {
    std::vector<double> out(spectrum.size());
    for (size_t i = 0; i < spectrum.size(); ++i) {
        out[i] = 20.0 * std::log(std::abs(spectrum[i]) + 1.0);
    }
    return out;
}

std::vector<Complex> MaskSpectrum(const std::vector<Complex>& shifted,
                                  const FrequencyMask& mask) {
    std::vector<Complex> masked(shifted.size());
    for (size_t i = 0; i < shifted.size(); ++i) {
        masked[i] = mask.pass[i] ? shifted[i] : Complex(0.0, 0.0);
    }
    return masked;
}

std::vector<Complex> InverseFromCentered(const std::vector<Complex>& centered,
                                         int32_t width, int32_t height) {
    auto spectrum = Internal::IFFTShift(centered, width, height);
    Internal::FFT2D(spectrum, width, height, true);
    return spectrum;
}

} // anonymous namespace

// =============================================================================
// Mask
// =============================================================================

PassMode ParsePassMode(const std::string& name) {
    if (name == "low") return PassMode::LowPass;
    if (name == "high") return PassMode::HighPass;
    throw InvalidArgumentException("Unknown frequency mode: " + name);
}

FrequencyMask BuildFrequencyMask(int32_t width, int32_t height,
                                 double cutoff, PassMode mode) {
    PIXOPS_REQUIRE_FINITE(cutoff);
    PIXOPS_REQUIRE_NON_NEGATIVE(cutoff);
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("BuildFrequencyMask: size must be positive");
    }

    FrequencyMask mask;
    mask.width = width;
    mask.height = height;
    mask.pass.resize(static_cast<size_t>(width) * height);

    const double cx = width / 2;
    const double cy = height / 2;
    for (int32_t y = 0; y < height; ++y) {
        double dy = y - cy;
        for (int32_t x = 0; x < width; ++x) {
            double dx = x - cx;
            bool inside = std::sqrt(dx * dx + dy * dy) <= cutoff;
            bool keep = (mode == PassMode::LowPass) ? inside : !inside;
            mask.pass[static_cast<size_t>(y) * width + x] = keep ? 1 : 0;
        }
    }
    return mask;
}

// =============================================================================
// Filtering
// =============================================================================

std::vector<Complex> ApplyIdealFilter(const std::vector<double>& plane,
                                      const FrequencyMask& mask) {
    if (plane.size() != mask.pass.size()) {
        throw InvalidArgumentException("ApplyIdealFilter: plane and mask sizes differ");
    }

    auto spectrum = Internal::ForwardFFT2D(plane, mask.width, mask.height);
    auto centered = Internal::FFTShift(spectrum, mask.width, mask.height);
    return InverseFromCentered(MaskSpectrum(centered, mask), mask.width, mask.height);
}

FrequencyResult FilterFrequency(const PImage& image, PassMode mode, double cutoff) {
    PIXOPS_REQUIRE_FINITE(cutoff);
    PIXOPS_REQUIRE_NON_NEGATIVE(cutoff);
    PIXOPS_REQUIRE_IMAGE_U8(image);

    PImage gray = Color::Rgb1ToGray(image);
    const int32_t w = gray.Width();
    const int32_t h = gray.Height();

    FrequencyMask mask = BuildFrequencyMask(w, h, cutoff, mode);

    auto plane = Internal::ExtractPlane(gray, 0);
    auto centered = Internal::FFTShift(Internal::ForwardFFT2D(plane, w, h), w, h);
    auto masked = MaskSpectrum(centered, mask);
    auto spatial = InverseFromCentered(masked, w, h);

    std::vector<double> magnitude(spatial.size());
    for (size_t i = 0; i < spatial.size(); ++i) {
        magnitude[i] = std::abs(spatial[i]);
    }
    Internal::RescaleMinMax(magnitude);

    std::vector<double> maskPlane(mask.pass.size());
    for (size_t i = 0; i < mask.pass.size(); ++i) {
        maskPlane[i] = mask.pass[i] ? 255.0 : 0.0;
    }

    FrequencyResult result;
    result.filtered = Internal::PlaneToU8(magnitude, w, h);
    result.spectrum = Internal::PlaneToFloat(LogMagnitude(centered), w, h);
    result.filteredSpectrum = Internal::PlaneToFloat(LogMagnitude(masked), w, h);
    result.mask = Internal::PlaneToU8(maskPlane, w, h);
    return result;
}

void SpectrumToDisplay(const PImage& spectrum, PImage& output) {
    if (!Validate::RequireImageFloatGray(spectrum, "SpectrumToDisplay")) {
        output = PImage();
        return;
    }

    auto plane = Internal::ExtractPlane(spectrum, 0);
    Internal::RescaleMinMax(plane);
    output = Internal::PlaneToU8(plane, spectrum.Width(), spectrum.Height());
}

} // namespace Pix::Ops::Frequency
