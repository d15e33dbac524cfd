/**
 * @file Enhance.cpp
 * @brief Equalization, normalization and histogram reports
 */

#include <PixOps/Enhance/Enhance.h>
#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Constants.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/Histogram.h>
#include <PixOps/Internal/ImagePlane.h>

#include <algorithm>

namespace Pix::Ops::Enhance {

namespace {

struct SampleRange {
    double minVal = 0.0;
    double maxVal = 0.0;

    // Division by (max - min) is unsafe
    bool Degenerate() const { return maxVal <= 0.0 || maxVal == minVal; }
};

SampleRange FindRange(const PImage& image) {
    const size_t rowSamples = static_cast<size_t>(image.Width()) * image.Channels();
    uint8_t lo = 255;
    uint8_t hi = 0;
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* row = static_cast<const uint8_t*>(image.RowPtr(y));
        auto [mn, mx] = std::minmax_element(row, row + rowSamples);
        lo = std::min(lo, *mn);
        hi = std::max(hi, *mx);
    }
    return {static_cast<double>(lo), static_cast<double>(hi)};
}

} // anonymous namespace

// =============================================================================
// Histogram Equalization
// =============================================================================

void HistogramEqualize(const PImage& image, PImage& output) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    if (image.Channels() == 1) {
        auto lut = Internal::ComputeEqualizationLUT(Internal::ComputeHistogram(image, 0));
        output = Internal::ApplyLUT(image, lut);
        return;
    }

    PImage ycrcb;
    Color::RgbToYCrCb(image, ycrcb);

    auto lut = Internal::ComputeEqualizationLUT(Internal::ComputeHistogram(ycrcb, 0));
    PImage equalized = Internal::ApplyLUT(ycrcb, lut, 0);

    Color::YCrCbToRgb(equalized, output, image.GetChannelType());
}

// =============================================================================
// Normalization
// =============================================================================

NormalizeRange ParseNormalizeRange(const std::string& name) {
    if (name == "0-1") return NormalizeRange::Unit;
    if (name == "0-255") return NormalizeRange::Byte;
    throw InvalidArgumentException("Unknown normalization range: " + name);
}

void NormalizeImage(const PImage& image, PImage& output, NormalizeRange range) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    if (range == NormalizeRange::Unit) {
        PImage unit;
        NormalizeToUnit(image, unit);

        PImage result(image.Width(), image.Height(), PixelType::UInt8, image.GetChannelType());
        const size_t rowSamples = static_cast<size_t>(image.Width()) * image.Channels();
        for (int32_t y = 0; y < image.Height(); ++y) {
            const float* src = static_cast<const float*>(unit.RowPtr(y));
            uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
            for (size_t i = 0; i < rowSamples; ++i) {
                dst[i] = Internal::SaturateU8(src[i] * U8_MAX);
            }
        }
        output = result;
        return;
    }

    SampleRange r = FindRange(image);
    if (r.Degenerate()) {
        output = image.Clone();
        return;
    }

    // Integer-valued table keeps the mapping exact at min and max
    std::vector<uint8_t> lut(Internal::HISTOGRAM_BINS_8BIT, 0);
    const double span = r.maxVal - r.minVal;
    for (int32_t i = 0; i < Internal::HISTOGRAM_BINS_8BIT; ++i) {
        lut[i] = Internal::SaturateU8((i - r.minVal) * U8_MAX / span);
    }
    output = Internal::ApplyLUT(image, lut);
}

void NormalizeToUnit(const PImage& image, PImage& output) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    SampleRange r = FindRange(image);
    double offset = r.minVal;
    double range = r.maxVal - r.minVal;
    if (r.Degenerate()) {
        // Identity once scaled back by 255
        offset = 0.0;
        range = U8_MAX;
    }

    PImage result(image.Width(), image.Height(), PixelType::Float32, image.GetChannelType());
    const size_t rowSamples = static_cast<size_t>(image.Width()) * image.Channels();
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        float* dst = static_cast<float*>(result.RowPtr(y));
        for (size_t i = 0; i < rowSamples; ++i) {
            dst[i] = static_cast<float>((src[i] - offset) / range);
        }
    }
    output = result;
}

// =============================================================================
// Histograms
// =============================================================================

std::vector<uint32_t> GrayHistogram(const PImage& image) {
    if (!Validate::RequireImageU8(image, "GrayHistogram")) {
        return std::vector<uint32_t>(Internal::HISTOGRAM_BINS_8BIT, 0);
    }
    return Internal::ComputeHistogram(Color::Rgb1ToGray(image), 0).bins;
}

std::vector<std::vector<uint32_t>> ChannelHistograms(const PImage& image) {
    std::vector<std::vector<uint32_t>> histograms;
    if (!Validate::RequireImageU8(image, "ChannelHistograms")) {
        return histograms;
    }
    for (int c = 0; c < image.Channels(); ++c) {
        histograms.push_back(Internal::ComputeHistogram(image, c).bins);
    }
    return histograms;
}

std::vector<double> CumulativeDistribution(const std::vector<uint32_t>& histogram) {
    Internal::Histogram hist;
    hist.bins = histogram;
    hist.totalCount = 0;
    for (uint32_t count : histogram) {
        hist.totalCount += count;
    }
    return Internal::ComputeCumulativeHistogram(hist);
}

} // namespace Pix::Ops::Enhance
