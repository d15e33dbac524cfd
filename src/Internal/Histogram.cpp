/**
 * @file Histogram.cpp
 * @brief Histogram computation and lookup tables
 */

#include <PixOps/Internal/Histogram.h>
#include <PixOps/Core/Constants.h>
#include <PixOps/Core/Exception.h>

#include <cmath>

namespace Pix::Ops::Internal {

Histogram ComputeHistogram(const uint8_t* data, int32_t width, int32_t height,
                           size_t stride, int channels, int channel) {
    Histogram hist;
    if (data == nullptr || width <= 0 || height <= 0) {
        return hist;
    }

    for (int32_t y = 0; y < height; ++y) {
        const uint8_t* row = data + static_cast<size_t>(y) * stride;
        for (int32_t x = 0; x < width; ++x) {
            ++hist.bins[row[x * channels + channel]];
        }
    }
    hist.totalCount = static_cast<uint64_t>(width) * height;
    return hist;
}

Histogram ComputeHistogram(const PImage& image, int channel) {
    if (image.Empty()) {
        return Histogram();
    }
    if (image.Type() != PixelType::UInt8) {
        throw UnsupportedException("ComputeHistogram requires a UInt8 image");
    }
    if (channel < 0 || channel >= image.Channels()) {
        throw InvalidArgumentException("ComputeHistogram: channel out of range");
    }

    return ComputeHistogram(static_cast<const uint8_t*>(image.Data()),
                            image.Width(), image.Height(), image.Stride(),
                            image.Channels(), channel);
}

std::vector<double> ComputeCumulativeHistogram(const Histogram& hist) {
    std::vector<double> cdf(hist.bins.size(), 0.0);
    if (hist.Empty()) {
        return cdf;
    }

    uint64_t running = 0;
    const double total = static_cast<double>(hist.totalCount);
    for (size_t i = 0; i < hist.bins.size(); ++i) {
        running += hist.bins[i];
        cdf[i] = static_cast<double>(running) / total;
    }
    return cdf;
}

std::vector<uint8_t> ComputeEqualizationLUT(const Histogram& hist) {
    std::vector<uint8_t> lut(HISTOGRAM_BINS_8BIT);

    if (hist.Empty()) {
        for (int32_t i = 0; i < HISTOGRAM_BINS_8BIT; ++i) {
            lut[i] = static_cast<uint8_t>(i);
        }
        return lut;
    }

    auto cdf = ComputeCumulativeHistogram(hist);
    for (int32_t i = 0; i < HISTOGRAM_BINS_8BIT; ++i) {
        lut[i] = static_cast<uint8_t>(std::lround(U8_MAX * cdf[i]));
    }
    return lut;
}

PImage ApplyLUT(const PImage& image, const std::vector<uint8_t>& lut, int channel) {
    if (image.Empty()) {
        return PImage();
    }
    if (image.Type() != PixelType::UInt8) {
        throw UnsupportedException("ApplyLUT requires a UInt8 image");
    }
    if (lut.size() != static_cast<size_t>(HISTOGRAM_BINS_8BIT)) {
        throw InvalidArgumentException("ApplyLUT: table must have 256 entries");
    }

    const int channels = image.Channels();
    if (channel >= channels) {
        throw InvalidArgumentException("ApplyLUT: channel out of range");
    }

    PImage result = image.Clone();
    const int32_t w = image.Width();
    for (int32_t y = 0; y < image.Height(); ++y) {
        uint8_t* row = static_cast<uint8_t*>(result.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            uint8_t* px = row + x * channels;
            if (channel < 0) {
                for (int c = 0; c < channels; ++c) {
                    px[c] = lut[px[c]];
                }
            } else {
                px[channel] = lut[px[channel]];
            }
        }
    }
    return result;
}

} // namespace Pix::Ops::Internal
