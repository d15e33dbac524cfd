#pragma once

/**
 * @file Histogram.h
 * @brief 8-bit histogram, cumulative distribution and lookup tables
 *
 * Used by:
 * - Enhance module (equalization, histogram reports)
 * - Operation module (histogram plots)
 */

#include <PixOps/Core/PImage.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/// Bin count for 8-bit images
constexpr int32_t HISTOGRAM_BINS_8BIT = 256;

/**
 * @brief 256-bin histogram of 8-bit samples
 */
struct Histogram {
    std::vector<uint32_t> bins;
    uint64_t totalCount = 0;

    Histogram() : bins(HISTOGRAM_BINS_8BIT, 0) {}

    uint32_t At(int32_t idx) const {
        if (idx < 0 || idx >= static_cast<int32_t>(bins.size())) return 0;
        return bins[idx];
    }

    bool Empty() const { return totalCount == 0; }
};

/**
 * @brief Histogram of one channel of an interleaved 8-bit buffer
 *
 * @param data First row
 * @param stride Row stride in bytes
 * @param channels Samples per pixel
 * @param channel Channel to count
 */
Histogram ComputeHistogram(const uint8_t* data, int32_t width, int32_t height,
                           size_t stride, int channels = 1, int channel = 0);

/**
 * @brief Histogram of one channel of a UInt8 image
 */
Histogram ComputeHistogram(const PImage& image, int channel = 0);

/**
 * @brief Normalized cumulative distribution
 *
 * cdf[i] = sum(bins[0..i]) / sum(bins); all zeros when the histogram
 * is empty.
 */
std::vector<double> ComputeCumulativeHistogram(const Histogram& hist);

/**
 * @brief Equalization table lut[i] = round(255 * cdf[i])
 *
 * Identity table for an empty histogram.
 */
std::vector<uint8_t> ComputeEqualizationLUT(const Histogram& hist);

/**
 * @brief Remap samples of a UInt8 image through a 256-entry table
 *
 * @param channel Channel to remap, or -1 for every channel
 * @return New image, input is not modified
 */
PImage ApplyLUT(const PImage& image, const std::vector<uint8_t>& lut, int channel = -1);

} // namespace Pix::Ops::Internal
