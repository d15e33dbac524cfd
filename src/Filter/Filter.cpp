/**
 * @file Filter.cpp
 * @brief Spatial filtering implementation
 *
 * Wraps Internal::Convolve2D with the image API
 */

#include <PixOps/Filter/Filter.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/Convolution.h>
#include <PixOps/Internal/ImagePlane.h>

#include <algorithm>
#include <string>
#include <vector>

namespace Pix::Ops::Filter {

namespace {

void RequireKernelSize(int32_t size, const char* funcName) {
    if (size < 1) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": kernel size must be >= 1, got " +
                                       std::to_string(size));
    }
}

void ConvolveChannels(const PImage& image, PImage& output, const Kernel& kernel) {
    const int32_t w = image.Width();
    const int32_t h = image.Height();

    PImage result(w, h, PixelType::UInt8, image.GetChannelType());
    std::vector<double> filtered(static_cast<size_t>(w) * h);

    for (int c = 0; c < image.Channels(); ++c) {
        auto plane = Internal::ExtractPlane(image, c);
        Internal::Convolve2D<double, double>(
            plane.data(), filtered.data(), w, h,
            kernel.weights.data(), kernel.size, kernel.size,
            BorderMode::Replicate);
        Internal::StorePlaneU8(filtered, result, c);
    }

    output = result;
}

} // anonymous namespace

// =============================================================================
// Convolution
// =============================================================================

void Convolve(const PImage& image, PImage& output, const Kernel& kernel) {
    kernel.Validate();
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);
    ConvolveChannels(image, output, kernel);
}

// =============================================================================
// Smoothing Filters
// =============================================================================

void MeanImage(const PImage& image, PImage& output, int32_t size) {
    RequireKernelSize(size, "MeanImage");
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);
    ConvolveChannels(image, output, Kernel::Box(size));
}

void GaussFilter(const PImage& image, PImage& output, int32_t size, double sigma) {
    RequireKernelSize(size, "GaussFilter");
    PIXOPS_REQUIRE_FINITE(sigma);
    PIXOPS_REQUIRE_POSITIVE(sigma);
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);
    ConvolveChannels(image, output, Kernel::Gaussian(size, sigma));
}

void MedianImage(const PImage& image, PImage& output, int32_t size) {
    RequireKernelSize(size, "MedianImage");
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    size = MakeOdd(size);
    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const int channels = image.Channels();
    const int32_t half = size / 2;

    PImage result(w, h, PixelType::UInt8, image.GetChannelType());
    std::vector<uint8_t> neighborhood(static_cast<size_t>(size) * size);
    const auto middle = neighborhood.begin() + neighborhood.size() / 2;

    for (int c = 0; c < channels; ++c) {
        for (int32_t y = 0; y < h; ++y) {
            uint8_t* dstRow = static_cast<uint8_t*>(result.RowPtr(y));

            for (int32_t x = 0; x < w; ++x) {
                // Edge-replicated window, size*size is odd
                size_t count = 0;
                for (int32_t ky = -half; ky <= half; ++ky) {
                    int32_t sy = Internal::ClampIndex(y + ky, h);
                    const uint8_t* srcRow = static_cast<const uint8_t*>(image.RowPtr(sy));

                    for (int32_t kx = -half; kx <= half; ++kx) {
                        int32_t sx = Internal::ClampIndex(x + kx, w);
                        neighborhood[count++] = srcRow[sx * channels + c];
                    }
                }

                std::nth_element(neighborhood.begin(), middle, neighborhood.end());
                dstRow[x * channels + c] = *middle;
            }
        }
    }

    output = result;
}

} // namespace Pix::Ops::Filter
