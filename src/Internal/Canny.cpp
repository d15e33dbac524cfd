/**
 * @file Canny.cpp
 * @brief Canny edge detection implementation
 */

#include <PixOps/Internal/Canny.h>
#include <PixOps/Internal/Gradient.h>
#include <PixOps/Internal/NonMaxSuppression.h>
#include <PixOps/Core/Validate.h>

#include <cmath>
#include <cstring>
#include <utility>
#include <vector>

namespace Pix::Ops::Internal {

// ============================================================================
// Gradient Computation
// ============================================================================

void CannyGradient(const uint8_t* src, float* magnitude, float* gx, float* gy,
                   int32_t width, int32_t height) {
    const size_t size = static_cast<size_t>(width) * height;

    std::vector<float> plane(size);
    for (size_t i = 0; i < size; ++i) {
        plane[i] = static_cast<float>(src[i]);
    }

    Gradient<float, float>(plane.data(), gx, gy, width, height, GradientOperator::Sobel);

    for (size_t i = 0; i < size; ++i) {
        magnitude[i] = std::fabs(gx[i]) + std::fabs(gy[i]);
    }
}

// ============================================================================
// Pipeline
// ============================================================================

void DetectEdgesCanny(const uint8_t* src, uint8_t* output,
                      int32_t width, int32_t height,
                      const CannyParams& params) {
    const size_t size = static_cast<size_t>(width) * height;

    double low = params.lowThreshold;
    double high = params.highThreshold;
    if (low > high) {
        std::swap(low, high);
    }

    std::vector<float> magnitude(size);
    std::vector<float> gx(size);
    std::vector<float> gy(size);
    CannyGradient(src, magnitude.data(), gx.data(), gy.data(), width, height);

    std::vector<float> thinned(size);
    NMS2DGradientQuantized(magnitude.data(), gx.data(), gy.data(),
                           thinned.data(), width, height);

    HysteresisThreshold(thinned.data(), output, width, height,
                        static_cast<float>(low), static_cast<float>(high));
}

PImage DetectEdgesCannyImage(const PImage& image, const CannyParams& params) {
    Validate::RequireFinite(params.lowThreshold, "lowThreshold", "DetectEdgesCanny");
    Validate::RequireFinite(params.highThreshold, "highThreshold", "DetectEdgesCanny");
    Validate::RequireNonNegative(params.lowThreshold, "lowThreshold", "DetectEdgesCanny");
    Validate::RequireNonNegative(params.highThreshold, "highThreshold", "DetectEdgesCanny");

    if (!Validate::RequireImageU8(image, "DetectEdgesCanny")) {
        return PImage();
    }
    if (image.Channels() != 1) {
        throw UnsupportedException("DetectEdgesCanny requires a grayscale image");
    }

    const int32_t w = image.Width();
    const int32_t h = image.Height();

    // Pack rows (image stride is padded)
    std::vector<uint8_t> src(static_cast<size_t>(w) * h);
    for (int32_t y = 0; y < h; ++y) {
        std::memcpy(src.data() + static_cast<size_t>(y) * w, image.RowPtr(y), w);
    }

    std::vector<uint8_t> edges(src.size());
    DetectEdgesCanny(src.data(), edges.data(), w, h, params);

    return PImage::FromData(edges.data(), w, h, PixelType::UInt8, ChannelType::Gray);
}

} // namespace Pix::Ops::Internal
