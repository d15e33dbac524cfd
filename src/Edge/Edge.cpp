/**
 * @file Edge.cpp
 * @brief Gradient and hysteresis edge detection
 */

#include <PixOps/Edge/Edge.h>
#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/Canny.h>
#include <PixOps/Internal/Gradient.h>
#include <PixOps/Internal/ImagePlane.h>

#include <cmath>
#include <vector>

namespace Pix::Ops::Edge {

namespace {

Internal::GradientOperator ToInternal(EdgeOperator op) {
    switch (op) {
        case EdgeOperator::Prewitt: return Internal::GradientOperator::Prewitt;
        case EdgeOperator::Roberts: return Internal::GradientOperator::Roberts;
        case EdgeOperator::Sobel:
        default:                    return Internal::GradientOperator::Sobel;
    }
}

} // anonymous namespace

EdgeOperator ParseEdgeOperator(const std::string& name) {
    if (name == "sobel") return EdgeOperator::Sobel;
    if (name == "prewitt") return EdgeOperator::Prewitt;
    if (name == "roberts") return EdgeOperator::Roberts;
    throw InvalidArgumentException("Unknown edge operator: " + name);
}

EdgeResult DetectEdges(const PImage& image, EdgeOperator op) {
    PIXOPS_REQUIRE_IMAGE_U8(image);

    PImage gray = Color::Rgb1ToGray(image);
    const int32_t w = gray.Width();
    const int32_t h = gray.Height();
    const size_t size = static_cast<size_t>(w) * h;

    auto plane = Internal::ExtractPlane(gray, 0);
    std::vector<double> gx(size);
    std::vector<double> gy(size);
    Internal::Gradient<double, double>(plane.data(), gx.data(), gy.data(), w, h,
                                       ToInternal(op));

    std::vector<double> magnitude(size);
    for (size_t i = 0; i < size; ++i) {
        magnitude[i] = std::sqrt(gx[i] * gx[i] + gy[i] * gy[i]);
        gx[i] = std::fabs(gx[i]);
        gy[i] = std::fabs(gy[i]);
    }

    Internal::RescaleByMax(magnitude);
    Internal::RescaleByMax(gx);
    Internal::RescaleByMax(gy);

    EdgeResult result;
    result.gradientX = Internal::PlaneToU8(gx, w, h);
    result.gradientY = Internal::PlaneToU8(gy, w, h);
    result.magnitude = Internal::PlaneToU8(magnitude, w, h);
    return result;
}

EdgeResult SobelEdges(const PImage& image) {
    return DetectEdges(image, EdgeOperator::Sobel);
}

EdgeResult PrewittEdges(const PImage& image) {
    return DetectEdges(image, EdgeOperator::Prewitt);
}

EdgeResult RobertsEdges(const PImage& image) {
    return DetectEdges(image, EdgeOperator::Roberts);
}

void CannyEdges(const PImage& image, PImage& edges,
                double lowThreshold, double highThreshold) {
    // Thresholds are checked even for an empty image
    edges = Internal::DetectEdgesCannyImage(
        Color::Rgb1ToGray(image),
        Internal::CannyParams::WithThresholds(lowThreshold, highThreshold));
}

} // namespace Pix::Ops::Edge
