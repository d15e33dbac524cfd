/**
 * @file Interpolate.cpp
 * @brief Bilinear resampling implementation
 */

#include <PixOps/Internal/Interpolate.h>
#include <PixOps/Internal/ImagePlane.h>
#include <PixOps/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Pix::Ops::Internal {

double InterpolateBilinear(const double* data, int32_t width, int32_t height,
                           double x, double y) {
    x = std::clamp(x, 0.0, static_cast<double>(width - 1));
    y = std::clamp(y, 0.0, static_cast<double>(height - 1));

    int32_t x0 = static_cast<int32_t>(std::floor(x));
    int32_t y0 = static_cast<int32_t>(std::floor(y));
    int32_t x1 = std::min(x0 + 1, width - 1);
    int32_t y1 = std::min(y0 + 1, height - 1);

    double tx = x - x0;
    double ty = y - y0;

    double v00 = data[static_cast<size_t>(y0) * width + x0];
    double v01 = data[static_cast<size_t>(y0) * width + x1];
    double v10 = data[static_cast<size_t>(y1) * width + x0];
    double v11 = data[static_cast<size_t>(y1) * width + x1];

    return (1.0 - ty) * ((1.0 - tx) * v00 + tx * v01) +
           ty * ((1.0 - tx) * v10 + tx * v11);
}

std::vector<double> ResizeBilinear(const std::vector<double>& src,
                                   int32_t srcWidth, int32_t srcHeight,
                                   int32_t dstWidth, int32_t dstHeight) {
    if (srcWidth <= 0 || srcHeight <= 0 || dstWidth <= 0 || dstHeight <= 0) {
        throw InvalidArgumentException("ResizeBilinear: sizes must be positive");
    }
    if (src.size() != static_cast<size_t>(srcWidth) * srcHeight) {
        throw InvalidArgumentException("ResizeBilinear: plane size mismatch");
    }

    std::vector<double> dst(static_cast<size_t>(dstWidth) * dstHeight);
    const double scaleX = static_cast<double>(srcWidth) / dstWidth;
    const double scaleY = static_cast<double>(srcHeight) / dstHeight;

    for (int32_t y = 0; y < dstHeight; ++y) {
        double sy = (y + 0.5) * scaleY - 0.5;
        for (int32_t x = 0; x < dstWidth; ++x) {
            double sx = (x + 0.5) * scaleX - 0.5;
            dst[static_cast<size_t>(y) * dstWidth + x] =
                InterpolateBilinear(src.data(), srcWidth, srcHeight, sx, sy);
        }
    }
    return dst;
}

PImage ScaleImage(const PImage& image, int32_t dstWidth, int32_t dstHeight) {
    if (image.Empty()) {
        return PImage();
    }
    if (image.Type() != PixelType::UInt8) {
        throw UnsupportedException("ScaleImage requires a UInt8 image");
    }
    if (image.Width() == dstWidth && image.Height() == dstHeight) {
        return image.Clone();
    }

    PImage result(dstWidth, dstHeight, PixelType::UInt8, image.GetChannelType());
    for (int c = 0; c < image.Channels(); ++c) {
        auto plane = ExtractPlane(image, c);
        auto scaled = ResizeBilinear(plane, image.Width(), image.Height(),
                                     dstWidth, dstHeight);
        StorePlaneU8(scaled, result, c);
    }
    return result;
}

} // namespace Pix::Ops::Internal
