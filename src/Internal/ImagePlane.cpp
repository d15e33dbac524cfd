#include <PixOps/Internal/ImagePlane.h>
#include <PixOps/Core/Constants.h>
#include <PixOps/Core/Exception.h>

#include <algorithm>

namespace Pix::Ops::Internal {

std::vector<double> ExtractPlane(const PImage& image, int channel) {
    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const int channels = image.Channels();
    if (channel < 0 || channel >= channels) {
        throw InvalidArgumentException("ExtractPlane: channel out of range");
    }

    std::vector<double> plane(static_cast<size_t>(w) * h);

    if (image.Type() == PixelType::UInt8) {
        for (int32_t y = 0; y < h; ++y) {
            const uint8_t* row = static_cast<const uint8_t*>(image.RowPtr(y));
            double* dst = plane.data() + static_cast<size_t>(y) * w;
            for (int32_t x = 0; x < w; ++x) {
                dst[x] = row[x * channels + channel];
            }
        }
    } else {
        for (int32_t y = 0; y < h; ++y) {
            const float* row = static_cast<const float*>(image.RowPtr(y));
            double* dst = plane.data() + static_cast<size_t>(y) * w;
            for (int32_t x = 0; x < w; ++x) {
                dst[x] = row[x * channels + channel];
            }
        }
    }
    return plane;
}

void StorePlaneU8(const std::vector<double>& plane, PImage& image, int channel) {
    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const int channels = image.Channels();
    if (image.Type() != PixelType::UInt8) {
        throw UnsupportedException("StorePlaneU8 requires a UInt8 image");
    }
    if (plane.size() != static_cast<size_t>(w) * h) {
        throw InvalidArgumentException("StorePlaneU8: plane size mismatch");
    }

    for (int32_t y = 0; y < h; ++y) {
        uint8_t* row = static_cast<uint8_t*>(image.RowPtr(y));
        const double* src = plane.data() + static_cast<size_t>(y) * w;
        for (int32_t x = 0; x < w; ++x) {
            row[x * channels + channel] = SaturateU8(src[x]);
        }
    }
}

PImage PlaneToU8(const std::vector<double>& plane, int32_t width, int32_t height) {
    PImage out(width, height, PixelType::UInt8, ChannelType::Gray);
    StorePlaneU8(plane, out, 0);
    return out;
}

PImage PlaneToFloat(const std::vector<double>& plane, int32_t width, int32_t height) {
    if (plane.size() != static_cast<size_t>(width) * height) {
        throw InvalidArgumentException("PlaneToFloat: plane size mismatch");
    }
    PImage out(width, height, PixelType::Float32, ChannelType::Gray);
    for (int32_t y = 0; y < height; ++y) {
        float* row = static_cast<float*>(out.RowPtr(y));
        const double* src = plane.data() + static_cast<size_t>(y) * width;
        for (int32_t x = 0; x < width; ++x) {
            row[x] = static_cast<float>(src[x]);
        }
    }
    return out;
}

void RescaleByMax(std::vector<double>& plane) {
    if (plane.empty()) return;
    double maxVal = *std::max_element(plane.begin(), plane.end());
    if (!(maxVal > 0.0)) return;

    double scale = U8_MAX / maxVal;
    for (double& v : plane) {
        v *= scale;
    }
}

void RescaleMinMax(std::vector<double>& plane) {
    if (plane.empty()) return;
    auto [minIt, maxIt] = std::minmax_element(plane.begin(), plane.end());
    double minVal = *minIt;
    double range = *maxIt - minVal;
    if (!(range >= RESCALE_EPSILON)) return;

    double scale = U8_MAX / range;
    for (double& v : plane) {
        v = (v - minVal) * scale;
    }
}

} // namespace Pix::Ops::Internal
