/**
 * @file ColorConvert.cpp
 * @brief Grayscale and YCrCb conversion
 */

#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/ImagePlane.h>

namespace Pix::Ops::Color {

namespace {

using Internal::SaturateU8;

// Index of the red and blue samples inside a 3-channel pixel
struct ChannelOrder {
    int r;
    int b;
};

ChannelOrder OrderOf(ChannelType type) {
    if (type == ChannelType::BGR) {
        return {2, 0};
    }
    return {0, 2};
}

void RequireThreeChannels(const PImage& image, const char* funcName) {
    if (image.Channels() != 3) {
        throw UnsupportedException(std::string(funcName) + " requires a 3-channel image");
    }
}

} // anonymous namespace

void Rgb1ToGray(const PImage& image, PImage& output) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    if (image.GetChannelType() == ChannelType::Gray) {
        output = image.Clone();
        return;
    }

    const ChannelOrder order = OrderOf(image.GetChannelType());
    const int32_t w = image.Width();

    PImage result(w, image.Height(), PixelType::UInt8, ChannelType::Gray);
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            const uint8_t* px = src + x * 3;
            dst[x] = SaturateU8(LUMA_R * px[order.r] + LUMA_G * px[1] + LUMA_B * px[order.b]);
        }
    }
    output = result;
}

PImage Rgb1ToGray(const PImage& image) {
    PImage gray;
    Rgb1ToGray(image, gray);
    return gray;
}

void GrayToRgb(const PImage& gray, PImage& output) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(gray, output);
    if (gray.Channels() != 1) {
        throw UnsupportedException("GrayToRgb requires a grayscale image");
    }

    const int32_t w = gray.Width();
    PImage result(w, gray.Height(), PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < gray.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(gray.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            dst[x * 3] = dst[x * 3 + 1] = dst[x * 3 + 2] = src[x];
        }
    }
    output = result;
}

void RgbToYCrCb(const PImage& image, PImage& output) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);
    RequireThreeChannels(image, "RgbToYCrCb");

    const ChannelOrder order = OrderOf(image.GetChannelType());
    const int32_t w = image.Width();

    PImage result(w, image.Height(), PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            double r = src[x * 3 + order.r];
            double g = src[x * 3 + 1];
            double b = src[x * 3 + order.b];

            double luma = LUMA_R * r + LUMA_G * g + LUMA_B * b;
            dst[x * 3 + 0] = SaturateU8(luma);
            dst[x * 3 + 1] = SaturateU8(128.0 + (r - luma) * 0.713);
            dst[x * 3 + 2] = SaturateU8(128.0 + (b - luma) * 0.564);
        }
    }
    output = result;
}

void YCrCbToRgb(const PImage& image, PImage& output, ChannelType layout) {
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);
    RequireThreeChannels(image, "YCrCbToRgb");
    if (layout == ChannelType::Gray) {
        throw InvalidArgumentException("YCrCbToRgb: layout must be RGB or BGR");
    }

    const ChannelOrder order = OrderOf(layout);
    const int32_t w = image.Width();

    PImage result(w, image.Height(), PixelType::UInt8, layout);
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        for (int32_t x = 0; x < w; ++x) {
            double luma = src[x * 3 + 0];
            double cr = src[x * 3 + 1] - 128.0;
            double cb = src[x * 3 + 2] - 128.0;

            dst[x * 3 + order.r] = SaturateU8(luma + 1.403 * cr);
            dst[x * 3 + 1]       = SaturateU8(luma - 0.714 * cr - 0.344 * cb);
            dst[x * 3 + order.b] = SaturateU8(luma + 1.773 * cb);
        }
    }
    output = result;
}

} // namespace Pix::Ops::Color
