#pragma once

/**
 * @file ColorConvert.h
 * @brief Grayscale and luma/chroma conversion
 *
 * API Style: void Func(const PImage& in, PImage& out)
 *
 * 3-channel inputs may be tagged RGB or BGR; the tag decides which
 * sample is red. Every function accepts UInt8 only.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <cstdint>

namespace Pix::Ops::Color {

/// BT.601 luma weights
constexpr double LUMA_R = 0.299;
constexpr double LUMA_G = 0.587;
constexpr double LUMA_B = 0.114;

/**
 * @brief Convert to single-channel gray
 *
 * gray = round(0.299 R + 0.587 G + 0.114 B). Gray input is cloned.
 */
PIXOPS_API void Rgb1ToGray(const PImage& image, PImage& output);

/// Convenience overload
PIXOPS_API PImage Rgb1ToGray(const PImage& image);

/**
 * @brief Replicate a gray image into 3 RGB channels
 */
PIXOPS_API void GrayToRgb(const PImage& gray, PImage& output);

/**
 * @brief Convert RGB/BGR to YCrCb (channel order Y, Cr, Cb)
 *
 * ITU-R BT.601 full range, chroma offset 128. The output keeps a
 * 3-channel layout tagged RGB; channel 0 is luma.
 */
PIXOPS_API void RgbToYCrCb(const PImage& image, PImage& output);

/**
 * @brief Convert YCrCb back to a 3-channel image
 *
 * @param layout ChannelType of the result (RGB or BGR)
 */
PIXOPS_API void YCrCbToRgb(const PImage& image, PImage& output,
                           ChannelType layout = ChannelType::RGB);

} // namespace Pix::Ops::Color
