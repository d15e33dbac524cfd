#pragma once

/**
 * @file NonMaxSuppression.h
 * @brief Edge thinning and hysteresis thresholding for gradient maps
 *
 * Used by:
 * - Canny edge detector
 */

#include <cstdint>

namespace Pix::Ops::Internal {

/**
 * @brief Quantize a gradient vector into one of 4 directions
 *
 * @return 0 = horizontal gradient (compare left/right),
 *         1 = diagonal with gx*gy > 0 (compare top-left/bottom-right),
 *         2 = vertical gradient (compare top/bottom),
 *         3 = diagonal with gx*gy < 0 (compare top-right/bottom-left)
 *
 * Image coordinates: y grows downwards. Sector boundaries are at
 * 22.5 and 67.5 degrees.
 */
int32_t QuantizeDirection(float gx, float gy);

/**
 * @brief Non-maximum suppression along the quantized gradient direction
 *
 * A pixel survives when its magnitude is strictly greater than the
 * neighbor on the negative side and not smaller than the one on the
 * positive side, so a plateau yields one pixel instead of two.
 * Neighbors outside the image count as 0.
 *
 * @param magnitude Gradient magnitude (width*height)
 * @param gx X gradient (width*height)
 * @param gy Y gradient (width*height)
 * @param output Thinned magnitude, 0 where suppressed
 */
void NMS2DGradientQuantized(const float* magnitude, const float* gx, const float* gy,
                            float* output, int32_t width, int32_t height);

/**
 * @brief Hysteresis thresholding
 *
 * Values > highThreshold are strong edges. Values > lowThreshold are
 * kept only when 8-connected to a strong edge.
 *
 * @param edges NMS output
 * @param output Binary output (255 = edge, 0 = background)
 */
void HysteresisThreshold(const float* edges, uint8_t* output,
                         int32_t width, int32_t height,
                         float lowThreshold, float highThreshold);

} // namespace Pix::Ops::Internal
