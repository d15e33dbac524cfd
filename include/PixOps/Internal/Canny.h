#pragma once

/**
 * @file Canny.h
 * @brief Canny edge detection on 8-bit planes
 *
 * Pipeline:
 * 1. 3x3 Sobel gradients (Replicate border, no pre-smoothing)
 * 2. L1 magnitude |gx| + |gy|
 * 3. Non-maximum suppression along the quantized gradient direction
 * 4. Hysteresis thresholding
 *
 * Thresholds are on the L1 Sobel scale, so 100/200 give the familiar
 * result on natural 8-bit images.
 *
 * Reference:
 * - Canny, "A Computational Approach to Edge Detection" (1986)
 */

#include <PixOps/Core/PImage.h>

#include <cstdint>

namespace Pix::Ops::Internal {

/**
 * @brief Parameters for Canny edge detection
 */
struct CannyParams {
    double lowThreshold = 100.0;    ///< Weak edge threshold
    double highThreshold = 200.0;   ///< Strong edge threshold

    /**
     * @brief Create params with specified thresholds
     */
    static CannyParams WithThresholds(double low, double high) {
        CannyParams p;
        p.lowThreshold = low;
        p.highThreshold = high;
        return p;
    }
};

/**
 * @brief Compute Sobel gradients and L1 magnitude
 *
 * @param src Source plane (width*height)
 * @param magnitude Output |gx| + |gy|
 * @param gx Output X gradient
 * @param gy Output Y gradient
 */
void CannyGradient(const uint8_t* src, float* magnitude, float* gx, float* gy,
                   int32_t width, int32_t height);

/**
 * @brief Run the full pipeline on a tightly packed plane
 *
 * @param output Binary edge map (255 = edge), width*height
 */
void DetectEdgesCanny(const uint8_t* src, uint8_t* output,
                      int32_t width, int32_t height,
                      const CannyParams& params);

/**
 * @brief Detect edges and return a binary edge image
 *
 * @param image Input UInt8 grayscale image
 * @return Binary edge image (255 = edge, 0 = non-edge), same size
 * @throws InvalidArgumentException if thresholds are negative or not finite
 */
PImage DetectEdgesCannyImage(const PImage& image, const CannyParams& params = CannyParams());

} // namespace Pix::Ops::Internal
