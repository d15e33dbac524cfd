#pragma once

/**
 * @file Edge.h
 * @brief Gradient-based edge detection
 *
 * Gradient detectors (Sobel, Prewitt, Roberts) return three UInt8
 * images. Each is rescaled independently so that its own maximum
 * becomes 255, therefore gradientX/gradientY brightness is not
 * comparable with magnitude. A channel that is zero everywhere stays 0.
 *
 * Color input is converted to gray (BT.601) first.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <string>

namespace Pix::Ops::Edge {

// =============================================================================
// Types
// =============================================================================

enum class EdgeOperator {
    Sobel,      ///< 3x3 weighted, replicated border
    Prewitt,    ///< 3x3 uniform, replicated border
    Roberts     ///< 2x2 cross, zero border
};

/**
 * @brief Gradient detector output, all single-channel UInt8
 */
struct PIXOPS_API EdgeResult {
    PImage gradientX;   ///< |gx| scaled by 255 / max|gx|
    PImage gradientY;   ///< |gy| scaled by 255 / max|gy|
    PImage magnitude;   ///< sqrt(gx^2 + gy^2) scaled by 255 / max
};

/**
 * @brief Parse "sobel", "prewitt" or "roberts"
 * @throws InvalidArgumentException for any other name
 */
PIXOPS_API EdgeOperator ParseEdgeOperator(const std::string& name);

// =============================================================================
// Gradient Detectors
// =============================================================================

/**
 * @brief Run a gradient detector
 * @return Empty images when the input is empty
 */
PIXOPS_API EdgeResult DetectEdges(const PImage& image, EdgeOperator op);

PIXOPS_API EdgeResult SobelEdges(const PImage& image);
PIXOPS_API EdgeResult PrewittEdges(const PImage& image);
PIXOPS_API EdgeResult RobertsEdges(const PImage& image);

// =============================================================================
// Hysteresis Detector
// =============================================================================

/**
 * @brief Canny edge map (255 = edge)
 *
 * @param lowThreshold Weak edge threshold (finite, >= 0)
 * @param highThreshold Strong edge threshold (finite, >= 0), swapped
 *        with lowThreshold if smaller
 *
 * @code
 * PImage edges;
 * CannyEdges(image, edges, 100, 200);
 * @endcode
 */
PIXOPS_API void CannyEdges(const PImage& image, PImage& edges,
                           double lowThreshold = 100.0, double highThreshold = 200.0);

} // namespace Pix::Ops::Edge
