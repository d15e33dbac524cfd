#pragma once

/**
 * @file Gradient.h
 * @brief First-order gradient kernels and gradient computation
 *
 * Kernels are applied as correlations through Internal::Convolve2D:
 *
 *   Sobel    X: [-1 0 1; -2 0 2; -1 0 1]   Y: [-1 -2 -1; 0 0 0; 1 2 1]
 *   Prewitt  X: [-1 0 1; -1 0 1; -1 0 1]   Y: [-1 -1 -1; 0 0 0; 1 1 1]
 *   Roberts  X: [1 0; 0 -1]                Y: [0 1; -1 0]
 *
 * 3x3 operators use Replicate border, Roberts uses zero border.
 */

#include <PixOps/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/**
 * @brief Gradient operator type
 */
enum class GradientOperator {
    Sobel,      ///< 3x3, weighted center row/column
    Prewitt,    ///< 3x3, uniform weights
    Roberts     ///< 2x2 cross, anchored at the top-left cell
};

/**
 * @brief Kernel pair for one operator
 */
struct GradientKernels {
    int32_t size = 0;                 ///< Kernel side (3 or 2)
    std::vector<double> kernelX;      ///< size*size, row-major
    std::vector<double> kernelY;      ///< size*size, row-major
    BorderMode border = BorderMode::Replicate;
};

/**
 * @brief Get kernel pair and border policy for an operator
 */
GradientKernels GetGradientKernels(GradientOperator op);

/**
 * @brief Compute signed X and Y gradients of a plane
 *
 * @param src Source plane (width*height)
 * @param gx Output X gradient (width*height)
 * @param gy Output Y gradient (width*height)
 */
template<typename SrcT, typename DstT>
void Gradient(const SrcT* src, DstT* gx, DstT* gy,
              int32_t width, int32_t height,
              GradientOperator op);

} // namespace Pix::Ops::Internal
