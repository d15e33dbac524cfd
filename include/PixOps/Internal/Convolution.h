#pragma once

/**
 * @file Convolution.h
 * @brief 2D correlation on raw row-major planes
 *
 * Kernels are applied without flipping. A kernel of width K is anchored
 * at column (K-1)/2 and a kernel of height K at row (K-1)/2, so odd
 * kernels are centered and a 2x2 kernel covers (x..x+1, y..y+1).
 *
 * Border handling:
 * - Replicate: out-of-range samples take the nearest edge value
 * - Constant:  out-of-range samples take borderValue
 */

#include <PixOps/Core/Types.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/**
 * @brief Map an out-of-range coordinate for Replicate border
 */
inline int32_t ClampIndex(int32_t i, int32_t n) {
    return std::max(0, std::min(n - 1, i));
}

/**
 * @brief Direct 2D correlation, O(W*H*Kw*Kh)
 *
 * @param src Source plane (width*height, row-major, tightly packed)
 * @param dst Destination plane (same size, must not alias src)
 * @param kernel Kernel weights (kernelWidth*kernelHeight, row-major)
 */
template<typename SrcT, typename DstT>
void Convolve2D(const SrcT* src, DstT* dst, int32_t width, int32_t height,
                const double* kernel, int32_t kernelWidth, int32_t kernelHeight,
                BorderMode border = BorderMode::Replicate, double borderValue = 0.0);

/**
 * @brief Pad a plane by the kernel footprint
 *
 * Output is (width + kernelWidth - 1) x (height + kernelHeight - 1) with
 * the source placed at ((kernelWidth-1)/2, (kernelHeight-1)/2).
 */
template<typename SrcT>
std::vector<double> PadPlane(const SrcT* src, int32_t width, int32_t height,
                             int32_t kernelWidth, int32_t kernelHeight,
                             BorderMode border, double borderValue = 0.0);

} // namespace Pix::Ops::Internal
