#pragma once

/**
 * @file Kernel.h
 * @brief Square convolution kernel
 */

#include <PixOps/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Pix::Ops {

/**
 * @brief Force a kernel side to the next odd value (4 -> 5, 5 -> 5)
 */
PIXOPS_API int32_t MakeOdd(int32_t size);

/**
 * @brief Square, odd-sized kernel of floating point weights
 *
 * Weights are stored row-major, `size * size` entries. The kernel is
 * applied as a correlation (no flip), centered at (size/2, size/2).
 */
struct PIXOPS_API Kernel {
    int32_t size = 0;
    std::vector<double> weights;

    Kernel() = default;

    bool Empty() const { return size == 0; }

    double At(int32_t row, int32_t col) const {
        return weights[static_cast<size_t>(row) * size + col];
    }

    /// Sum of all weights
    double Sum() const;

    /**
     * @brief Throw unless the kernel is square, odd and finite
     * @throws InvalidArgumentException
     */
    void Validate() const;

    // =========================================================================
    // Factories (requested sizes are forced odd)
    // =========================================================================

    /// All-zero kernel
    static Kernel Zeros(int32_t size);

    /// Uniform K x K kernel with weight 1/K^2
    static Kernel Box(int32_t size);

    /**
     * @brief Normalized 2D Gaussian
     *
     * w(x, y) = exp(-(x^2 + y^2) / (2 sigma^2)) over offsets from the
     * center cell, divided by the total so the weights sum to 1.
     *
     * @throws InvalidArgumentException if sigma is not finite and > 0
     */
    static Kernel Gaussian(int32_t size, double sigma);

    /**
     * @brief Build from explicit rows (must be square with odd side)
     * @throws InvalidArgumentException on ragged, even or empty input
     */
    static Kernel FromRows(const std::vector<std::vector<double>>& rows);
};

} // namespace Pix::Ops
