#pragma once

/**
 * @file FFT.h
 * @brief Discrete Fourier transform on complex planes (FFTW3 backend)
 *
 * This module provides:
 * - 2D DFT of a row-major plane of any size
 * - Quadrant shifts that move the zero frequency to (width/2, height/2)
 *
 * Conventions match the usual unnormalized forward transform:
 *   X[k] = sum_n x[n] exp(-2 pi i k n / N)
 * and the inverse is scaled by 1/(width*height), so
 * Inverse(Forward(x)) == x.
 *
 * Plans are created with FFTW_ESTIMATE for the caller's buffer and
 * destroyed after one execution. Planner calls are serialized, so the
 * functions are safe to call from several threads.
 *
 * Used by:
 * - Frequency module (ideal low/high-pass, hybrid images)
 */

#include <complex>
#include <cstdint>
#include <vector>

namespace Pix::Ops::Internal {

/// Layout-compatible with fftw_complex
using Complex = std::complex<double>;

// =============================================================================
// 2D Transform
// =============================================================================

/**
 * @brief In-place 2D DFT of a row-major width x height plane
 * @param data Samples, transformed in place
 * @param inverse true for the inverse transform (scaled by 1/(width*height))
 * @throws InvalidArgumentException if data.size() != width * height
 */
void FFT2D(std::vector<Complex>& data, int32_t width, int32_t height,
           bool inverse = false);

/**
 * @brief Forward 2D DFT of a real plane
 */
std::vector<Complex> ForwardFFT2D(const std::vector<double>& plane,
                                  int32_t width, int32_t height);

// =============================================================================
// Shifts
// =============================================================================

/**
 * @brief Move the zero frequency from (0, 0) to (width/2, height/2)
 *
 * out[(y + h/2) % h][(x + w/2) % w] = in[y][x]
 */
template<typename T>
std::vector<T> FFTShift(const std::vector<T>& data, int32_t width, int32_t height);

/**
 * @brief Exact inverse of FFTShift (differs from it for odd sizes)
 */
template<typename T>
std::vector<T> IFFTShift(const std::vector<T>& data, int32_t width, int32_t height);

} // namespace Pix::Ops::Internal
