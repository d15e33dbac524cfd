#pragma once

/**
 * @file Constants.h
 * @brief Library-wide constants
 */

#include <cstddef>
#include <cstdint>

namespace Pix::Ops {

/// Row alignment of image buffers (bytes)
constexpr size_t MEMORY_ALIGNMENT = 64;

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

/// Largest 8-bit sample value
constexpr double U8_MAX = 255.0;

/// Below this spread a min-max rescale is skipped
constexpr double RESCALE_EPSILON = 1e-6;

} // namespace Pix::Ops
