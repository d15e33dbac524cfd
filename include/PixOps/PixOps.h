#pragma once

/**
 * @file PixOps.h
 * @brief Main header file for PixOps library
 *
 * PixOps is an image-processing operation library: convolution, noise
 * injection, smoothing, edge detection, enhancement and ideal
 * frequency-domain filtering on 8-bit images.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <PixOps/PixOpsConfig.h>
#include <PixOps/Core/Export.h>

// Core types and utilities
#include <PixOps/Core/Types.h>
#include <PixOps/Core/Constants.h>
#include <PixOps/Core/Exception.h>

// Core data structures
#include <PixOps/Core/PImage.h>
#include <PixOps/Core/Kernel.h>

// Platform abstraction
#include <PixOps/Platform/Memory.h>
#include <PixOps/Platform/Random.h>

// Feature modules
#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Filter/Filter.h>
#include <PixOps/Noise/Noise.h>
#include <PixOps/Edge/Edge.h>
#include <PixOps/Enhance/Enhance.h>
#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Frequency/Hybrid.h>
#include <PixOps/Operation/Operation.h>
#include <PixOps/Operation/Plot.h>

namespace Pix::Ops {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return PIXOPS_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = PIXOPS_VERSION_MAJOR;
    minor = PIXOPS_VERSION_MINOR;
    patch = PIXOPS_VERSION_PATCH;
}

} // namespace Pix::Ops
