#pragma once

/**
 * @file Noise.h
 * @brief Additive and impulse noise injection
 *
 * Random samples come from the calling thread's Platform::Random
 * generator; call Platform::SetRandomSeed() for reproducible output.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <string>

namespace Pix::Ops::Noise {

// =============================================================================
// Constants
// =============================================================================

constexpr double DEFAULT_GAUSSIAN_MEAN = 0.0;
constexpr double DEFAULT_GAUSSIAN_SIGMA = 25.0;
constexpr double MAX_GAUSSIAN_SIGMA = 50.0;

constexpr double DEFAULT_UNIFORM_LOW = -25.0;
constexpr double DEFAULT_UNIFORM_HIGH = 25.0;

constexpr double DEFAULT_SALT_PEPPER_RATIO = 0.05;
constexpr double MAX_SALT_PEPPER_RATIO = 0.1;
constexpr double DEFAULT_SALT_PEPPER_SPLIT = 0.5;

// =============================================================================
// Noise Parameters
// =============================================================================

enum class NoiseType {
    Gaussian,   ///< N(mean, sigma^2) added to every sample
    Uniform,    ///< U(low, high) added to every sample
    SaltPepper  ///< Pixels forced to 255 or 0
};

/**
 * @brief Tagged noise description
 *
 * Only the fields of the active type are read. The factories clamp
 * sigma to [0, 50], ratio to [0, 0.1] and split to [0, 1].
 */
struct PIXOPS_API NoiseSpec {
    NoiseType type = NoiseType::Gaussian;

    double mean = DEFAULT_GAUSSIAN_MEAN;        ///< Gaussian
    double sigma = DEFAULT_GAUSSIAN_SIGMA;      ///< Gaussian

    double low = DEFAULT_UNIFORM_LOW;           ///< Uniform
    double high = DEFAULT_UNIFORM_HIGH;         ///< Uniform

    double ratio = DEFAULT_SALT_PEPPER_RATIO;   ///< Salt-and-pepper, fraction of pixels hit
    double split = DEFAULT_SALT_PEPPER_SPLIT;   ///< Salt-and-pepper, salt share of the hits

    static NoiseSpec Gaussian(double mean = DEFAULT_GAUSSIAN_MEAN,
                              double sigma = DEFAULT_GAUSSIAN_SIGMA);

    static NoiseSpec Uniform(double low = DEFAULT_UNIFORM_LOW,
                             double high = DEFAULT_UNIFORM_HIGH);

    static NoiseSpec SaltPepper(double ratio = DEFAULT_SALT_PEPPER_RATIO,
                                double split = DEFAULT_SALT_PEPPER_SPLIT);
};

/**
 * @brief Parse "gaussian", "uniform" or "salt_pepper"
 * @throws InvalidArgumentException for any other name
 */
PIXOPS_API NoiseType ParseNoiseType(const std::string& name);

// =============================================================================
// Noise Injection
// =============================================================================

/**
 * @brief Add noise to a gray or 3-channel UInt8 image
 *
 * - Gaussian / Uniform: every sample gets an independent draw, the sum
 *   is clipped to [0, 255] and rounded. Gaussian sigma is clamped to
 *   [0, MAX_GAUSSIAN_SIGMA].
 * - SaltPepper: one draw v in [0, 1) per pixel, shared by its channels.
 *   v < ratio*split sets the pixel to 255, v > 1 - ratio*(1 - split)
 *   sets it to 0. ratio = 0 leaves the image unchanged.
 *
 * @throws InvalidArgumentException on non-finite parameters or
 *         ratio/split outside [0, 1]
 */
PIXOPS_API void AddNoise(const PImage& image, PImage& output, const NoiseSpec& spec);

} // namespace Pix::Ops::Noise
