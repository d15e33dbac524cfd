/**
 * @file Noise.cpp
 * @brief Noise injection implementation
 */

#include <PixOps/Noise/Noise.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Core/Validate.h>
#include <PixOps/Internal/ImagePlane.h>
#include <PixOps/Platform/Random.h>

#include <algorithm>
#include <cstring>

namespace Pix::Ops::Noise {

// =============================================================================
// NoiseSpec
// =============================================================================

NoiseSpec NoiseSpec::Gaussian(double mean, double sigma) {
    NoiseSpec spec;
    spec.type = NoiseType::Gaussian;
    spec.mean = mean;
    spec.sigma = std::clamp(sigma, 0.0, MAX_GAUSSIAN_SIGMA);
    return spec;
}

NoiseSpec NoiseSpec::Uniform(double low, double high) {
    NoiseSpec spec;
    spec.type = NoiseType::Uniform;
    spec.low = low;
    spec.high = high;
    return spec;
}

NoiseSpec NoiseSpec::SaltPepper(double ratio, double split) {
    NoiseSpec spec;
    spec.type = NoiseType::SaltPepper;
    spec.ratio = std::clamp(ratio, 0.0, MAX_SALT_PEPPER_RATIO);
    spec.split = std::clamp(split, 0.0, 1.0);
    return spec;
}

NoiseType ParseNoiseType(const std::string& name) {
    if (name == "gaussian") return NoiseType::Gaussian;
    if (name == "uniform") return NoiseType::Uniform;
    if (name == "salt_pepper") return NoiseType::SaltPepper;
    throw InvalidArgumentException("Unknown noise type: " + name);
}

// =============================================================================
// Noise Injection
// =============================================================================

namespace {

template<typename Draw>
void AddPerSample(const PImage& image, PImage& result, Draw draw) {
    const size_t rowSamples = static_cast<size_t>(image.Width()) * image.Channels();
    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        for (size_t i = 0; i < rowSamples; ++i) {
            dst[i] = Internal::SaturateU8(src[i] + draw());
        }
    }
}

void ApplySaltPepper(const PImage& image, PImage& result, double ratio, double split) {
    const double saltBelow = ratio * split;
    const double pepperAbove = 1.0 - ratio * (1.0 - split);
    const int channels = image.Channels();
    auto& rng = Platform::Random::Instance();

    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(image.RowPtr(y));
        uint8_t* dst = static_cast<uint8_t*>(result.RowPtr(y));
        std::memcpy(dst, src, static_cast<size_t>(image.Width()) * channels);

        for (int32_t x = 0; x < image.Width(); ++x) {
            double v = rng.Double();
            uint8_t* px = dst + x * channels;
            if (v < saltBelow) {
                std::memset(px, 255, channels);
            } else if (v > pepperAbove) {
                std::memset(px, 0, channels);
            }
        }
    }
}

void RequireValidSpec(const NoiseSpec& spec) {
    switch (spec.type) {
        case NoiseType::Gaussian:
            Validate::RequireFinite(spec.mean, "mean", "AddNoise");
            Validate::RequireFinite(spec.sigma, "sigma", "AddNoise");
            break;
        case NoiseType::Uniform:
            Validate::RequireFinite(spec.low, "low", "AddNoise");
            Validate::RequireFinite(spec.high, "high", "AddNoise");
            break;
        case NoiseType::SaltPepper:
            Validate::RequireRange(spec.ratio, 0.0, 1.0, "ratio", "AddNoise");
            Validate::RequireRange(spec.split, 0.0, 1.0, "split", "AddNoise");
            break;
    }
}

} // anonymous namespace

void AddNoise(const PImage& image, PImage& output, const NoiseSpec& spec) {
    RequireValidSpec(spec);
    PIXOPS_REQUIRE_IMAGE_U8_VOID(image, output);

    PImage result(image.Width(), image.Height(), PixelType::UInt8, image.GetChannelType());
    auto& rng = Platform::Random::Instance();

    switch (spec.type) {
        case NoiseType::Gaussian: {
            const double mean = spec.mean;
            // Same clamp as NoiseSpec::Gaussian, for specs filled in field by field
            const double sigma = std::clamp(spec.sigma, 0.0, MAX_GAUSSIAN_SIGMA);
            AddPerSample(image, result, [&]() { return rng.Gaussian(mean, sigma); });
            break;
        }
        case NoiseType::Uniform: {
            const double low = spec.low;
            const double high = spec.high;
            AddPerSample(image, result, [&]() { return rng.Double(low, high); });
            break;
        }
        case NoiseType::SaltPepper:
            ApplySaltPepper(image, result, spec.ratio, spec.split);
            break;
    }

    output = result;
}

} // namespace Pix::Ops::Noise
