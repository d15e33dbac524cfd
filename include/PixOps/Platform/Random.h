#pragma once

/**
 * @file Random.h
 * @brief Random sample source for noise injection
 *
 * Each thread owns one MT19937-64 generator. Seeding it makes every
 * noise operation on that thread reproducible; otherwise the seed is
 * derived from the clock and the thread id.
 */

#include <PixOps/Core/Export.h>

#include <cstdint>
#include <random>

namespace Pix::Ops::Platform {

class PIXOPS_API Random {
public:
    /// Thread-local instance
    static Random& Instance();

    /// Reseed the current thread's generator
    void SetSeed(uint64_t seed);

    uint64_t GetSeed() const { return seed_; }

    /// Uniform double in [0, 1)
    double Double();

    /// Uniform double in [min, max) (bounds are swapped if reversed)
    double Double(double min, double max);

    /// Normal sample N(0, 1)
    double Gaussian();

    /// Normal sample N(mean, stddev)
    double Gaussian(double mean, double stddev);

    std::mt19937_64& Generator() { return gen_; }

private:
    Random();
    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    std::mt19937_64 gen_;
    uint64_t seed_;

    std::uniform_real_distribution<double> unitDist_{0.0, 1.0};
    std::normal_distribution<double> normalDist_{0.0, 1.0};
};

// =========================================================================
// Convenience Free Functions
// =========================================================================

inline double RandomDouble() {
    return Random::Instance().Double();
}

inline double RandomUniform(double min, double max) {
    return Random::Instance().Double(min, max);
}

inline double RandomGaussian(double mean = 0.0, double stddev = 1.0) {
    return Random::Instance().Gaussian(mean, stddev);
}

inline void SetRandomSeed(uint64_t seed) {
    Random::Instance().SetSeed(seed);
}

} // namespace Pix::Ops::Platform
