/**
 * @file Random.cpp
 * @brief Thread-local generator implementation
 */

#include <PixOps/Platform/Random.h>

#include <chrono>
#include <functional>
#include <thread>
#include <utility>

namespace Pix::Ops::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::high_resolution_clock::now().time_since_epoch()).count();
    uint64_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);

    // Drop any cached normal pair so the sequence restarts cleanly
    unitDist_.reset();
    normalDist_.reset();
}

double Random::Double() {
    return unitDist_(gen_);
}

double Random::Double(double min, double max) {
    if (min > max) {
        std::swap(min, max);
    }
    return min + (max - min) * unitDist_(gen_);
}

double Random::Gaussian() {
    return normalDist_(gen_);
}

double Random::Gaussian(double mean, double stddev) {
    return mean + stddev * normalDist_(gen_);
}

} // namespace Pix::Ops::Platform
