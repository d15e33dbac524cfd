/**
 * @file FFT.cpp
 * @brief 2D DFT through FFTW3
 */

#include <PixOps/Internal/FFT.h>
#include <PixOps/Core/Exception.h>

#include <fftw3.h>

#include <memory>
#include <mutex>
#include <type_traits>

namespace Pix::Ops::Internal {

namespace {

// The FFTW planner is not thread-safe, fftw_execute is
std::mutex& PlannerMutex() {
    static std::mutex mutex;
    return mutex;
}

struct PlanDeleter {
    void operator()(fftw_plan plan) const {
        std::lock_guard<std::mutex> lock(PlannerMutex());
        fftw_destroy_plan(plan);
    }
};

using PlanPtr = std::unique_ptr<std::remove_pointer_t<fftw_plan>, PlanDeleter>;

PlanPtr MakePlan(std::vector<Complex>& data, int32_t width, int32_t height, bool inverse) {
    fftw_complex* buffer = reinterpret_cast<fftw_complex*>(data.data());

    std::lock_guard<std::mutex> lock(PlannerMutex());
    // Row-major: n0 = rows, n1 = columns
    fftw_plan plan = fftw_plan_dft_2d(height, width, buffer, buffer,
                                      inverse ? FFTW_BACKWARD : FFTW_FORWARD,
                                      FFTW_ESTIMATE);
    if (plan == nullptr) {
        throw Exception("FFT2D: failed to create FFTW plan");
    }
    return PlanPtr(plan);
}

} // anonymous namespace

void FFT2D(std::vector<Complex>& data, int32_t width, int32_t height, bool inverse) {
    if (width <= 0 || height <= 0 ||
        data.size() != static_cast<size_t>(width) * height) {
        throw InvalidArgumentException("FFT2D: data size does not match width * height");
    }

    PlanPtr plan = MakePlan(data, width, height, inverse);
    fftw_execute(plan.get());

    // FFTW_BACKWARD is unnormalized
    if (inverse) {
        const double scale = 1.0 / (static_cast<double>(width) * height);
        for (auto& v : data) {
            v *= scale;
        }
    }
}

std::vector<Complex> ForwardFFT2D(const std::vector<double>& plane,
                                  int32_t width, int32_t height) {
    std::vector<Complex> spectrum(plane.begin(), plane.end());
    FFT2D(spectrum, width, height, false);
    return spectrum;
}

template<typename T>
std::vector<T> FFTShift(const std::vector<T>& data, int32_t width, int32_t height) {
    std::vector<T> out(data.size());
    const int32_t sx = width / 2;
    const int32_t sy = height / 2;
    for (int32_t y = 0; y < height; ++y) {
        int32_t dy = (y + sy) % height;
        for (int32_t x = 0; x < width; ++x) {
            int32_t dx = (x + sx) % width;
            out[static_cast<size_t>(dy) * width + dx] = data[static_cast<size_t>(y) * width + x];
        }
    }
    return out;
}

template<typename T>
std::vector<T> IFFTShift(const std::vector<T>& data, int32_t width, int32_t height) {
    std::vector<T> out(data.size());
    const int32_t sx = width / 2;
    const int32_t sy = height / 2;
    for (int32_t y = 0; y < height; ++y) {
        int32_t srcY = (y + sy) % height;
        for (int32_t x = 0; x < width; ++x) {
            int32_t srcX = (x + sx) % width;
            out[static_cast<size_t>(y) * width + x] = data[static_cast<size_t>(srcY) * width + srcX];
        }
    }
    return out;
}

// Explicit template instantiations
template std::vector<Complex> FFTShift<Complex>(const std::vector<Complex>&, int32_t, int32_t);
template std::vector<Complex> IFFTShift<Complex>(const std::vector<Complex>&, int32_t, int32_t);

} // namespace Pix::Ops::Internal
