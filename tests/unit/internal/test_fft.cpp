/**
 * @file test_fft.cpp
 * @brief Unit tests for Internal/FFT.h
 */

#include <gtest/gtest.h>
#include <PixOps/Internal/FFT.h>
#include <PixOps/Core/Constants.h>
#include <PixOps/Core/Exception.h>

#include <cmath>
#include <thread>
#include <utility>
#include <vector>

using namespace Pix::Ops::Internal;
using Pix::Ops::TWO_PI;

class FFTTest : public ::testing::Test {
protected:
    // O((wh)^2) reference transform
    std::vector<Complex> NaiveDFT2D(const std::vector<Complex>& x, int32_t w, int32_t h) {
        std::vector<Complex> out(x.size());
        for (int32_t v = 0; v < h; ++v) {
            for (int32_t u = 0; u < w; ++u) {
                Complex sum(0.0, 0.0);
                for (int32_t y = 0; y < h; ++y) {
                    for (int32_t x0 = 0; x0 < w; ++x0) {
                        double angle = -TWO_PI * (static_cast<double>(u * x0) / w +
                                                  static_cast<double>(v * y) / h);
                        sum += x[static_cast<size_t>(y) * w + x0] *
                               Complex(std::cos(angle), std::sin(angle));
                    }
                }
                out[static_cast<size_t>(v) * w + u] = sum;
            }
        }
        return out;
    }

    std::vector<Complex> Signal(size_t n) {
        std::vector<Complex> x(n);
        for (size_t i = 0; i < n; ++i) {
            x[i] = Complex(std::sin(0.7 * i) + 0.1 * i, std::cos(1.3 * i));
        }
        return x;
    }

    void ExpectNear(const std::vector<Complex>& a, const std::vector<Complex>& b,
                    double tol) {
        ASSERT_EQ(a.size(), b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_NEAR(a[i].real(), b[i].real(), tol) << "index " << i;
            EXPECT_NEAR(a[i].imag(), b[i].imag(), tol) << "index " << i;
        }
    }
};

TEST_F(FFTTest, MatchesNaiveDFT) {
    const std::vector<std::pair<int32_t, int32_t>> sizes = {
        {8, 4}, {5, 3}, {7, 6}, {12, 1}, {1, 17}, {1, 1}};
    for (const auto& [w, h] : sizes) {
        auto x = Signal(static_cast<size_t>(w) * h);
        auto expected = NaiveDFT2D(x, w, h);
        FFT2D(x, w, h);
        ExpectNear(x, expected, 1e-8);
    }
}

TEST_F(FFTTest, InverseRestoresSignal) {
    const std::vector<std::pair<int32_t, int32_t>> sizes = {{8, 8}, {9, 5}, {31, 2}};
    for (const auto& [w, h] : sizes) {
        auto x = Signal(static_cast<size_t>(w) * h);
        auto y = x;
        FFT2D(y, w, h, false);
        FFT2D(y, w, h, true);
        ExpectNear(y, x, 1e-9);
    }
}

TEST_F(FFTTest, DCOfConstant2D) {
    const int32_t w = 6, h = 5;
    std::vector<double> plane(static_cast<size_t>(w) * h, 2.0);
    auto spectrum = ForwardFFT2D(plane, w, h);
    EXPECT_NEAR(spectrum[0].real(), 60.0, 1e-9);
    for (size_t i = 1; i < spectrum.size(); ++i) {
        EXPECT_NEAR(std::abs(spectrum[i]), 0.0, 1e-9);
    }
}

TEST_F(FFTTest, RowFrequencyLandsOnXAxis) {
    // cos(2 pi x / w) along rows: energy at u = 1 and u = w - 1 of row 0
    const int32_t w = 8, h = 4;
    std::vector<double> plane(static_cast<size_t>(w) * h);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            plane[static_cast<size_t>(y) * w + x] = std::cos(TWO_PI * x / w);
        }
    }
    auto spectrum = ForwardFFT2D(plane, w, h);
    EXPECT_NEAR(spectrum[1].real(), w * h / 2.0, 1e-9);
    EXPECT_NEAR(spectrum[w - 1].real(), w * h / 2.0, 1e-9);
    EXPECT_NEAR(std::abs(spectrum[static_cast<size_t>(1) * w]), 0.0, 1e-9);
}

TEST_F(FFTTest, Inverse2DRestoresPlane) {
    const int32_t w = 7, h = 4;
    std::vector<double> plane(static_cast<size_t>(w) * h);
    for (size_t i = 0; i < plane.size(); ++i) {
        plane[i] = static_cast<double>((i * 37) % 256);
    }
    auto spectrum = ForwardFFT2D(plane, w, h);
    FFT2D(spectrum, w, h, true);
    for (size_t i = 0; i < plane.size(); ++i) {
        EXPECT_NEAR(spectrum[i].real(), plane[i], 1e-8);
        EXPECT_NEAR(spectrum[i].imag(), 0.0, 1e-8);
    }
}

TEST_F(FFTTest, FFT2DSizeMismatchThrows) {
    std::vector<Complex> data(10);
    EXPECT_THROW(FFT2D(data, 3, 3), Pix::Ops::InvalidArgumentException);
    EXPECT_THROW(FFT2D(data, 0, 10), Pix::Ops::InvalidArgumentException);
}

TEST_F(FFTTest, ConcurrentTransforms) {
    const int32_t w = 24, h = 18;
    auto input = Signal(static_cast<size_t>(w) * h);
    auto expected = input;
    FFT2D(expected, w, h);

    std::vector<std::vector<Complex>> results(4, input);
    std::vector<std::thread> threads;
    for (auto& r : results) {
        threads.emplace_back([&r, w, h]() {
            for (int i = 0; i < 10; ++i) {
                auto copy = r;
                FFT2D(copy, w, h);
                FFT2D(copy, w, h, true);
            }
            FFT2D(r, w, h);
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        ExpectNear(r, expected, 1e-9);
    }
}

TEST_F(FFTTest, ShiftMovesDCToCenter) {
    const std::vector<std::pair<int32_t, int32_t>> sizes = {{4, 4}, {5, 3}};
    for (const auto& [w, h] : sizes) {
        std::vector<Complex> data(static_cast<size_t>(w) * h, Complex(0.0, 0.0));
        data[0] = Complex(1.0, 0.0);
        auto shifted = FFTShift(data, w, h);
        EXPECT_DOUBLE_EQ(shifted[static_cast<size_t>(h / 2) * w + w / 2].real(), 1.0);
    }
}

TEST_F(FFTTest, IFFTShiftInvertsShift) {
    const std::vector<std::pair<int32_t, int32_t>> sizes = {{4, 6}, {5, 3}, {1, 7}};
    for (const auto& [w, h] : sizes) {
        auto data = Signal(static_cast<size_t>(w) * h);
        auto back = IFFTShift(FFTShift(data, w, h), w, h);
        EXPECT_EQ(back, data);
    }
}
