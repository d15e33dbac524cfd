/**
 * @file test_convolution.cpp
 * @brief Unit tests for Internal/Convolution.h
 */

#include <gtest/gtest.h>
#include <PixOps/Internal/Convolution.h>

#include <cstdint>
#include <vector>

using namespace Pix::Ops::Internal;
using Pix::Ops::BorderMode;

class ConvolutionTest : public ::testing::Test {
protected:
    std::vector<double> Ramp(int32_t w, int32_t h) {
        std::vector<double> plane(static_cast<size_t>(w) * h);
        for (int32_t y = 0; y < h; ++y) {
            for (int32_t x = 0; x < w; ++x) {
                plane[y * w + x] = x + 10.0 * y;
            }
        }
        return plane;
    }
};

// ============================================================================
// Kernel semantics
// ============================================================================

TEST_F(ConvolutionTest, ZeroKernelGivesZeros) {
    const int32_t w = 6, h = 5;
    auto src = Ramp(w, h);
    std::vector<double> kernel(9, 0.0);
    std::vector<double> dst(src.size(), -1.0);

    Convolve2D<double, double>(src.data(), dst.data(), w, h, kernel.data(), 3, 3);

    for (double v : dst) {
        EXPECT_DOUBLE_EQ(v, 0.0);
    }
}

TEST_F(ConvolutionTest, IdentityKernelCopies) {
    const int32_t w = 7, h = 4;
    auto src = Ramp(w, h);
    std::vector<double> kernel = {0, 0, 0, 0, 1, 0, 0, 0, 0};
    std::vector<double> dst(src.size());

    Convolve2D<double, double>(src.data(), dst.data(), w, h, kernel.data(), 3, 3);

    for (size_t i = 0; i < src.size(); ++i) {
        EXPECT_DOUBLE_EQ(dst[i], src[i]);
    }
}

TEST_F(ConvolutionTest, KernelIsNotFlipped) {
    // Weight on the right neighbor picks src(x + 1)
    const int32_t w = 5, h = 1;
    auto src = Ramp(w, h);
    std::vector<double> kernel = {0, 0, 1};
    std::vector<double> dst(src.size());

    Convolve2D<double, double>(src.data(), dst.data(), w, h, kernel.data(), 3, 1);

    EXPECT_DOUBLE_EQ(dst[0], 1.0);
    EXPECT_DOUBLE_EQ(dst[3], 4.0);
    EXPECT_DOUBLE_EQ(dst[4], 4.0);  // replicated border
}

TEST_F(ConvolutionTest, EvenKernelAnchoredTopLeft) {
    const int32_t w = 4, h = 3;
    auto src = Ramp(w, h);
    std::vector<double> kernel = {0, 0,
                                  0, 1};
    std::vector<double> dst(src.size());

    Convolve2D<double, double>(src.data(), dst.data(), w, h, kernel.data(), 2, 2,
                               BorderMode::Constant, 0.0);

    EXPECT_DOUBLE_EQ(dst[0 * w + 0], src[1 * w + 1]);
    EXPECT_DOUBLE_EQ(dst[1 * w + 2], src[2 * w + 3]);
    EXPECT_DOUBLE_EQ(dst[0 * w + 3], 0.0);
    EXPECT_DOUBLE_EQ(dst[2 * w + 0], 0.0);
}

// ============================================================================
// Border handling
// ============================================================================

TEST_F(ConvolutionTest, ReplicateBorderKeepsConstantImage) {
    const int32_t w = 5, h = 5;
    std::vector<uint8_t> src(static_cast<size_t>(w) * h, 10);
    std::vector<double> kernel(9, 1.0 / 9.0);
    std::vector<double> dst(src.size());

    Convolve2D<uint8_t, double>(src.data(), dst.data(), w, h, kernel.data(), 3, 3);

    for (double v : dst) {
        EXPECT_NEAR(v, 10.0, 1e-12);
    }
}

TEST_F(ConvolutionTest, ConstantBorderUsesBorderValue) {
    const int32_t w = 5, h = 5;
    std::vector<uint8_t> src(static_cast<size_t>(w) * h, 9);
    std::vector<double> kernel(9, 1.0);
    std::vector<double> dst(src.size());

    Convolve2D<uint8_t, double>(src.data(), dst.data(), w, h, kernel.data(), 3, 3,
                                BorderMode::Constant, 0.0);

    EXPECT_DOUBLE_EQ(dst[0], 36.0);          // corner sees 4 pixels
    EXPECT_DOUBLE_EQ(dst[2], 54.0);          // edge sees 6 pixels
    EXPECT_DOUBLE_EQ(dst[2 * w + 2], 81.0);  // interior sees 9 pixels
}

TEST_F(ConvolutionTest, KernelLargerThanImage) {
    const int32_t w = 2, h = 2;
    std::vector<float> src = {1.0f, 2.0f, 3.0f, 4.0f};
    std::vector<double> kernel(25, 1.0 / 25.0);
    std::vector<float> dst(src.size());

    Convolve2D<float, float>(src.data(), dst.data(), w, h, kernel.data(), 5, 5);

    for (float v : dst) {
        EXPECT_GE(v, 1.0f);
        EXPECT_LE(v, 4.0f);
    }
}

TEST_F(ConvolutionTest, PadPlaneSize) {
    const int32_t w = 4, h = 3;
    auto src = Ramp(w, h);
    auto padded = PadPlane(src.data(), w, h, 5, 3, BorderMode::Replicate);
    EXPECT_EQ(padded.size(), static_cast<size_t>(w + 4) * (h + 2));
    // Top-left pad replicates src(0, 0)
    EXPECT_DOUBLE_EQ(padded[0], src[0]);
}

TEST_F(ConvolutionTest, ClampIndex) {
    EXPECT_EQ(ClampIndex(-3, 5), 0);
    EXPECT_EQ(ClampIndex(2, 5), 2);
    EXPECT_EQ(ClampIndex(9, 5), 4);
}
