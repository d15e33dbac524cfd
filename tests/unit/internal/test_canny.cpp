/**
 * @file test_canny.cpp
 * @brief Unit tests for Canny edge detection (NMS, hysteresis, pipeline)
 */

#include <gtest/gtest.h>
#include <PixOps/Internal/Canny.h>
#include <PixOps/Internal/NonMaxSuppression.h>
#include <PixOps/Core/Exception.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Pix::Ops::Internal;
using Pix::Ops::PImage;
using Pix::Ops::PixelType;
using Pix::Ops::ChannelType;

// ============================================================================
// Test Fixture
// ============================================================================

class CannyTest : public ::testing::Test {
protected:
    // Create a test image with a vertical edge
    PImage CreateVerticalEdgeImage(int32_t width, int32_t height,
                                   int32_t edgeX, uint8_t leftVal = 50,
                                   uint8_t rightVal = 200) {
        PImage img(width, height, PixelType::UInt8);
        for (int32_t y = 0; y < height; ++y) {
            for (int32_t x = 0; x < width; ++x) {
                img.SetAt(x, y, (x < edgeX) ? leftVal : rightVal);
            }
        }
        return img;
    }

    int32_t CountEdgePixels(const PImage& edges) {
        int32_t count = 0;
        for (int32_t y = 0; y < edges.Height(); ++y) {
            for (int32_t x = 0; x < edges.Width(); ++x) {
                if (edges.At(x, y) == 255) ++count;
            }
        }
        return count;
    }
};

// ============================================================================
// Direction / NMS / Hysteresis
// ============================================================================

TEST_F(CannyTest, QuantizeDirection) {
    EXPECT_EQ(QuantizeDirection(1.0f, 0.0f), 0);
    EXPECT_EQ(QuantizeDirection(-1.0f, 0.1f), 0);
    EXPECT_EQ(QuantizeDirection(0.0f, 1.0f), 2);
    EXPECT_EQ(QuantizeDirection(0.1f, -1.0f), 2);
    EXPECT_EQ(QuantizeDirection(1.0f, 1.0f), 1);
    EXPECT_EQ(QuantizeDirection(-1.0f, -1.0f), 1);
    EXPECT_EQ(QuantizeDirection(1.0f, -1.0f), 3);
}

TEST_F(CannyTest, NMSKeepsRidge) {
    const int32_t w = 5, h = 1;
    std::vector<float> mag = {0, 2, 5, 2, 0};
    std::vector<float> gx = {1, 1, 1, 1, 1};
    std::vector<float> gy(5, 0.0f);
    std::vector<float> out(5);

    NMS2DGradientQuantized(mag.data(), gx.data(), gy.data(), out.data(), w, h);

    EXPECT_FLOAT_EQ(out[1], 0.0f);
    EXPECT_FLOAT_EQ(out[2], 5.0f);
    EXPECT_FLOAT_EQ(out[3], 0.0f);
}

TEST_F(CannyTest, NMSPlateauKeepsOneSide) {
    const int32_t w = 4, h = 1;
    std::vector<float> mag = {0, 7, 7, 0};
    std::vector<float> gx(4, 1.0f);
    std::vector<float> gy(4, 0.0f);
    std::vector<float> out(4);

    NMS2DGradientQuantized(mag.data(), gx.data(), gy.data(), out.data(), w, h);

    EXPECT_FLOAT_EQ(out[1], 7.0f);
    EXPECT_FLOAT_EQ(out[2], 0.0f);
}

TEST_F(CannyTest, HysteresisFollowsConnectivity) {
    const int32_t w = 6, h = 1;
    std::vector<float> edges = {0, 150, 250, 150, 0, 150};
    std::vector<uint8_t> out(6);

    HysteresisThreshold(edges.data(), out.data(), w, h, 100.0f, 200.0f);

    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(out[1], 255);
    EXPECT_EQ(out[2], 255);
    EXPECT_EQ(out[3], 255);
    EXPECT_EQ(out[4], 0);
    EXPECT_EQ(out[5], 0);   // weak, not connected to a strong pixel
}

TEST_F(CannyTest, HysteresisDiagonalNeighbor) {
    const int32_t w = 2, h = 2;
    std::vector<float> edges = {250, 0,
                                0, 150};
    std::vector<uint8_t> out(4);

    HysteresisThreshold(edges.data(), out.data(), w, h, 100.0f, 200.0f);

    EXPECT_EQ(out[0], 255);
    EXPECT_EQ(out[3], 255);
}

// ============================================================================
// Pipeline
// ============================================================================

TEST_F(CannyTest, VerticalEdgeIsOnePixelWide) {
    PImage img = CreateVerticalEdgeImage(20, 20, 10);
    PImage edges = DetectEdgesCannyImage(img, CannyParams::WithThresholds(100, 200));

    ASSERT_EQ(edges.Width(), 20);
    ASSERT_EQ(edges.Height(), 20);
    EXPECT_EQ(CountEdgePixels(edges), 20);
    for (int32_t y = 0; y < 20; ++y) {
        EXPECT_EQ(edges.At(9, y), 255) << "row " << y;
    }
}

TEST_F(CannyTest, OutputIsBinary) {
    PImage img = CreateVerticalEdgeImage(16, 12, 5, 10, 240);
    PImage edges = DetectEdgesCannyImage(img);
    for (int32_t y = 0; y < edges.Height(); ++y) {
        for (int32_t x = 0; x < edges.Width(); ++x) {
            uint8_t v = edges.At(x, y);
            EXPECT_TRUE(v == 0 || v == 255);
        }
    }
}

TEST_F(CannyTest, ConstantImageHasNoEdges) {
    PImage img(12, 12);
    img.Fill(128);
    EXPECT_EQ(CountEdgePixels(DetectEdgesCannyImage(img)), 0);
}

TEST_F(CannyTest, HighThresholdsSuppressEdges) {
    // Edge magnitude is 4 * 150 = 600 with the L1 Sobel gradient
    PImage img = CreateVerticalEdgeImage(20, 20, 10);
    EXPECT_EQ(CountEdgePixels(DetectEdgesCannyImage(img, CannyParams::WithThresholds(700, 800))), 0);
    EXPECT_EQ(CountEdgePixels(DetectEdgesCannyImage(img, CannyParams::WithThresholds(500, 590))), 20);
}

TEST_F(CannyTest, SwappedThresholdsAreEquivalent) {
    PImage img = CreateVerticalEdgeImage(20, 20, 7, 30, 220);
    PImage a = DetectEdgesCannyImage(img, CannyParams::WithThresholds(50, 300));
    PImage b = DetectEdgesCannyImage(img, CannyParams::WithThresholds(300, 50));
    for (int32_t y = 0; y < 20; ++y) {
        for (int32_t x = 0; x < 20; ++x) {
            EXPECT_EQ(a.At(x, y), b.At(x, y));
        }
    }
}

TEST_F(CannyTest, InvalidThresholdsThrow) {
    PImage img = CreateVerticalEdgeImage(8, 8, 4);
    EXPECT_THROW(DetectEdgesCannyImage(img, CannyParams::WithThresholds(-1, 10)),
                 Pix::Ops::InvalidArgumentException);
    EXPECT_THROW(DetectEdgesCannyImage(PImage(), CannyParams::WithThresholds(
                     std::numeric_limits<double>::quiet_NaN(), 10)),
                 Pix::Ops::InvalidArgumentException);
}

TEST_F(CannyTest, RequiresGrayscale) {
    PImage rgb(8, 8, PixelType::UInt8, ChannelType::RGB);
    EXPECT_THROW(DetectEdgesCannyImage(rgb), Pix::Ops::UnsupportedException);
}

TEST_F(CannyTest, EmptyImage) {
    EXPECT_TRUE(DetectEdgesCannyImage(PImage()).Empty());
}
