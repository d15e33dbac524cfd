/**
 * @file test_enhance.cpp
 * @brief Unit tests for Enhance module
 */

#include <gtest/gtest.h>
#include <PixOps/Enhance/Enhance.h>
#include <PixOps/Core/Exception.h>

#include <cstdint>
#include <numeric>
#include <vector>

using namespace Pix::Ops;
using namespace Pix::Ops::Enhance;

class EnhanceTest : public ::testing::Test {
protected:
    PImage MakeGray(const std::vector<uint8_t>& values, int32_t w, int32_t h) {
        return PImage::FromData(values.data(), w, h);
    }

    // 50 .. 150 horizontal ramp
    PImage MakeLowContrast(int32_t w, int32_t h) {
        PImage img(w, h);
        for (int32_t y = 0; y < h; ++y) {
            for (int32_t x = 0; x < w; ++x) {
                img.SetAt(x, y, static_cast<uint8_t>(50 + 100 * x / (w - 1)));
            }
        }
        return img;
    }

    void ExpectEqualImages(const PImage& a, const PImage& b) {
        ASSERT_EQ(a.Width(), b.Width());
        ASSERT_EQ(a.Height(), b.Height());
        ASSERT_EQ(a.Channels(), b.Channels());
        const size_t rowSamples = static_cast<size_t>(a.Width()) * a.Channels();
        for (int32_t y = 0; y < a.Height(); ++y) {
            const uint8_t* ra = static_cast<const uint8_t*>(a.RowPtr(y));
            const uint8_t* rb = static_cast<const uint8_t*>(b.RowPtr(y));
            for (size_t i = 0; i < rowSamples; ++i) {
                EXPECT_EQ(ra[i], rb[i]);
            }
        }
    }
};

// ============================================================================
// Histogram equalization
// ============================================================================

TEST_F(EnhanceTest, EqualizeTwoLevels) {
    PImage img = MakeGray({50, 50, 200, 200}, 2, 2);
    PImage out;
    HistogramEqualize(img, out);
    EXPECT_EQ(out.At(0, 0), 128);
    EXPECT_EQ(out.At(0, 1), 255);
}

TEST_F(EnhanceTest, EqualizeIsMonotonic) {
    PImage img = MakeLowContrast(32, 4);
    PImage out;
    HistogramEqualize(img, out);
    for (int32_t x = 1; x < 32; ++x) {
        EXPECT_GE(out.At(x, 0), out.At(x - 1, 0));
    }
    EXPECT_EQ(out.At(31, 0), 255);
}

TEST_F(EnhanceTest, EqualizeColorKeepsNeutralPixels) {
    PImage img(8, 8, PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < 8; ++y) {
        uint8_t* row = static_cast<uint8_t*>(img.RowPtr(y));
        for (int32_t x = 0; x < 8; ++x) {
            uint8_t v = static_cast<uint8_t>(60 + 8 * x);
            row[x * 3] = row[x * 3 + 1] = row[x * 3 + 2] = v;
        }
    }
    PImage out;
    HistogramEqualize(img, out);
    ASSERT_EQ(out.GetChannelType(), ChannelType::RGB);
    for (int32_t y = 0; y < 8; ++y) {
        const uint8_t* row = static_cast<const uint8_t*>(out.RowPtr(y));
        for (int32_t x = 0; x < 8; ++x) {
            EXPECT_NEAR(row[x * 3], row[x * 3 + 1], 1);
            EXPECT_NEAR(row[x * 3 + 2], row[x * 3 + 1], 1);
        }
    }
    const uint8_t* last = static_cast<const uint8_t*>(out.RowPtr(0)) + 7 * 3;
    EXPECT_GE(last[1], 254);
}

TEST_F(EnhanceTest, EqualizeEmpty) {
    PImage out(2, 2);
    HistogramEqualize(PImage(), out);
    EXPECT_TRUE(out.Empty());
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(EnhanceTest, ParseNormalizeRange) {
    EXPECT_EQ(ParseNormalizeRange("0-1"), NormalizeRange::Unit);
    EXPECT_EQ(ParseNormalizeRange("0-255"), NormalizeRange::Byte);
    EXPECT_THROW(ParseNormalizeRange("0-100"), InvalidArgumentException);
}

TEST_F(EnhanceTest, NormalizeByteStretches) {
    PImage img = MakeLowContrast(11, 3);
    PImage out;
    NormalizeImage(img, out, NormalizeRange::Byte);
    EXPECT_EQ(out.At(0, 1), 0);
    EXPECT_EQ(out.At(10, 1), 255);
    EXPECT_EQ(out.At(5, 1), 128);
}

TEST_F(EnhanceTest, NormalizeUnitMatchesByte) {
    PImage img = MakeLowContrast(11, 3);
    PImage unit, byte;
    NormalizeImage(img, unit, NormalizeRange::Unit);
    NormalizeImage(img, byte, NormalizeRange::Byte);
    // Unit output passes through Float32, so allow one level of rounding
    for (int32_t y = 0; y < 3; ++y) {
        for (int32_t x = 0; x < 11; ++x) {
            EXPECT_NEAR(unit.At(x, y), byte.At(x, y), 1);
        }
    }
    EXPECT_EQ(unit.At(0, 0), 0);
    EXPECT_EQ(unit.At(10, 0), 255);
}

TEST_F(EnhanceTest, NormalizeToUnitIsFloat) {
    PImage img = MakeLowContrast(11, 1);
    PImage unit;
    NormalizeToUnit(img, unit);
    ASSERT_EQ(unit.Type(), PixelType::Float32);
    const float* row = static_cast<const float*>(unit.RowPtr(0));
    EXPECT_FLOAT_EQ(row[0], 0.0f);
    EXPECT_FLOAT_EQ(row[10], 1.0f);
    EXPECT_NEAR(row[5], 0.5f, 1e-6f);
}

TEST_F(EnhanceTest, NormalizeConstantIsUnchanged) {
    PImage img(5, 5);
    img.Fill(90);
    PImage unit, byte;
    NormalizeImage(img, unit, NormalizeRange::Unit);
    NormalizeImage(img, byte, NormalizeRange::Byte);
    ExpectEqualImages(unit, img);
    ExpectEqualImages(byte, img);
}

TEST_F(EnhanceTest, NormalizeBlackIsUnchanged) {
    PImage img(5, 5);
    PImage out;
    NormalizeImage(img, out);
    ExpectEqualImages(out, img);
}

TEST_F(EnhanceTest, NormalizeColorUsesGlobalRange) {
    std::vector<uint8_t> samples = {100, 150, 200, 100, 100, 100};
    PImage img = PImage::FromData(samples.data(), 2, 1, PixelType::UInt8, ChannelType::RGB);
    PImage out;
    NormalizeImage(img, out, NormalizeRange::Byte);
    const uint8_t* px = static_cast<const uint8_t*>(out.RowPtr(0));
    EXPECT_EQ(px[0], 0);
    EXPECT_EQ(px[1], 128);
    EXPECT_EQ(px[2], 255);
}

// ============================================================================
// Histograms
// ============================================================================

TEST_F(EnhanceTest, GrayHistogramCountsPixels) {
    PImage img = MakeLowContrast(20, 10);
    auto hist = GrayHistogram(img);
    ASSERT_EQ(hist.size(), 256u);
    EXPECT_EQ(std::accumulate(hist.begin(), hist.end(), 0u), 200u);
    EXPECT_EQ(hist[50], 10u);
}

TEST_F(EnhanceTest, ChannelHistograms) {
    PImage img(4, 4, PixelType::UInt8, ChannelType::RGB);
    img.Fill(7);
    auto hists = ChannelHistograms(img);
    ASSERT_EQ(hists.size(), 3u);
    for (const auto& h : hists) {
        EXPECT_EQ(h[7], 16u);
    }
    EXPECT_EQ(ChannelHistograms(PImage(3, 3)).size(), 1u);
    EXPECT_TRUE(ChannelHistograms(PImage()).empty());
}

TEST_F(EnhanceTest, CumulativeDistribution) {
    std::vector<uint32_t> hist(256, 0);
    hist[10] = 1;
    hist[20] = 3;
    auto cdf = CumulativeDistribution(hist);
    EXPECT_DOUBLE_EQ(cdf[9], 0.0);
    EXPECT_DOUBLE_EQ(cdf[10], 0.25);
    EXPECT_DOUBLE_EQ(cdf[255], 1.0);

    auto zeros = CumulativeDistribution(std::vector<uint32_t>(256, 0));
    for (double v : zeros) EXPECT_DOUBLE_EQ(v, 0.0);
}
