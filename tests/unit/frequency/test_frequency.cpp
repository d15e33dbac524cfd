/**
 * @file test_frequency.cpp
 * @brief Unit tests for ideal frequency-domain filtering
 */

#include <gtest/gtest.h>
#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Core/Exception.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Pix::Ops;
using namespace Pix::Ops::Frequency;

class FrequencyTest : public ::testing::Test {
protected:
    PImage MakePattern(int32_t w, int32_t h) {
        PImage img(w, h);
        for (int32_t y = 0; y < h; ++y) {
            for (int32_t x = 0; x < w; ++x) {
                img.SetAt(x, y, static_cast<uint8_t>((x * 31 + y * 17 + x * y) % 256));
            }
        }
        img.SetAt(0, 0, 0);
        img.SetAt(1, 0, 255);
        return img;
    }

    double Mean(const PImage& img) {
        double sum = 0.0;
        for (int32_t y = 0; y < img.Height(); ++y) {
            for (int32_t x = 0; x < img.Width(); ++x) {
                sum += img.At(x, y);
            }
        }
        return sum / (static_cast<double>(img.Width()) * img.Height());
    }

    std::vector<double> ToPlane(const PImage& img) {
        std::vector<double> plane;
        for (int32_t y = 0; y < img.Height(); ++y) {
            for (int32_t x = 0; x < img.Width(); ++x) {
                plane.push_back(img.At(x, y));
            }
        }
        return plane;
    }
};

// ============================================================================
// Masks
// ============================================================================

TEST_F(FrequencyTest, ParsePassMode) {
    EXPECT_EQ(ParsePassMode("low"), PassMode::LowPass);
    EXPECT_EQ(ParsePassMode("high"), PassMode::HighPass);
    EXPECT_THROW(ParsePassMode("band"), InvalidArgumentException);
}

TEST_F(FrequencyTest, ZeroCutoffKeepsOnlyCenter) {
    FrequencyMask low = BuildFrequencyMask(8, 6, 0.0, PassMode::LowPass);
    int32_t kept = 0;
    for (uint8_t v : low.pass) kept += v;
    EXPECT_EQ(kept, 1);
    EXPECT_TRUE(low.At(4, 3));

    FrequencyMask odd = BuildFrequencyMask(7, 5, 0.0, PassMode::LowPass);
    EXPECT_TRUE(odd.At(3, 2));
}

TEST_F(FrequencyTest, LowAndHighAreComplementary) {
    FrequencyMask low = BuildFrequencyMask(16, 12, 4.5, PassMode::LowPass);
    FrequencyMask high = BuildFrequencyMask(16, 12, 4.5, PassMode::HighPass);
    for (size_t i = 0; i < low.pass.size(); ++i) {
        EXPECT_NE(low.pass[i], high.pass[i]);
    }
    // Boundary distance belongs to the low-pass side
    EXPECT_TRUE(BuildFrequencyMask(16, 12, 3.0, PassMode::LowPass).At(8 + 3, 6));
    EXPECT_FALSE(BuildFrequencyMask(16, 12, 3.0, PassMode::HighPass).At(8 + 3, 6));
}

TEST_F(FrequencyTest, InvalidCutoffThrows) {
    EXPECT_THROW(BuildFrequencyMask(4, 4, -1.0, PassMode::LowPass), InvalidArgumentException);
    EXPECT_THROW(BuildFrequencyMask(4, 4, std::numeric_limits<double>::quiet_NaN(),
                                    PassMode::LowPass), InvalidArgumentException);
    EXPECT_THROW(FilterFrequency(MakePattern(4, 4), PassMode::HighPass, -3.0),
                 InvalidArgumentException);
}

// ============================================================================
// Filtering
// ============================================================================

TEST_F(FrequencyTest, ZeroCutoffLowPassGivesMean) {
    PImage img = MakePattern(16, 12);
    FrequencyResult r = FilterFrequency(img, PassMode::LowPass, 0.0);
    double mean = Mean(img);
    for (int32_t y = 0; y < 12; ++y) {
        for (int32_t x = 0; x < 16; ++x) {
            EXPECT_NEAR(r.filtered.At(x, y), mean, 1.0);
        }
    }
}

TEST_F(FrequencyTest, WideLowPassReconstructs) {
    PImage img = MakePattern(10, 9);
    FrequencyResult r = FilterFrequency(img, PassMode::LowPass, 100.0);
    for (int32_t y = 0; y < 9; ++y) {
        for (int32_t x = 0; x < 10; ++x) {
            EXPECT_NEAR(r.filtered.At(x, y), img.At(x, y), 1);
        }
    }
}

TEST_F(FrequencyTest, LowPlusHighReconstructsPlane) {
    PImage img = MakePattern(12, 10);
    auto plane = ToPlane(img);
    auto low = ApplyIdealFilter(plane, BuildFrequencyMask(12, 10, 3.0, PassMode::LowPass));
    auto high = ApplyIdealFilter(plane, BuildFrequencyMask(12, 10, 3.0, PassMode::HighPass));
    for (size_t i = 0; i < plane.size(); ++i) {
        auto sum = low[i] + high[i];
        EXPECT_NEAR(sum.real(), plane[i], 1e-8);
        EXPECT_NEAR(sum.imag(), 0.0, 1e-8);
    }
}

TEST_F(FrequencyTest, ApplyIdealFilterSizeMismatch) {
    std::vector<double> plane(10, 0.0);
    EXPECT_THROW(ApplyIdealFilter(plane, BuildFrequencyMask(4, 4, 1.0, PassMode::LowPass)),
                 InvalidArgumentException);
}

TEST_F(FrequencyTest, ResultImages) {
    PImage img = MakePattern(9, 7);
    FrequencyResult r = FilterFrequency(img, PassMode::HighPass, 2.0);

    EXPECT_EQ(r.filtered.Type(), PixelType::UInt8);
    EXPECT_EQ(r.filtered.Width(), 9);
    EXPECT_EQ(r.spectrum.Type(), PixelType::Float32);
    EXPECT_EQ(r.filteredSpectrum.Type(), PixelType::Float32);
    EXPECT_EQ(r.mask.At(4, 3), 0);
    EXPECT_EQ(r.mask.At(0, 0), 255);

    // Masked spectrum is zero (log 1 = 0) inside the stop band
    const float* row = static_cast<const float*>(r.filteredSpectrum.RowPtr(3));
    EXPECT_FLOAT_EQ(row[4], 0.0f);
    const float* full = static_cast<const float*>(r.spectrum.RowPtr(3));
    EXPECT_GT(full[4], 0.0f);
}

TEST_F(FrequencyTest, ColorInputIsFilteredAsGray) {
    PImage img(8, 8, PixelType::UInt8, ChannelType::RGB);
    img.Fill(100);
    FrequencyResult r = FilterFrequency(img, PassMode::LowPass, 30.0);
    EXPECT_EQ(r.filtered.Channels(), 1);
    EXPECT_EQ(r.filtered.At(3, 3), 100);
}

TEST_F(FrequencyTest, EmptyImage) {
    FrequencyResult r = FilterFrequency(PImage(), PassMode::LowPass, 30.0);
    EXPECT_TRUE(r.filtered.Empty());
    EXPECT_TRUE(r.spectrum.Empty());
}

// ============================================================================
// Display
// ============================================================================

TEST_F(FrequencyTest, SpectrumToDisplayStretches) {
    PImage spectrum(3, 1, PixelType::Float32);
    float* row = static_cast<float*>(spectrum.RowPtr(0));
    row[0] = 10.0f;
    row[1] = 15.0f;
    row[2] = 20.0f;
    PImage display;
    SpectrumToDisplay(spectrum, display);
    EXPECT_EQ(display.At(0, 0), 0);
    EXPECT_EQ(display.At(1, 0), 128);
    EXPECT_EQ(display.At(2, 0), 255);
}

TEST_F(FrequencyTest, SpectrumToDisplayRejectsBytes) {
    PImage display;
    EXPECT_THROW(SpectrumToDisplay(PImage(3, 3), display), UnsupportedException);
}
