/**
 * @file hybrid_demo.cpp
 * @brief Hybrid image from two inputs, plus the spectra of each half
 */

#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Frequency/Hybrid.h>
#include <PixOps/Core/PImage.h>
#include <PixOps/Core/Exception.h>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace Pix::Ops;
using namespace Pix::Ops::Frequency;

namespace {

bool Save(const PImage& image, const std::string& path) {
    if (!image.SaveToFile(path)) {
        std::cerr << "Failed to write: " << path << std::endl;
        return false;
    }
    std::cout << "Saved: " << path << "\n";
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0]
                  << " <far_image> <near_image> [cutoff_low] [cutoff_high] [output_dir]" << std::endl;
        return 1;
    }

    double cutoffLow = (argc > 3) ? std::atof(argv[3]) : DEFAULT_HYBRID_CUTOFF_LOW;
    double cutoffHigh = (argc > 4) ? std::atof(argv[4]) : DEFAULT_HYBRID_CUTOFF_HIGH;
    std::string outDir = (argc > 5) ? argv[5] : ".";

    try {
        PImage imageA = PImage::FromFile(argv[1]);
        PImage imageB = PImage::FromFile(argv[2]);

        std::cout << "=== Hybrid Image Demo ===\n";
        std::cout << "A (low frequencies):  " << argv[1] << " " << imageA.Width() << "x"
                  << imageA.Height() << "\n";
        std::cout << "B (high frequencies): " << argv[2] << " " << imageB.Width() << "x"
                  << imageB.Height() << "\n";
        std::cout << "Cutoffs: low=" << cutoffLow << ", high=" << cutoffHigh << "\n";

        HybridResult hybrid = MakeHybrid(imageA, imageB, cutoffLow, cutoffHigh);

        FrequencyResult lowPass = FilterFrequency(imageA, PassMode::LowPass, cutoffLow);
        FrequencyResult highPass = FilterFrequency(imageB, PassMode::HighPass, cutoffHigh);

        PImage lowSpectrum, highSpectrum;
        SpectrumToDisplay(lowPass.filteredSpectrum, lowSpectrum);
        SpectrumToDisplay(highPass.filteredSpectrum, highSpectrum);

        bool ok = Save(hybrid.hybrid, outDir + "/hybrid.png") &&
                  Save(hybrid.lowComponent, outDir + "/hybrid_low.png") &&
                  Save(hybrid.highComponent, outDir + "/hybrid_high.png") &&
                  Save(lowSpectrum, outDir + "/hybrid_low_spectrum.png") &&
                  Save(highSpectrum, outDir + "/hybrid_high_spectrum.png");
        return ok ? 0 : 1;
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
