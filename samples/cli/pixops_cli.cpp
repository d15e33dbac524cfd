/**
 * @file pixops_cli.cpp
 * @brief Run one PixOps action on image files
 *
 * Usage:
 *   pixops_cli <action> <input> [<input2>] <output-prefix> [mode=...] [key=value ...]
 *
 * Every named output is written as <output-prefix>_<name>.png.
 * seed=<n> fixes the noise generator.
 */

#include <PixOps/PixOps.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace Pix::Ops;
using namespace Pix::Ops::Operation;

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <action> <input> [<input2>] <output-prefix> [mode=...] [key=value ...]\n"
              << "Actions: noise filter edge equalize normalize grayscale frequency hybrid histogram\n"
              << "Examples:\n"
              << "  " << argv0 << " noise in.png out mode=gaussian sigma=15 seed=42\n"
              << "  " << argv0 << " edge in.png out mode=canny threshold1=50 threshold2=150\n"
              << "  " << argv0 << " hybrid a.png b.png out cutoff_low=20 cutoff_high=15\n";
}

bool ParseNumber(const std::string& text, double& value) {
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        PrintUsage(argv[0]);
        return 1;
    }

    try {
        OperationRequest request;
        request.action = ParseAction(argv[1]);

        // Positional arguments are everything before the first key=value
        std::vector<std::string> positional;
        int i = 2;
        for (; i < argc && std::string(argv[i]).find('=') == std::string::npos; ++i) {
            positional.push_back(argv[i]);
        }

        const size_t expected = (request.action == Action::Hybrid) ? 3 : 2;
        if (positional.size() != expected) {
            PrintUsage(argv[0]);
            return 1;
        }

        for (; i < argc; ++i) {
            std::string arg = argv[i];
            size_t eq = arg.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Expected key=value, got: " << arg << "\n";
                return 1;
            }
            std::string key = arg.substr(0, eq);
            std::string value = arg.substr(eq + 1);

            if (key == "mode") {
                request.mode = value;
                continue;
            }

            double number = 0.0;
            if (!ParseNumber(value, number)) {
                std::cerr << "Invalid number for " << key << ": " << value << "\n";
                return 1;
            }
            if (key == "seed") {
                Platform::SetRandomSeed(static_cast<uint64_t>(number));
            } else {
                request.params[key] = number;
            }
        }

        const std::string& prefix = positional.back();
        PImage image = PImage::FromFile(positional[0]);
        std::cout << "Loaded: " << positional[0] << " (" << image.Width() << "x"
                  << image.Height() << ", " << image.Channels() << " ch)\n";

        OperationResult result;
        if (request.action == Action::Hybrid) {
            PImage second = PImage::FromFile(positional[1]);
            std::cout << "Loaded: " << positional[1] << " (" << second.Width() << "x"
                      << second.Height() << ", " << second.Channels() << " ch)\n";
            result = RunHybrid(image, second, request);
        } else {
            result = RunOperation(image, request);
        }

        std::cout << result.message << "\n";
        for (const auto& out : result.outputs) {
            std::string path = prefix + "_" + out.name + ".png";
            if (!out.image.SaveToFile(path)) {
                std::cerr << "Failed to write: " << path << "\n";
                return 1;
            }
            std::cout << "Saved: " << path << "\n";
        }
    } catch (const Exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
