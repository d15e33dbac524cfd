/**
 * @file Operation.cpp
 * @brief Action dispatch
 */

#include <PixOps/Operation/Operation.h>
#include <PixOps/Operation/Plot.h>

#include <PixOps/Color/ColorConvert.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Edge/Edge.h>
#include <PixOps/Enhance/Enhance.h>
#include <PixOps/Filter/Filter.h>
#include <PixOps/Frequency/Frequency.h>
#include <PixOps/Frequency/Hybrid.h>
#include <PixOps/Noise/Noise.h>

#include <cmath>
#include <utility>

namespace Pix::Ops::Operation {

// =============================================================================
// Request / Result
// =============================================================================

Action ParseAction(const std::string& name) {
    if (name == "noise") return Action::Noise;
    if (name == "filter") return Action::Filter;
    if (name == "edge") return Action::Edge;
    if (name == "equalize") return Action::Equalize;
    if (name == "normalize") return Action::Normalize;
    if (name == "grayscale") return Action::Grayscale;
    if (name == "frequency") return Action::Frequency;
    if (name == "hybrid") return Action::Hybrid;
    if (name == "histogram") return Action::Histogram;
    throw InvalidArgumentException("Unknown action: " + name);
}

const char* ActionName(Action action) {
    switch (action) {
        case Action::Noise:     return "noise";
        case Action::Filter:    return "filter";
        case Action::Edge:      return "edge";
        case Action::Equalize:  return "equalize";
        case Action::Normalize: return "normalize";
        case Action::Grayscale: return "grayscale";
        case Action::Frequency: return "frequency";
        case Action::Hybrid:    return "hybrid";
        case Action::Histogram: return "histogram";
        default:                return "unknown";
    }
}

double OperationRequest::Param(const std::string& key, double fallback) const {
    auto it = params.find(key);
    return (it != params.end()) ? it->second : fallback;
}

const PImage* OperationResult::Find(const std::string& name) const {
    for (const auto& out : outputs) {
        if (out.name == name) return &out.image;
    }
    return nullptr;
}

namespace {

// Actions whose mode selects the algorithm have no default
const std::string& RequireMode(const OperationRequest& request) {
    if (request.mode.empty()) {
        throw InvalidArgumentException(std::string(ActionName(request.action)) +
                                       ": mode is required");
    }
    return request.mode;
}

int32_t IntParam(const OperationRequest& request, const std::string& key, int32_t fallback) {
    double value = request.Param(key, fallback);
    if (!std::isfinite(value) || std::fabs(value) > 1e6) {
        throw InvalidArgumentException(key + " must be a finite integer");
    }
    return static_cast<int32_t>(std::lround(value));
}

void Add(OperationResult& result, const std::string& name, PImage image) {
    result.outputs.push_back(NamedImage{name, std::move(image)});
}

// =============================================================================
// Actions
// =============================================================================

OperationResult RunNoise(const PImage& image, const OperationRequest& request) {
    const std::string& mode = RequireMode(request);

    Noise::NoiseSpec spec;
    switch (Noise::ParseNoiseType(mode)) {
        case Noise::NoiseType::Gaussian:
            spec = Noise::NoiseSpec::Gaussian(
                request.Param("mean", Noise::DEFAULT_GAUSSIAN_MEAN),
                request.Param("sigma", Noise::DEFAULT_GAUSSIAN_SIGMA));
            break;
        case Noise::NoiseType::Uniform:
            spec = Noise::NoiseSpec::Uniform(
                request.Param("low", Noise::DEFAULT_UNIFORM_LOW),
                request.Param("high", Noise::DEFAULT_UNIFORM_HIGH));
            break;
        case Noise::NoiseType::SaltPepper:
            spec = Noise::NoiseSpec::SaltPepper(
                request.Param("ratio", Noise::DEFAULT_SALT_PEPPER_RATIO),
                request.Param("salt_vs_pepper", Noise::DEFAULT_SALT_PEPPER_SPLIT));
            break;
    }

    OperationResult result;
    PImage noisy;
    Noise::AddNoise(image, noisy, spec);
    Add(result, "result", std::move(noisy));
    result.message = mode + " noise added successfully";
    return result;
}

OperationResult RunFilter(const PImage& image, const OperationRequest& request) {
    const std::string& mode = RequireMode(request);
    int32_t size = IntParam(request, "kernel_size", 3);

    PImage filtered;
    if (mode == "average") {
        Filter::MeanImage(image, filtered, size);
    } else if (mode == "gaussian") {
        Filter::GaussFilter(image, filtered, size, request.Param("sigma", 1.0));
    } else if (mode == "median") {
        Filter::MedianImage(image, filtered, size);
    } else {
        throw InvalidArgumentException("Unknown filter type: " + mode);
    }

    OperationResult result;
    Add(result, "result", std::move(filtered));
    result.message = mode + " filter applied";
    return result;
}

OperationResult RunEdge(const PImage& image, const OperationRequest& request) {
    const std::string& mode = RequireMode(request);

    OperationResult result;
    if (mode == "canny") {
        PImage edges;
        Edge::CannyEdges(image, edges,
                         request.Param("threshold1", 100.0),
                         request.Param("threshold2", 200.0));
        Add(result, "edges", std::move(edges));
    } else {
        Edge::EdgeResult edges = Edge::DetectEdges(image, Edge::ParseEdgeOperator(mode));
        Add(result, "magnitude", std::move(edges.magnitude));
        Add(result, "grad_x", std::move(edges.gradientX));
        Add(result, "grad_y", std::move(edges.gradientY));
    }
    result.message = mode + " edge detection applied";
    return result;
}

OperationResult RunFrequency(const PImage& image, const OperationRequest& request) {
    const std::string mode = request.mode.empty() ? "low" : request.mode;
    Frequency::PassMode pass = Frequency::ParsePassMode(mode);

    Frequency::FrequencyResult freq =
        Frequency::FilterFrequency(image, pass, request.Param("cutoff", 30.0));

    OperationResult result;
    Add(result, "result", std::move(freq.filtered));

    PImage spectrum, filteredSpectrum;
    Frequency::SpectrumToDisplay(freq.spectrum, spectrum);
    Frequency::SpectrumToDisplay(freq.filteredSpectrum, filteredSpectrum);
    Add(result, "spectrum", std::move(spectrum));
    Add(result, "filtered_spectrum", std::move(filteredSpectrum));
    Add(result, "mask", std::move(freq.mask));

    result.message = mode + "-pass filter applied";
    return result;
}

OperationResult RunHistogram(const PImage& image, const OperationRequest& request) {
    const std::string mode = request.mode.empty() ? "grayscale" : request.mode;

    OperationResult result;
    if (mode == "grayscale") {
        std::vector<uint32_t> hist = Enhance::GrayHistogram(image);
        Add(result, "histogram", RenderHistogram(hist));
        Add(result, "cdf", RenderCurves({Enhance::CumulativeDistribution(hist)},
                                        {PlotColor{200, 30, 30}}));
    } else if (mode == "rgb") {
        std::vector<std::vector<double>> series;
        for (const auto& hist : Enhance::ChannelHistograms(image)) {
            series.emplace_back(hist.begin(), hist.end());
        }
        std::vector<PlotColor> colors = {{220, 40, 40}, {40, 160, 40}, {40, 40, 220}};
        if (series.size() == 1) {
            colors = {{64, 64, 64}};
        } else if (image.GetChannelType() == ChannelType::BGR) {
            std::swap(colors[0], colors[2]);
        }
        Add(result, "rgb_histogram", RenderCurves(series, colors));
    } else {
        throw InvalidArgumentException("Invalid histogram type: " + mode);
    }
    result.message = mode + " histogram generated";
    return result;
}

} // anonymous namespace

// =============================================================================
// Dispatch
// =============================================================================

OperationResult RunOperation(const PImage& image, const OperationRequest& request) {
    switch (request.action) {
        case Action::Noise:
            return RunNoise(image, request);
        case Action::Filter:
            return RunFilter(image, request);
        case Action::Edge:
            return RunEdge(image, request);
        case Action::Frequency:
            return RunFrequency(image, request);
        case Action::Histogram:
            return RunHistogram(image, request);
        case Action::Hybrid:
            throw InvalidArgumentException("hybrid: requires two images, use RunHybrid");
        default:
            break;
    }

    OperationResult result;
    PImage out;
    if (request.action == Action::Equalize) {
        Enhance::HistogramEqualize(image, out);
        result.message = "equalization applied successfully";
    } else if (request.action == Action::Normalize) {
        const std::string mode = request.mode.empty() ? "0-1" : request.mode;
        Enhance::NormalizeImage(image, out, Enhance::ParseNormalizeRange(mode));
        result.message = "normalization applied successfully";
    } else {
        Color::Rgb1ToGray(image, out);
        result.message = "grayscale applied successfully";
    }
    Add(result, "result", std::move(out));
    return result;
}

OperationResult RunHybrid(const PImage& imageA, const PImage& imageB,
                          const OperationRequest& request) {
    Frequency::HybridResult hybrid = Frequency::MakeHybrid(
        imageA, imageB,
        request.Param("cutoff_low", Frequency::DEFAULT_HYBRID_CUTOFF_LOW),
        request.Param("cutoff_high", Frequency::DEFAULT_HYBRID_CUTOFF_HIGH));

    OperationResult result;
    Add(result, "hybrid", std::move(hybrid.hybrid));
    Add(result, "low_freq", std::move(hybrid.lowComponent));
    Add(result, "high_freq", std::move(hybrid.highComponent));
    result.message = "Hybrid image created";
    return result;
}

} // namespace Pix::Ops::Operation
