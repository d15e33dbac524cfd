#pragma once

/**
 * @file Operation.h
 * @brief Named-action front end over the operation modules
 *
 * Maps an action name, a mode string and a flat key/value parameter set
 * onto the typed module calls, and collects the produced images under
 * stable names. Missing parameters take the documented defaults.
 *
 * Parameters per action:
 * | Action    | Modes                            | Keys (default)                          |
 * |-----------|----------------------------------|-----------------------------------------|
 * | noise     | gaussian, uniform, salt_pepper   | mean (0), sigma (25), low (-25),        |
 * |           |                                  | high (25), ratio (0.05),                |
 * |           |                                  | salt_vs_pepper (0.5)                    |
 * | filter    | average, gaussian, median        | kernel_size (3), sigma (1)              |
 * | edge      | sobel, roberts, prewitt, canny   | threshold1 (100), threshold2 (200)      |
 * | equalize  | -                                | -                                       |
 * | normalize | 0-1 (default), 0-255             | -                                       |
 * | grayscale | -                                | -                                       |
 * | frequency | low (default), high              | cutoff (30)                             |
 * | hybrid    | -                                | cutoff_low (30), cutoff_high (10)       |
 * | histogram | grayscale (default), rgb         | -                                       |
 *
 * Example:
 * @code
 * Operation::OperationRequest req;
 * req.action = Operation::Action::Filter;
 * req.mode = "gaussian";
 * req.params["kernel_size"] = 5;
 * auto result = Operation::RunOperation(image, req);
 * result.Find("result")->SaveToFile("smoothed.png");
 * @endcode
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Pix::Ops::Operation {

// =============================================================================
// Request
// =============================================================================

enum class Action {
    Noise,
    Filter,
    Edge,
    Equalize,
    Normalize,
    Grayscale,
    Frequency,
    Hybrid,
    Histogram
};

/// Parse an action name ("noise", "filter", ...)
/// @throws InvalidArgumentException on unknown name
PIXOPS_API Action ParseAction(const std::string& name);

PIXOPS_API const char* ActionName(Action action);

struct PIXOPS_API OperationRequest {
    Action action = Action::Grayscale;
    std::string mode;                           ///< Empty = action default
    std::map<std::string, double> params;

    /// Parameter value, or fallback when the key is absent
    double Param(const std::string& key, double fallback) const;

    static OperationRequest Make(Action action, const std::string& mode = "") {
        OperationRequest req;
        req.action = action;
        req.mode = mode;
        return req;
    }
};

// =============================================================================
// Result
// =============================================================================

struct PIXOPS_API NamedImage {
    std::string name;
    PImage image;
};

struct PIXOPS_API OperationResult {
    std::vector<NamedImage> outputs;
    std::string message;

    /// Output by name, nullptr if not produced
    const PImage* Find(const std::string& name) const;
};

// =============================================================================
// Dispatch
// =============================================================================

/**
 * @brief Run a single-image action
 *
 * @throws InvalidArgumentException on unknown mode, missing mode (noise,
 *         filter, edge) or invalid parameter values, and for Action::Hybrid
 */
PIXOPS_API OperationResult RunOperation(const PImage& image, const OperationRequest& request);

/**
 * @brief Blend low frequencies of imageA with high frequencies of imageB
 *
 * Outputs "hybrid", "low_freq" and "high_freq".
 */
PIXOPS_API OperationResult RunHybrid(const PImage& imageA, const PImage& imageB,
                                     const OperationRequest& request);

} // namespace Pix::Ops::Operation
