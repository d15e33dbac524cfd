#pragma once

/**
 * @file Plot.h
 * @brief Minimal chart rendering for histogram reports
 *
 * Charts are RGB UInt8 images with a white background, a light frame
 * and the data scaled to fill the plot area.
 */

#include <PixOps/Core/Export.h>
#include <PixOps/Core/PImage.h>

#include <cstdint>
#include <vector>

namespace Pix::Ops::Operation {

constexpr int32_t DEFAULT_PLOT_WIDTH = 512;
constexpr int32_t DEFAULT_PLOT_HEIGHT = 300;

/**
 * @brief RGB color for plotting
 */
struct PIXOPS_API PlotColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/**
 * @brief Bar chart, one bar per bin, tallest bar touches the top
 */
PIXOPS_API PImage RenderHistogram(const std::vector<uint32_t>& histogram,
                                  PlotColor color = {64, 64, 64},
                                  int32_t width = DEFAULT_PLOT_WIDTH,
                                  int32_t height = DEFAULT_PLOT_HEIGHT);

/**
 * @brief Overlaid polylines, one per series, on a shared vertical scale
 *
 * @param series Each series is drawn left to right across the full width
 * @param colors One color per series
 */
PIXOPS_API PImage RenderCurves(const std::vector<std::vector<double>>& series,
                               const std::vector<PlotColor>& colors,
                               int32_t width = DEFAULT_PLOT_WIDTH,
                               int32_t height = DEFAULT_PLOT_HEIGHT);

} // namespace Pix::Ops::Operation
