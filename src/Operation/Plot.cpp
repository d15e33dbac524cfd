/**
 * @file Plot.cpp
 * @brief Chart rendering
 */

#include <PixOps/Operation/Plot.h>
#include <PixOps/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace Pix::Ops::Operation {

namespace {

constexpr int32_t MARGIN = 10;

class Canvas {
public:
    Canvas(int32_t width, int32_t height)
        : image_(width, height, PixelType::UInt8, ChannelType::RGB) {
        image_.Fill(255);
    }

    void Set(int32_t x, int32_t y, PlotColor c) {
        if (x < 0 || y < 0 || x >= image_.Width() || y >= image_.Height()) return;
        uint8_t* px = static_cast<uint8_t*>(image_.RowPtr(y)) + x * 3;
        px[0] = c.r;
        px[1] = c.g;
        px[2] = c.b;
    }

    // Bresenham
    void Line(int32_t x0, int32_t y0, int32_t x1, int32_t y1, PlotColor c) {
        int32_t dx = std::abs(x1 - x0);
        int32_t dy = std::abs(y1 - y0);
        int32_t sx = (x0 < x1) ? 1 : -1;
        int32_t sy = (y0 < y1) ? 1 : -1;
        int32_t err = dx - dy;

        while (true) {
            Set(x0, y0, c);
            if (x0 == x1 && y0 == y1) break;

            int32_t e2 = 2 * err;
            if (e2 > -dy) {
                err -= dy;
                x0 += sx;
            }
            if (e2 < dx) {
                err += dx;
                y0 += sy;
            }
        }
    }

    void Frame(PlotColor c) {
        const int32_t right = image_.Width() - MARGIN;
        const int32_t bottom = image_.Height() - MARGIN;
        Line(MARGIN, MARGIN, right, MARGIN, c);
        Line(right, MARGIN, right, bottom, c);
        Line(right, bottom, MARGIN, bottom, c);
        Line(MARGIN, bottom, MARGIN, MARGIN, c);
    }

    PImage& Image() { return image_; }

private:
    PImage image_;
};

void RequirePlotSize(int32_t width, int32_t height, const char* funcName) {
    if (width <= 4 * MARGIN || height <= 4 * MARGIN) {
        throw InvalidArgumentException(std::string(funcName) + ": plot size too small");
    }
}

const PlotColor FRAME_COLOR{200, 200, 200};

} // anonymous namespace

PImage RenderHistogram(const std::vector<uint32_t>& histogram, PlotColor color,
                       int32_t width, int32_t height) {
    RequirePlotSize(width, height, "RenderHistogram");

    Canvas canvas(width, height);
    canvas.Frame(FRAME_COLOR);
    if (histogram.empty()) {
        return canvas.Image();
    }

    const uint32_t peak = *std::max_element(histogram.begin(), histogram.end());
    const int32_t plotW = width - 2 * MARGIN - 1;
    const int32_t plotH = height - 2 * MARGIN - 1;
    const int32_t bottom = height - MARGIN - 1;
    const size_t bins = histogram.size();

    for (int32_t x = 0; x < plotW; ++x) {
        size_t bin = static_cast<size_t>(x) * bins / plotW;
        if (peak == 0 || histogram[bin] == 0) continue;
        int32_t barH = static_cast<int32_t>(
            std::lround(static_cast<double>(histogram[bin]) / peak * (plotH - 1)));
        canvas.Line(MARGIN + 1 + x, bottom, MARGIN + 1 + x, bottom - barH, color);
    }
    return canvas.Image();
}

PImage RenderCurves(const std::vector<std::vector<double>>& series,
                    const std::vector<PlotColor>& colors,
                    int32_t width, int32_t height) {
    RequirePlotSize(width, height, "RenderCurves");
    if (colors.size() < series.size()) {
        throw InvalidArgumentException("RenderCurves: one color per series required");
    }

    Canvas canvas(width, height);
    canvas.Frame(FRAME_COLOR);

    double peak = 0.0;
    for (const auto& s : series) {
        for (double v : s) {
            if (std::isfinite(v)) peak = std::max(peak, v);
        }
    }
    if (peak <= 0.0) {
        return canvas.Image();
    }

    const int32_t plotW = width - 2 * MARGIN - 2;
    const int32_t plotH = height - 2 * MARGIN - 2;
    const int32_t left = MARGIN + 1;
    const int32_t bottom = height - MARGIN - 1;

    for (size_t k = 0; k < series.size(); ++k) {
        const auto& s = series[k];
        if (s.empty()) continue;

        auto toPoint = [&](size_t i, int32_t& px, int32_t& py) {
            double t = (s.size() > 1) ? static_cast<double>(i) / (s.size() - 1) : 0.0;
            double v = std::isfinite(s[i]) ? std::max(0.0, s[i]) : 0.0;
            px = left + static_cast<int32_t>(std::lround(t * plotW));
            py = bottom - static_cast<int32_t>(std::lround(v / peak * plotH));
        };

        int32_t x0, y0;
        toPoint(0, x0, y0);
        canvas.Set(x0, y0, colors[k]);
        for (size_t i = 1; i < s.size(); ++i) {
            int32_t x1, y1;
            toPoint(i, x1, y1);
            canvas.Line(x0, y0, x1, y1, colors[k]);
            x0 = x1;
            y0 = y1;
        }
    }
    return canvas.Image();
}

} // namespace Pix::Ops::Operation
