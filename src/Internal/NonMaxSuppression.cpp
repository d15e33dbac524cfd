/**
 * @file NonMaxSuppression.cpp
 * @brief Quantized NMS and hysteresis implementation
 */

#include <PixOps/Internal/NonMaxSuppression.h>

#include <cmath>
#include <cstring>
#include <queue>

namespace Pix::Ops::Internal {

namespace {

// tan(22.5 deg) and tan(67.5 deg)
constexpr float TAN_22_5 = 0.41421356f;
constexpr float TAN_67_5 = 2.41421356f;

} // anonymous namespace

int32_t QuantizeDirection(float gx, float gy) {
    float ax = std::fabs(gx);
    float ay = std::fabs(gy);

    if (ay <= ax * TAN_22_5) {
        return 0;
    }
    if (ay >= ax * TAN_67_5) {
        return 2;
    }
    return ((gx > 0.0f) == (gy > 0.0f)) ? 1 : 3;
}

void NMS2DGradientQuantized(const float* magnitude, const float* gx, const float* gy,
                            float* output, int32_t width, int32_t height) {
    std::memset(output, 0, sizeof(float) * static_cast<size_t>(width) * height);

    // Negative-side neighbor per direction; positive side is the mirror
    const int32_t dxNeg[4] = {-1, -1,  0,  1};
    const int32_t dyNeg[4] = { 0, -1, -1, -1};

    auto magAt = [&](int32_t x, int32_t y) -> float {
        if (x < 0 || x >= width || y < 0 || y >= height) return 0.0f;
        return magnitude[static_cast<size_t>(y) * width + x];
    };

    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            size_t idx = static_cast<size_t>(y) * width + x;
            float mag = magnitude[idx];
            if (mag <= 0.0f) continue;

            int32_t dir = QuantizeDirection(gx[idx], gy[idx]);
            float neg = magAt(x + dxNeg[dir], y + dyNeg[dir]);
            float pos = magAt(x - dxNeg[dir], y - dyNeg[dir]);

            if (mag > neg && mag >= pos) {
                output[idx] = mag;
            }
        }
    }
}

void HysteresisThreshold(const float* edges, uint8_t* output,
                         int32_t width, int32_t height,
                         float lowThreshold, float highThreshold) {
    const size_t size = static_cast<size_t>(width) * height;
    std::memset(output, 0, size);

    constexpr uint8_t STRONG = 255;
    constexpr uint8_t WEAK = 128;

    std::queue<size_t> strongQueue;

    for (size_t idx = 0; idx < size; ++idx) {
        float v = edges[idx];
        if (v > highThreshold) {
            output[idx] = STRONG;
            strongQueue.push(idx);
        } else if (v > lowThreshold) {
            output[idx] = WEAK;
        }
    }

    // Grow strong edges into 8-connected weak pixels
    const int32_t dx[8] = {-1, 0, 1, -1, 1, -1, 0, 1};
    const int32_t dy[8] = {-1, -1, -1, 0, 0, 1, 1, 1};

    while (!strongQueue.empty()) {
        size_t idx = strongQueue.front();
        strongQueue.pop();

        int32_t x = static_cast<int32_t>(idx % width);
        int32_t y = static_cast<int32_t>(idx / width);

        for (int k = 0; k < 8; ++k) {
            int32_t nx = x + dx[k];
            int32_t ny = y + dy[k];
            if (nx < 0 || nx >= width || ny < 0 || ny >= height) continue;

            size_t nidx = static_cast<size_t>(ny) * width + nx;
            if (output[nidx] == WEAK) {
                output[nidx] = STRONG;
                strongQueue.push(nidx);
            }
        }
    }

    // Unconnected weak pixels are dropped
    for (size_t idx = 0; idx < size; ++idx) {
        if (output[idx] != STRONG) {
            output[idx] = 0;
        }
    }
}

} // namespace Pix::Ops::Internal
