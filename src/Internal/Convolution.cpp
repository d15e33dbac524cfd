/**
 * @file Convolution.cpp
 * @brief 2D correlation implementation
 */

#include <PixOps/Internal/Convolution.h>

namespace Pix::Ops::Internal {

template<typename SrcT>
std::vector<double> PadPlane(const SrcT* src, int32_t width, int32_t height,
                             int32_t kernelWidth, int32_t kernelHeight,
                             BorderMode border, double borderValue) {
    const int32_t anchorX = (kernelWidth - 1) / 2;
    const int32_t anchorY = (kernelHeight - 1) / 2;
    const int32_t padW = width + kernelWidth - 1;
    const int32_t padH = height + kernelHeight - 1;

    std::vector<double> padded(static_cast<size_t>(padW) * padH);

    for (int32_t py = 0; py < padH; ++py) {
        int32_t sy = py - anchorY;
        bool rowInside = (sy >= 0 && sy < height);
        if (!rowInside && border == BorderMode::Replicate) {
            sy = ClampIndex(sy, height);
            rowInside = true;
        }

        double* dstRow = padded.data() + static_cast<size_t>(py) * padW;
        if (!rowInside) {
            std::fill(dstRow, dstRow + padW, borderValue);
            continue;
        }

        const SrcT* srcRow = src + static_cast<size_t>(sy) * width;
        for (int32_t px = 0; px < padW; ++px) {
            int32_t sx = px - anchorX;
            if (sx >= 0 && sx < width) {
                dstRow[px] = static_cast<double>(srcRow[sx]);
            } else if (border == BorderMode::Replicate) {
                dstRow[px] = static_cast<double>(srcRow[ClampIndex(sx, width)]);
            } else {
                dstRow[px] = borderValue;
            }
        }
    }

    return padded;
}

template<typename SrcT, typename DstT>
void Convolve2D(const SrcT* src, DstT* dst, int32_t width, int32_t height,
                const double* kernel, int32_t kernelWidth, int32_t kernelHeight,
                BorderMode border, double borderValue) {
    if (width <= 0 || height <= 0 || kernelWidth <= 0 || kernelHeight <= 0) {
        return;
    }

    std::vector<double> padded = PadPlane(src, width, height,
                                          kernelWidth, kernelHeight,
                                          border, borderValue);
    const int32_t padW = width + kernelWidth - 1;

    for (int32_t y = 0; y < height; ++y) {
        DstT* dstRow = dst + static_cast<size_t>(y) * width;
        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t ky = 0; ky < kernelHeight; ++ky) {
                const double* window = padded.data() +
                    static_cast<size_t>(y + ky) * padW + x;
                const double* weights = kernel + static_cast<size_t>(ky) * kernelWidth;
                for (int32_t kx = 0; kx < kernelWidth; ++kx) {
                    sum += window[kx] * weights[kx];
                }
            }
            dstRow[x] = static_cast<DstT>(sum);
        }
    }
}

// Explicit template instantiations

// PadPlane
template std::vector<double> PadPlane<uint8_t>(const uint8_t*, int32_t, int32_t, int32_t, int32_t, BorderMode, double);
template std::vector<double> PadPlane<float>(const float*, int32_t, int32_t, int32_t, int32_t, BorderMode, double);
template std::vector<double> PadPlane<double>(const double*, int32_t, int32_t, int32_t, int32_t, BorderMode, double);

// Convolve2D
template void Convolve2D<uint8_t, double>(const uint8_t*, double*, int32_t, int32_t, const double*, int32_t, int32_t, BorderMode, double);
template void Convolve2D<float, float>(const float*, float*, int32_t, int32_t, const double*, int32_t, int32_t, BorderMode, double);
template void Convolve2D<double, double>(const double*, double*, int32_t, int32_t, const double*, int32_t, int32_t, BorderMode, double);

} // namespace Pix::Ops::Internal
