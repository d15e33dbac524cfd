/**
 * @file Gradient.cpp
 * @brief Gradient kernels and computation
 */

#include <PixOps/Internal/Gradient.h>
#include <PixOps/Internal/Convolution.h>

namespace Pix::Ops::Internal {

GradientKernels GetGradientKernels(GradientOperator op) {
    GradientKernels k;
    switch (op) {
        case GradientOperator::Sobel:
            k.size = 3;
            k.kernelX = {-1.0, 0.0, 1.0,
                         -2.0, 0.0, 2.0,
                         -1.0, 0.0, 1.0};
            k.kernelY = {-1.0, -2.0, -1.0,
                          0.0,  0.0,  0.0,
                          1.0,  2.0,  1.0};
            k.border = BorderMode::Replicate;
            break;

        case GradientOperator::Prewitt:
            k.size = 3;
            k.kernelX = {-1.0, 0.0, 1.0,
                         -1.0, 0.0, 1.0,
                         -1.0, 0.0, 1.0};
            k.kernelY = {-1.0, -1.0, -1.0,
                          0.0,  0.0,  0.0,
                          1.0,  1.0,  1.0};
            k.border = BorderMode::Replicate;
            break;

        case GradientOperator::Roberts:
            k.size = 2;
            k.kernelX = {1.0,  0.0,
                         0.0, -1.0};
            k.kernelY = { 0.0, 1.0,
                         -1.0, 0.0};
            k.border = BorderMode::Constant;
            break;
    }
    return k;
}

template<typename SrcT, typename DstT>
void Gradient(const SrcT* src, DstT* gx, DstT* gy,
              int32_t width, int32_t height,
              GradientOperator op) {
    GradientKernels k = GetGradientKernels(op);

    Convolve2D<SrcT, DstT>(src, gx, width, height,
                           k.kernelX.data(), k.size, k.size, k.border, 0.0);
    Convolve2D<SrcT, DstT>(src, gy, width, height,
                           k.kernelY.data(), k.size, k.size, k.border, 0.0);
}

// Explicit template instantiations
template void Gradient<double, double>(const double*, double*, double*, int32_t, int32_t, GradientOperator);
template void Gradient<float, float>(const float*, float*, float*, int32_t, int32_t, GradientOperator);

} // namespace Pix::Ops::Internal
