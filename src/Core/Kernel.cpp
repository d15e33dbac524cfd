#include <PixOps/Core/Kernel.h>
#include <PixOps/Core/Exception.h>

#include <cmath>
#include <numeric>
#include <string>

namespace Pix::Ops {

namespace {

void RequireKernelSize(int32_t size, const char* funcName) {
    if (size < 1) {
        throw InvalidArgumentException(std::string(funcName) +
                                       ": kernel size must be >= 1, got " +
                                       std::to_string(size));
    }
}

} // anonymous namespace

int32_t MakeOdd(int32_t size) {
    return (size % 2 == 0) ? size + 1 : size;
}

double Kernel::Sum() const {
    return std::accumulate(weights.begin(), weights.end(), 0.0);
}

void Kernel::Validate() const {
    if (size < 1 || size % 2 == 0) {
        throw InvalidArgumentException("Kernel: side must be odd and >= 1, got " +
                                       std::to_string(size));
    }
    if (weights.size() != static_cast<size_t>(size) * size) {
        throw InvalidArgumentException("Kernel: expected " +
                                       std::to_string(size * size) + " weights, got " +
                                       std::to_string(weights.size()));
    }
    for (double w : weights) {
        if (!std::isfinite(w)) {
            throw InvalidArgumentException("Kernel: weights must be finite");
        }
    }
}

Kernel Kernel::Zeros(int32_t size) {
    RequireKernelSize(size, "Kernel::Zeros");
    Kernel k;
    k.size = MakeOdd(size);
    k.weights.assign(static_cast<size_t>(k.size) * k.size, 0.0);
    return k;
}

Kernel Kernel::Box(int32_t size) {
    RequireKernelSize(size, "Kernel::Box");
    Kernel k;
    k.size = MakeOdd(size);
    double w = 1.0 / (static_cast<double>(k.size) * k.size);
    k.weights.assign(static_cast<size_t>(k.size) * k.size, w);
    return k;
}

Kernel Kernel::Gaussian(int32_t size, double sigma) {
    RequireKernelSize(size, "Kernel::Gaussian");
    if (!std::isfinite(sigma) || sigma <= 0.0) {
        throw InvalidArgumentException("Kernel::Gaussian: sigma must be finite and > 0");
    }

    Kernel k;
    k.size = MakeOdd(size);
    k.weights.resize(static_cast<size_t>(k.size) * k.size);

    int32_t center = k.size / 2;
    double sigma2 = 2.0 * sigma * sigma;
    double sum = 0.0;

    for (int32_t r = 0; r < k.size; ++r) {
        double y = r - center;
        for (int32_t c = 0; c < k.size; ++c) {
            double x = c - center;
            double w = std::exp(-(x * x + y * y) / sigma2);
            k.weights[static_cast<size_t>(r) * k.size + c] = w;
            sum += w;
        }
    }

    // Center weight is exp(0) = 1, so sum >= 1
    for (double& w : k.weights) {
        w /= sum;
    }
    return k;
}

Kernel Kernel::FromRows(const std::vector<std::vector<double>>& rows) {
    int32_t n = static_cast<int32_t>(rows.size());
    if (n == 0) {
        throw InvalidArgumentException("Kernel::FromRows: kernel is empty");
    }

    Kernel k;
    k.size = n;
    k.weights.reserve(static_cast<size_t>(n) * n);
    for (const auto& row : rows) {
        if (static_cast<int32_t>(row.size()) != n) {
            throw InvalidArgumentException("Kernel::FromRows: kernel must be square");
        }
        k.weights.insert(k.weights.end(), row.begin(), row.end());
    }
    k.Validate();
    return k;
}

} // namespace Pix::Ops
