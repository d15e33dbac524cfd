#pragma once

#include <PixOps/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PixOps
 *
 * Only parameter-domain violations are raised. Degenerate inputs
 * (constant or all-zero buffers) are handled by local fallbacks.
 */

#include <stdexcept>
#include <string>

namespace Pix::Ops {

/**
 * @brief Base exception class for PixOps
 */
class PIXOPS_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 *
 * Unknown mode strings, mismatched kernel data, non-finite or
 * out-of-domain values that cannot be silently clamped.
 */
class PIXOPS_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Unsupported pixel type or channel layout
 */
class PIXOPS_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief File I/O exception
 */
class PIXOPS_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace Pix::Ops
