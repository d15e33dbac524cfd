#pragma once

/**
 * @file Validate.h
 * @brief Argument validation helpers shared by all operations
 *
 * Empty input is a silent no-op (the caller returns an empty output),
 * a corrupted image is an error. Value checks format their message as
 * "<func>: <param> must be ...".
 */

#include <PixOps/Core/Exception.h>
#include <PixOps/Core/PImage.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Pix::Ops::Validate {

namespace Detail {

inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::Float32: return "Float32";
        default:                 return "Unknown";
    }
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check image is allocated and valid (no type restriction)
 * @return false if empty (caller should return empty result)
 * @throws InvalidArgumentException if image is invalid
 */
inline bool RequireImageValid(const PImage& image, const char* funcName) {
    if (image.Empty()) {
        return false;
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
    return true;
}

/**
 * @brief Check image has specific pixel type
 * @throws UnsupportedException if type mismatch
 */
inline void RequireImageType(const PImage& image, PixelType expected, const char* funcName) {
    if (image.Type() != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + Detail::PixelTypeName(expected) +
            " image, got " + Detail::PixelTypeName(image.Type()));
    }
}

/**
 * @brief Validate UInt8 image (gray or 3-channel)
 * @return false if empty
 */
inline bool RequireImageU8(const PImage& image, const char* funcName) {
    if (!RequireImageValid(image, funcName)) return false;
    RequireImageType(image, PixelType::UInt8, funcName);
    return true;
}

/**
 * @brief Validate Float32 single-channel image
 * @return false if empty
 */
inline bool RequireImageFloatGray(const PImage& image, const char* funcName) {
    if (!RequireImageValid(image, funcName)) return false;
    RequireImageType(image, PixelType::Float32, funcName);
    if (image.Channels() != 1) {
        throw UnsupportedException(
            std::string(funcName) + ": expected 1 channel(s), got " +
            std::to_string(image.Channels()));
    }
    return true;
}

// =============================================================================
// Value Validation
// =============================================================================

inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite");
    }
}

template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (!(value >= T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

// =============================================================================
// Convenience Macros
// =============================================================================

/**
 * Early return for void functions: clears output and returns on empty input
 */
#define PIXOPS_REQUIRE_IMAGE_U8_VOID(img, out) \
    if (!::Pix::Ops::Validate::RequireImageU8(img, __func__)) { (out) = ::Pix::Ops::PImage(); return; }

/**
 * Early return {} (for result-struct returns)
 */
#define PIXOPS_REQUIRE_IMAGE_U8(img) \
    if (!::Pix::Ops::Validate::RequireImageU8(img, __func__)) return {}

#define PIXOPS_REQUIRE_FINITE(val) \
    ::Pix::Ops::Validate::RequireFinite(static_cast<double>(val), #val, __func__)

#define PIXOPS_REQUIRE_POSITIVE(val) \
    ::Pix::Ops::Validate::RequirePositive(val, #val, __func__)

#define PIXOPS_REQUIRE_NON_NEGATIVE(val) \
    ::Pix::Ops::Validate::RequireNonNegative(val, #val, __func__)

} // namespace Pix::Ops::Validate
