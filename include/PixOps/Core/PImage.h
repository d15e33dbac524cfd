#pragma once

/**
 * @file PImage.h
 * @brief Pixel buffer container
 */

#include <PixOps/Core/Types.h>
#include <PixOps/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Pix::Ops {

/**
 * @brief 2D pixel buffer (grayscale or 3-channel interleaved)
 *
 * Key features:
 * - UInt8 samples for all operation results, Float32 for auxiliary data
 * - 64-byte row alignment, always address rows through RowPtr()
 * - Shallow copy by default, Clone() for deep copy
 *
 * Operations take a const reference and write a freshly allocated
 * output, so a buffer shared by several handles is never modified
 * by the library.
 */
class PIXOPS_API PImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    PImage();

    /// Create zero-filled image with specified dimensions and type
    PImage(int32_t width, int32_t height,
           PixelType type = PixelType::UInt8,
           ChannelType channels = ChannelType::Gray);

    PImage(const PImage& other);
    PImage(PImage&& other) noexcept;
    ~PImage();
    PImage& operator=(const PImage& other);
    PImage& operator=(PImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Load image from file (PNG, JPEG, BMP, ...)
     *
     * Gray+alpha files load as Gray, RGBA files load as RGB.
     * @throws IOException if the file cannot be decoded
     */
    static PImage FromFile(const std::string& path);

    /// Create from tightly packed raw data (copies data)
    static PImage FromData(const void* data, int32_t width, int32_t height,
                           PixelType type = PixelType::UInt8,
                           ChannelType channels = ChannelType::Gray);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Width() const;
    int32_t Height() const;

    /// Number of channels (1 or 3)
    int Channels() const;

    PixelType Type() const;
    ChannelType GetChannelType() const;

    /// Image size
    Size2i Size() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    /// Bytes per pixel (all channels)
    size_t BytesPerPixel() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    void* Data();
    const void* Data() const;

    void* RowPtr(int32_t row);
    const void* RowPtr(int32_t row) const;

    /// Get pixel value at (x, y) - single channel UInt8 only
    uint8_t At(int32_t x, int32_t y) const;

    /// Set pixel value at (x, y) - single channel UInt8 only
    void SetAt(int32_t x, int32_t y, uint8_t value);

    /// Fill every sample with a value
    void Fill(uint8_t value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    PImage Clone() const;

    /// Save UInt8 image to file, format from extension (default PNG)
    bool SaveToFile(const std::string& path) const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Pix::Ops
