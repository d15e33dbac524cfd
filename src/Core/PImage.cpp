#include <PixOps/Core/PImage.h>
#include <PixOps/Core/Exception.h>
#include <PixOps/Platform/Memory.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <vector>

// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Pix::Ops {

// =============================================================================
// Implementation class
// =============================================================================

class PImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    PixelType type_ = PixelType::UInt8;
    ChannelType channelType_ = ChannelType::Gray;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t BytesPerPixel() const {
        size_t channelSize = (type_ == PixelType::Float32) ? 4 : 1;
        size_t numChannels = (channelType_ == ChannelType::Gray) ? 1 : 3;
        return channelSize * numChannels;
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;

        stride_ = Platform::AlignedSize(static_cast<size_t>(w) * BytesPerPixel(),
                                        MEMORY_ALIGNMENT);
        size_t totalSize = stride_ * static_cast<size_t>(h);

        uint8_t* ptr = static_cast<uint8_t*>(
            Platform::AlignedAlloc(totalSize, MEMORY_ALIGNMENT));

        if (!ptr) {
            throw std::bad_alloc();
        }

        data_ = std::shared_ptr<uint8_t>(ptr, Platform::AlignedDeleter{});
        std::memset(ptr, 0, totalSize);
    }
};

// =============================================================================
// Constructors
// =============================================================================

PImage::PImage() : impl_(std::make_shared<Impl>()) {}

PImage::PImage(int32_t width, int32_t height, PixelType type, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }

    impl_->type_ = type;
    impl_->channelType_ = channels;
    impl_->Allocate(width, height);
}

PImage::PImage(const PImage& other) = default;
PImage::PImage(PImage&& other) noexcept = default;
PImage::~PImage() = default;
PImage& PImage::operator=(const PImage& other) = default;
PImage& PImage::operator=(PImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

PImage PImage::FromFile(const std::string& path) {
    int w, h, fileChannels;
    if (!stbi_info(path.c_str(), &w, &h, &fileChannels)) {
        throw IOException("Failed to load image: " + path);
    }

    // Alpha is dropped: gray+alpha -> gray, RGBA -> RGB
    int channels = (fileChannels <= 2) ? 1 : 3;
    std::unique_ptr<uint8_t, decltype(&stbi_image_free)> data(
        stbi_load(path.c_str(), &w, &h, &fileChannels, channels), &stbi_image_free);
    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    PImage img;
    img.impl_->type_ = PixelType::UInt8;
    img.impl_->channelType_ = (channels == 1) ? ChannelType::Gray : ChannelType::RGB;
    img.impl_->Allocate(w, h);

    // Copy row by row (handle stride)
    size_t srcStride = static_cast<size_t>(w) * channels;
    for (int32_t y = 0; y < h; ++y) {
        std::memcpy(img.RowPtr(y), data.get() + y * srcStride, srcStride);
    }

    return img;
}

PImage PImage::FromData(const void* data, int32_t width, int32_t height,
                        PixelType type, ChannelType channels) {
    if (data == nullptr) {
        throw InvalidArgumentException("FromData: data is null");
    }

    PImage img(width, height, type, channels);

    size_t srcStride = static_cast<size_t>(width) * img.impl_->BytesPerPixel();

    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), src + y * srcStride, srcStride);
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t PImage::Width() const { return impl_->width_; }
int32_t PImage::Height() const { return impl_->height_; }
PixelType PImage::Type() const { return impl_->type_; }
ChannelType PImage::GetChannelType() const { return impl_->channelType_; }
Size2i PImage::Size() const { return Size2i(impl_->width_, impl_->height_); }
size_t PImage::Stride() const { return impl_->stride_; }
size_t PImage::BytesPerPixel() const { return impl_->BytesPerPixel(); }
bool PImage::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool PImage::IsValid() const { return impl_->data_ != nullptr && !Empty(); }

int PImage::Channels() const {
    return (impl_->channelType_ == ChannelType::Gray) ? 1 : 3;
}

// =============================================================================
// Data Access
// =============================================================================

void* PImage::Data() { return impl_->data_.get(); }
const void* PImage::Data() const { return impl_->data_.get(); }

void* PImage::RowPtr(int32_t row) {
    return impl_->data_.get() + row * impl_->stride_;
}

const void* PImage::RowPtr(int32_t row) const {
    return impl_->data_.get() + row * impl_->stride_;
}

uint8_t PImage::At(int32_t x, int32_t y) const {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("At() only supports UInt8 grayscale");
    }
    return static_cast<const uint8_t*>(RowPtr(y))[x];
}

void PImage::SetAt(int32_t x, int32_t y, uint8_t value) {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("SetAt() only supports UInt8 grayscale");
    }
    static_cast<uint8_t*>(RowPtr(y))[x] = value;
}

void PImage::Fill(uint8_t value) {
    if (impl_->type_ != PixelType::UInt8) {
        throw UnsupportedException("Fill() only supports UInt8 images");
    }
    size_t rowBytes = static_cast<size_t>(impl_->width_) * BytesPerPixel();
    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memset(RowPtr(y), value, rowBytes);
    }
}

// =============================================================================
// Image Operations
// =============================================================================

PImage PImage::Clone() const {
    if (Empty()) {
        return PImage();
    }

    PImage copy(impl_->width_, impl_->height_,
                impl_->type_, impl_->channelType_);

    size_t rowBytes = static_cast<size_t>(impl_->width_) * impl_->BytesPerPixel();
    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(copy.RowPtr(y), RowPtr(y), rowBytes);
    }

    return copy;
}

bool PImage::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // Only UInt8 can be encoded
    if (impl_->type_ != PixelType::UInt8) {
        return false;
    }

    int channels = Channels();
    int32_t w = impl_->width_;
    int32_t h = impl_->height_;

    // Create contiguous RGB/gray buffer
    std::vector<uint8_t> buffer(static_cast<size_t>(w) * h * channels);
    size_t dstStride = static_cast<size_t>(w) * channels;
    bool swapRB = impl_->channelType_ == ChannelType::BGR;

    for (int32_t y = 0; y < h; ++y) {
        const uint8_t* src = static_cast<const uint8_t*>(RowPtr(y));
        uint8_t* dst = buffer.data() + y * dstStride;
        std::memcpy(dst, src, dstStride);
        if (swapRB) {
            for (int32_t x = 0; x < w; ++x) {
                std::swap(dst[x * 3], dst[x * 3 + 2]);
            }
        }
    }

    std::string ext;
    size_t dot = path.find_last_of('.');
    if (dot != std::string::npos) {
        ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    if (ext == "jpg" || ext == "jpeg") {
        return stbi_write_jpg(path.c_str(), w, h, channels, buffer.data(), 95) != 0;
    } else if (ext == "bmp") {
        return stbi_write_bmp(path.c_str(), w, h, channels, buffer.data()) != 0;
    }

    // Default to PNG
    return stbi_write_png(path.c_str(), w, h, channels, buffer.data(),
                          static_cast<int>(dstStride)) != 0;
}

} // namespace Pix::Ops
