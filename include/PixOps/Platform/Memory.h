#pragma once

/**
 * @file Memory.h
 * @brief Aligned allocation for pixel and scratch buffers
 */

#include <PixOps/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace Pix::Ops::Platform {

/**
 * @brief Allocate aligned memory
 * @return Pointer to aligned memory, or nullptr if size is 0 or allocation fails
 */
void* AlignedAlloc(size_t size, size_t alignment = MEMORY_ALIGNMENT);

/// Free memory returned by AlignedAlloc (nullptr is ignored)
void AlignedFree(void* ptr);

/// Round size up to a multiple of alignment (power of two)
inline size_t AlignedSize(size_t size, size_t alignment = MEMORY_ALIGNMENT) {
    return (size + alignment - 1) & ~(alignment - 1);
}

struct AlignedDeleter {
    void operator()(void* ptr) const {
        AlignedFree(ptr);
    }
};

template<typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter>;

/**
 * @brief Allocate a zero-initialized aligned scratch array
 * @throws std::bad_alloc on failure
 */
template<typename T>
AlignedPtr<T> AllocateScratch(size_t count) {
    if (count == 0) {
        return AlignedPtr<T>();
    }
    void* raw = AlignedAlloc(count * sizeof(T), MEMORY_ALIGNMENT);
    if (raw == nullptr) {
        throw std::bad_alloc();
    }
    T* ptr = static_cast<T*>(raw);
    for (size_t i = 0; i < count; ++i) {
        ptr[i] = T();
    }
    return AlignedPtr<T>(ptr);
}

} // namespace Pix::Ops::Platform
