#include <PixOps/Platform/Memory.h>

#include <cstdlib>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Pix::Ops::Platform {

void* AlignedAlloc(size_t size, size_t alignment) {
    if (size == 0) return nullptr;

#ifdef _MSC_VER
    return _aligned_malloc(size, alignment);
#else
    void* ptr = nullptr;
    if (posix_memalign(&ptr, alignment, AlignedSize(size, alignment)) != 0) {
        return nullptr;
    }
    return ptr;
#endif
}

void AlignedFree(void* ptr) {
    if (ptr == nullptr) return;

#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

} // namespace Pix::Ops::Platform
