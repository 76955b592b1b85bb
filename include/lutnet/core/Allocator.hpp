#ifndef LUTNET_CORE_ALLOCATOR_HPP
#define LUTNET_CORE_ALLOCATOR_HPP

#include <cstdlib>
#include <limits>
#include <new>

#include "Defs.hpp"

namespace lutnet {
namespace core {

/**
 * @brief Allocator for table storage.
 *
 * Every block starts on an Alignment boundary. aligned_alloc requires the
 * byte count to be a multiple of the alignment, so requests are padded up;
 * the container still reports the size it asked for.
 */
template <typename T, std::size_t Alignment = kTableAlignment>
class AlignedAllocator {
    static_assert((Alignment & (Alignment - 1)) == 0, "Alignment must be a power of two");

public:
    using value_type = T;
    using size_type = std::size_t;

    template <typename U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() noexcept = default;

    template <typename U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

    static constexpr size_type padded_bytes(size_type n) {
        return ((n * sizeof(T) + Alignment - 1) / Alignment) * Alignment;
    }

    T* allocate(size_type n) {
        if (n > (std::numeric_limits<size_type>::max() - Alignment) / sizeof(T))
            throw std::bad_alloc();

        size_type bytes = padded_bytes(n == 0 ? 1 : n);

#if defined(_MSC_VER)
        void* p = _aligned_malloc(bytes, Alignment);
#else
        void* p = std::aligned_alloc(Alignment, bytes);
#endif
        if (!p) throw std::bad_alloc();
        return static_cast<T*>(p);
    }

    void deallocate(T* p, size_type) noexcept {
#if defined(_MSC_VER)
        _aligned_free(p);
#else
        std::free(p);
#endif
    }
};

template <typename T, typename U, std::size_t Alignment>
bool operator==(const AlignedAllocator<T, Alignment>&, const AlignedAllocator<U, Alignment>&) noexcept {
    return true;
}

template <typename T, typename U, std::size_t Alignment>
bool operator!=(const AlignedAllocator<T, Alignment>&, const AlignedAllocator<U, Alignment>&) noexcept {
    return false;
}

} // namespace core
} // namespace lutnet

#endif // LUTNET_CORE_ALLOCATOR_HPP
