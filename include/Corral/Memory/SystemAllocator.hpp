/// @file SystemAllocator.hpp
/// @brief Default allocator of every Corral container: aligned blocks from the C runtime.
///
/// Containers request three kinds of blocks from it: hash table entries, bucket arrays and deque
/// slot rings. `Allocate` reports failure with `nullptr`; the container turns that into `std::bad_alloc`.
#pragma once

#include <cstddef>
#include <cstdlib>

#include <Corral/Primitives.hpp>

namespace Corral::Memory
{
    struct SystemAllocator
    {
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            alignment = NormalizeAlignment_(alignment);
#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#else
            void* block = nullptr;
            return posix_memalign(&block, alignment, size) == 0 ? block : nullptr;
#endif
        }

        void Deallocate(void* block, UIntSize, UIntSize) noexcept
        {
            if (!block)
                return;
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(block);
#else
            std::free(block);
#endif
        }

        /// Upper bound on a single block; containers divide it by their element size.
        [[nodiscard]] constexpr UIntSize MaxSize() const noexcept { return static_cast<UIntSize>(-1) / 2; }

        /// Stateless: any instance can release a block obtained from another.
        friend constexpr bool operator==(const SystemAllocator&, const SystemAllocator&) noexcept { return true; }

    private:
        [[nodiscard]] static constexpr UIntSize NormalizeAlignment_(UIntSize alignment) noexcept
        {
            if (alignment == 0 || (alignment & (alignment - 1)) != 0)
                return alignof(std::max_align_t);
            return alignment < sizeof(void*) ? sizeof(void*) : alignment;
        }
    };
}// namespace Corral::Memory
