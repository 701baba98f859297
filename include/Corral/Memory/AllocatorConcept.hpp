/// @file AllocatorConcept.hpp
/// @brief Allocator concept and capability traits used by every Corral container.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <type_traits>

namespace Corral::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate may return nullptr on
    // failure; containers translate that into std::bad_alloc.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasMaxSizeCapability = AllocatorReportsMaxSize<A>;

        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
            {
                return allocator.MaxSize();
            }
            else
            {
                return std::numeric_limits<std::size_t>::max();
            }
        }

        /// @brief Element-count limit for an array of `T` from this allocator.
        template<class T>
        static std::size_t MaxElements(const A& allocator) noexcept
        {
            return MaxSize(allocator) / sizeof(T);
        }
    };

}// namespace Corral::Memory
