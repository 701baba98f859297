/// @file TrackingAllocator.hpp
/// @brief Decorator allocator that reports allocation statistics into a caller-owned sink.
///
/// Containers store their allocator by value and copy it along with themselves, so the
/// statistics live outside the decorator: every copy of a `Tracking` allocator reports into
/// the same `AllocationStats`, which stays readable after the container is destroyed.
#pragma once

#include <cstddef>
#include <utility>

#include <Corral/Memory/AllocatorConcept.hpp>

namespace Corral::Memory
{
    struct AllocationStats
    {
        std::size_t currentBytes {0};
        std::size_t peakBytes {0};
        std::size_t totalBytes {0};
        std::size_t currentCount {0};
        std::size_t totalCount {0};
    };

    template<AllocatorConcept Inner>
    class Tracking
    {
    public:
        explicit Tracking(AllocationStats& stats, Inner inner = Inner {})
            : m_inner(std::move(inner)), m_stats(&stats)
        {
        }

        [[nodiscard]] void* Allocate(std::size_t size, std::size_t align) noexcept
        {
            void* p = m_inner.Allocate(size, align);
            if (p)
            {
                m_stats->currentBytes += size;
                m_stats->totalBytes += size;
                m_stats->currentCount += 1;
                m_stats->totalCount += 1;
                if (m_stats->currentBytes > m_stats->peakBytes)
                    m_stats->peakBytes = m_stats->currentBytes;
            }
            return p;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t align) noexcept
        {
            if (ptr)
            {
                if (m_stats->currentBytes >= size)
                    m_stats->currentBytes -= size;
                else
                    m_stats->currentBytes = 0;
                if (m_stats->currentCount > 0)
                    m_stats->currentCount -= 1;
            }
            m_inner.Deallocate(ptr, size, align);
        }

        [[nodiscard]] std::size_t MaxSize() const noexcept
        {
            return AllocatorTraits<Inner>::MaxSize(m_inner);
        }

        [[nodiscard]] const AllocationStats& GetStats() const noexcept
        {
            return *m_stats;
        }

    private:
        [[no_unique_address]] Inner m_inner {};
        AllocationStats*            m_stats;
    };
}// namespace Corral::Memory
