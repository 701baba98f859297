/// @file Iteration.hpp
/// @brief Generation counters and the fail-fast cursor protocol shared by every Corral container.
///
/// Every mutable container carries one monotonic `Generation` that is bumped on each structural
/// change (an element added or removed, storage resized). Value-only changes never bump it.
/// A cursor snapshots the generation when it is created and compares it before producing each
/// element: a mismatch moves the cursor to `IteratorState::Invalidated` for good, and the caller
/// must discard it and start over with a fresh cursor. The cursor's own `Remove()` re-snapshots
/// after it mutates the container, so it never invalidates itself.
///
/// Threading: this is detection, not prevention. The counter is a plain integer. Containers and
/// their cursors must be used by a single owner at a time, or behind external synchronization;
/// unsynchronized use from several threads is undefined behavior, not a guaranteed
/// `ConcurrentModification` report.
#pragma once

#include <Corral/Primitives.hpp>

namespace Corral::Containers
{
    using Generation = UInt64;

    enum class IterationError : UInt8
    {
        /// The container was structurally modified by someone other than this cursor.
        ConcurrentModification,
        /// `Remove()` was called before `Next()` produced an element, or twice for the same element.
        NoCurrentElement,
    };

    enum class IteratorState : UInt8
    {
        Active,
        Invalidated,
        Exhausted,
    };

    [[nodiscard]] constexpr const char* ToString(IterationError error) noexcept
    {
        switch (error)
        {
            case IterationError::ConcurrentModification:
                return "ConcurrentModification";
            case IterationError::NoCurrentElement:
                return "NoCurrentElement";
        }
        return "Unknown";
    }

    /// @brief Snapshot of a container's generation counter.
    ///
    /// Holds a non-owning pointer to the counter; it must not outlive the container.
    class GenerationGuard
    {
    public:
        GenerationGuard() noexcept = default;

        explicit GenerationGuard(const Generation& source) noexcept
            : m_source(&source), m_expected(source)
        {
        }

        /// @brief True while no structural change happened since the last snapshot.
        [[nodiscard]] bool IsCurrent() const noexcept { return m_source && *m_source == m_expected; }

        /// @brief Adopts the container's current generation, after a change made by the guard's owner.
        void Resync() noexcept
        {
            if (m_source)
                m_expected = *m_source;
        }

        [[nodiscard]] Generation Expected() const noexcept { return m_expected; }

    private:
        const Generation* m_source {nullptr};
        Generation        m_expected {0};
    };
}// namespace Corral::Containers
