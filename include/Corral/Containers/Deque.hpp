/// @file Deque.hpp
/// @brief Double-ended queue on a circular buffer, growable or bounded, with fail-fast cursors.
///
/// Semantics / constraints:
/// - Elements live in a ring of raw slots. The front element is at `head`, the back element at
///   `(head + count - 1)` wrapped by the capacity. Occupancy is derived from `head` and `count` only.
/// - `DequeCapacity::Growable` doubles the ring when a push finds it full (power-of-two capacity, >= 8).
///   `DequeCapacity::Bounded` keeps exactly the requested capacity and refuses pushes when full.
/// - Null-equivalent elements (see NullTraits.hpp) are never stored: every push form, including
///   the `Try*` forms, throws `InvalidElementException` before touching the deque.
/// - The generation counter is bumped on every push, pop, removal, regrowth and on clearing a
///   non-empty deque. Peeks and writes through references are not structural.
/// - Not synchronized. See Iteration.hpp for the threading contract.
#pragma once

#include <Corral/Defines.hpp>
#include <Corral/Primitives.hpp>
#include <Corral/Containers/Iteration.hpp>
#include <Corral/Containers/NullTraits.hpp>
#include <Corral/Exceptions/ContainerExceptions.hpp>
#include <Corral/Memory/AllocatorConcept.hpp>
#include <Corral/Memory/StorageFor.hpp>
#include <Corral/Memory/SystemAllocator.hpp>
#include <Corral/Utilities/Expected.hpp>
#include <Corral/Utilities/Optional.hpp>

#include <bit>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <limits>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Corral::Containers
{
    enum class DequeCapacity : UInt8
    {
        /// Doubles its storage whenever a push finds it full.
        Growable,
        /// Fixed capacity; pushes fail when full.
        Bounded,
    };

    /// @brief Construction-time configuration of a deque. Immutable once the deque exists.
    struct DequeOptions
    {
        /// Growable: rounded up to a power of two, never below 8. Bounded: the exact capacity, must be > 0.
        UIntSize      initialCapacity {8};
        DequeCapacity capacity {DequeCapacity::Growable};
    };

    template<class DequeType, bool Descending>
    class DequeCursor;

    template<class DequeType, bool Descending>
    class DequeIterator;

    template<class T, Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class Deque
    {
        static_assert(!std::is_reference_v<T>, "Deque<T&> is not supported.");

    public:
        using value_type     = T;
        using allocator_type = AllocatorType;
        using size_type      = UIntSize;

        using Cursor                = DequeCursor<Deque, false>;
        using ConstCursor           = DequeCursor<const Deque, false>;
        using DescendingCursor      = DequeCursor<Deque, true>;
        using ConstDescendingCursor = DequeCursor<const Deque, true>;
        using Iterator              = DequeIterator<Deque, false>;
        using ConstIterator         = DequeIterator<const Deque, false>;

        static constexpr UIntSize kMinimumCapacity = 8;

        Deque()
            : Deque(DequeOptions {})
        {
        }

        explicit Deque(const DequeOptions& options, const AllocatorType& allocator = AllocatorType {})
            : m_allocator(allocator), m_mode(options.capacity)
        {
            if (m_mode == DequeCapacity::Bounded)
            {
                if (options.initialCapacity == 0)
                    throw std::invalid_argument("Deque: bounded capacity must be greater than zero");
                m_initialCapacity = options.initialCapacity;
            }
            else
            {
                m_initialCapacity = RoundGrowable_(options.initialCapacity);
            }
            Allocate_(m_initialCapacity);
        }

        Deque(const Deque& other)
            requires(std::is_copy_constructible_v<T>)
            : m_allocator(other.m_allocator), m_initialCapacity(other.m_initialCapacity), m_mode(other.m_mode)
        {
            Allocate_(other.m_capacity ? other.m_capacity : other.m_initialCapacity);
            try
            {
                for (; m_count < other.m_count; ++m_count)
                    m_slots[m_count].Construct(other.Slot_(m_count));
            }
            catch (...)
            {
                Release_();
                throw;
            }
        }

        Deque(Deque&& other) noexcept
            : m_allocator(std::move(other.m_allocator)),
              m_slots(other.m_slots),
              m_head(other.m_head),
              m_count(other.m_count),
              m_capacity(other.m_capacity),
              m_initialCapacity(other.m_initialCapacity),
              m_mode(other.m_mode)
        {
            other.m_slots    = nullptr;
            other.m_head     = 0;
            other.m_count    = 0;
            other.m_capacity = 0;
            ++other.m_generation;
        }

        Deque& operator=(const Deque& other)
            requires(std::is_copy_constructible_v<T>)
        {
            if (this == &other)
                return *this;
            Deque copy(other);
            *this = std::move(copy);
            return *this;
        }

        Deque& operator=(Deque&& other) noexcept
        {
            if (this == &other)
                return *this;
            Release_();
            m_allocator       = std::move(other.m_allocator);
            m_slots           = other.m_slots;
            m_head            = other.m_head;
            m_count           = other.m_count;
            m_capacity        = other.m_capacity;
            m_initialCapacity = other.m_initialCapacity;
            m_mode            = other.m_mode;
            ++m_generation;

            other.m_slots    = nullptr;
            other.m_head     = 0;
            other.m_count    = 0;
            other.m_capacity = 0;
            ++other.m_generation;
            return *this;
        }

        ~Deque() { Release_(); }

        //--------------------------------------------------------------------------
        // Throwing forms
        //--------------------------------------------------------------------------

        /// @throws InvalidElementException for a null-equivalent element.
        /// @throws FullContainerException when a bounded deque is full.
        void PushFront(const T& value) { PushFront_(value); }
        void PushFront(T&& value) { PushFront_(std::move(value)); }

        void PushBack(const T& value) { PushBack_(value); }
        void PushBack(T&& value) { PushBack_(std::move(value)); }

        /// @throws EmptyContainerException when empty.
        T PopFront()
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PopFront: deque is empty");
            return TakeFront_();
        }

        T PopBack()
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PopBack: deque is empty");
            return TakeBack_();
        }

        T& PeekFront()
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PeekFront: deque is empty");
            return Slot_(0);
        }

        const T& PeekFront() const
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PeekFront: deque is empty");
            return Slot_(0);
        }

        T& PeekBack()
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PeekBack: deque is empty");
            return Slot_(m_count - 1);
        }

        const T& PeekBack() const
        {
            if (CORRAL_UNLIKELY(m_count == 0))
                throw Exceptions::EmptyContainerException("Deque::PeekBack: deque is empty");
            return Slot_(m_count - 1);
        }

        //--------------------------------------------------------------------------
        // Sentinel forms
        //--------------------------------------------------------------------------

        /// @return false when a bounded deque is full.
        /// @throws InvalidElementException for a null-equivalent element.
        bool TryPushFront(const T& value) { return InsertFront_(value); }
        bool TryPushFront(T&& value) { return InsertFront_(std::move(value)); }

        bool TryPushBack(const T& value) { return InsertBack_(value); }
        bool TryPushBack(T&& value) { return InsertBack_(std::move(value)); }

        Utilities::Optional<T> TryPopFront()
        {
            if (m_count == 0)
                return {};
            return Utilities::Optional<T> {TakeFront_()};
        }

        Utilities::Optional<T> TryPopBack()
        {
            if (m_count == 0)
                return {};
            return Utilities::Optional<T> {TakeBack_()};
        }

        [[nodiscard]] T* TryPeekFront() noexcept { return m_count ? &Slot_(0) : nullptr; }
        [[nodiscard]] const T* TryPeekFront() const noexcept { return m_count ? &Slot_(0) : nullptr; }
        [[nodiscard]] T* TryPeekBack() noexcept { return m_count ? &Slot_(m_count - 1) : nullptr; }
        [[nodiscard]] const T* TryPeekBack() const noexcept { return m_count ? &Slot_(m_count - 1) : nullptr; }

        //--------------------------------------------------------------------------
        // Element access and removal
        //--------------------------------------------------------------------------

        /// @brief Element at logical position `index`, 0 being the front.
        [[nodiscard]] T& At(UIntSize index)
        {
            if (index >= m_count)
                throw std::out_of_range("Deque::At: index out of range");
            return Slot_(index);
        }

        [[nodiscard]] const T& At(UIntSize index) const
        {
            if (index >= m_count)
                throw std::out_of_range("Deque::At: index out of range");
            return Slot_(index);
        }

        [[nodiscard]] bool Contains(const T& value) const
        {
            for (UIntSize i = 0; i < m_count; ++i)
            {
                if (Slot_(i) == value)
                    return true;
            }
            return false;
        }

        /// @brief Removes the element closest to the front that equals `value`.
        bool RemoveFirstOccurrence(const T& value)
        {
            for (UIntSize i = 0; i < m_count; ++i)
            {
                if (Slot_(i) == value)
                {
                    EraseAt_(i);
                    return true;
                }
            }
            return false;
        }

        /// @brief Removes the element closest to the back that equals `value`.
        bool RemoveLastOccurrence(const T& value)
        {
            for (UIntSize i = m_count; i > 0; --i)
            {
                if (Slot_(i - 1) == value)
                {
                    EraseAt_(i - 1);
                    return true;
                }
            }
            return false;
        }

        void Clear() noexcept
        {
            if (m_count == 0)
                return;
            DestroyAll_();
            ++m_generation;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] CORRAL_ALWAYS_INLINE UIntSize Size() const noexcept { return m_count; }
        [[nodiscard]] CORRAL_ALWAYS_INLINE bool IsEmpty() const noexcept { return m_count == 0; }
        [[nodiscard]] CORRAL_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] DequeCapacity Mode() const noexcept { return m_mode; }

        /// @brief Always false for a growable deque.
        [[nodiscard]] bool IsFull() const noexcept
        {
            return m_mode == DequeCapacity::Bounded && m_count == m_initialCapacity;
        }

        /// @brief Grows the ring so that `count` elements fit without further regrowth.
        /// @throws std::length_error when a bounded deque cannot hold `count` elements.
        void Reserve(UIntSize count)
        {
            if (m_mode == DequeCapacity::Bounded)
            {
                if (count > m_initialCapacity)
                    throw std::length_error("Deque::Reserve: exceeds bounded capacity");
                if (!m_slots)
                    Allocate_(m_initialCapacity);
                return;
            }
            if (count <= m_capacity)
                return;
            Regrow_(RoundGrowable_(count));
        }

        [[nodiscard]] Generation GetGeneration() const noexcept { return m_generation; }
        [[nodiscard]] const Generation& GenerationCounter() const noexcept { return m_generation; }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }

        //--------------------------------------------------------------------------
        // Iteration
        //--------------------------------------------------------------------------

        /// @brief Fail-fast cursor from front to back.
        [[nodiscard]] Cursor Iterate() noexcept { return Cursor(*this); }
        [[nodiscard]] ConstCursor Iterate() const noexcept { return ConstCursor(*this); }

        /// @brief Fail-fast cursor from back to front.
        [[nodiscard]] DescendingCursor IterateDescending() noexcept { return DescendingCursor(*this); }
        [[nodiscard]] ConstDescendingCursor IterateDescending() const noexcept { return ConstDescendingCursor(*this); }

        Iterator begin() { return Iterator(*this); }
        Iterator end() noexcept { return Iterator(); }
        ConstIterator begin() const { return ConstIterator(*this); }
        ConstIterator end() const noexcept { return ConstIterator(); }

        friend bool operator==(const Deque& lhs, const Deque& rhs)
            requires requires(const T& a, const T& b) { { a == b } -> std::convertible_to<bool>; }
        {
            if (lhs.m_count != rhs.m_count)
                return false;
            for (UIntSize i = 0; i < lhs.m_count; ++i)
            {
                if (!(lhs.Slot_(i) == rhs.Slot_(i)))
                    return false;
            }
            return true;
        }

    private:
        template<class, bool>
        friend class DequeCursor;

        using Slot = Memory::StorageFor<T>;

        [[nodiscard]] static UIntSize RoundGrowable_(UIntSize requested)
        {
            if (requested > (std::numeric_limits<UIntSize>::max() >> 1))
                throw std::length_error("Deque: capacity overflow");
            if (requested < kMinimumCapacity)
                return kMinimumCapacity;
            return std::bit_ceil(requested);
        }

        [[nodiscard]] UIntSize Physical_(UIntSize logical) const noexcept
        {
            const UIntSize index = m_head + logical;
            return index >= m_capacity ? index - m_capacity : index;
        }

        T& Slot_(UIntSize logical) noexcept { return m_slots[Physical_(logical)].Ref(); }
        const T& Slot_(UIntSize logical) const noexcept { return m_slots[Physical_(logical)].Ref(); }

        [[nodiscard]] Slot* AllocateSlots_(UIntSize capacity)
        {
            if (capacity > Memory::AllocatorTraits<AllocatorType>::template MaxElements<Slot>(m_allocator))
                throw std::bad_alloc();
            void* mem = m_allocator.Allocate(capacity * sizeof(Slot), alignof(Slot));
            if (!mem)
                throw std::bad_alloc();
            return static_cast<Slot*>(mem);
        }

        void Allocate_(UIntSize capacity)
        {
            m_slots    = AllocateSlots_(capacity);
            m_capacity = capacity;
            m_head     = 0;
        }

        void ReleaseSlots_(Slot* slots, UIntSize capacity) noexcept
        {
            m_allocator.Deallocate(slots, capacity * sizeof(Slot), alignof(Slot));
        }

        /// Moves the elements into `newSlots` from index `offset` on, front element first.
        /// On failure the slots built so far are destroyed and the exception is rethrown.
        void RelocateInto_(Slot* newSlots, UIntSize offset)
        {
            UIntSize moved = 0;
            try
            {
                for (; moved < m_count; ++moved)
                    newSlots[offset + moved].Construct(std::move(Slot_(moved)));
            }
            catch (...)
            {
                for (UIntSize j = 0; j < moved; ++j)
                    newSlots[offset + j].Destroy();
                throw;
            }
        }

        /// Destroys the old ring and takes over `newSlots`, whose front element sits at index 0.
        void Adopt_(Slot* newSlots, UIntSize newCapacity) noexcept
        {
            for (UIntSize i = 0; i < m_count; ++i)
                m_slots[Physical_(i)].Destroy();
            if (m_slots)
                ReleaseSlots_(m_slots, m_capacity);
            m_slots    = newSlots;
            m_capacity = newCapacity;
            m_head     = 0;
            ++m_generation;
        }

        void Regrow_(UIntSize newCapacity)
        {
            Slot* newSlots = AllocateSlots_(newCapacity);
            try
            {
                RelocateInto_(newSlots, 0);
            }
            catch (...)
            {
                ReleaseSlots_(newSlots, newCapacity);
                throw;
            }
            Adopt_(newSlots, newCapacity);
        }

        /// Doubles a full ring while inserting `value` at the front or the back.
        /// `value` is constructed in the new ring before the old one is released, so it may refer
        /// to an element of this deque.
        template<class V>
        void GrowAndLink_(V&& value, bool front)
        {
            if (m_capacity > (std::numeric_limits<UIntSize>::max() >> 2))
                throw std::length_error("Deque: capacity overflow");

            const UIntSize newCapacity = m_capacity * 2;
            const UIntSize at          = front ? 0 : m_count;
            Slot*          newSlots    = AllocateSlots_(newCapacity);
            try
            {
                newSlots[at].Construct(std::forward<V>(value));
            }
            catch (...)
            {
                ReleaseSlots_(newSlots, newCapacity);
                throw;
            }
            try
            {
                RelocateInto_(newSlots, front ? 1 : 0);
            }
            catch (...)
            {
                newSlots[at].Destroy();
                ReleaseSlots_(newSlots, newCapacity);
                throw;
            }
            Adopt_(newSlots, newCapacity);
            ++m_count;
            ++m_generation;
        }

        enum class Room : UInt8
        {
            Available,
            Full,
            MustGrow,
        };

        /// Validates the element and reports whether a slot is free.
        [[nodiscard]] Room PrepareInsert_(const T& value)
        {
            if (IsNullEquivalent(value))
                throw Exceptions::InvalidElementException("Deque: null-equivalent elements cannot be stored");
            if (!m_slots)
                Allocate_(m_initialCapacity);
            if (m_count < m_capacity)
                return Room::Available;
            return m_mode == DequeCapacity::Bounded ? Room::Full : Room::MustGrow;
        }

        template<class V>
        bool InsertFront_(V&& value)
        {
            switch (PrepareInsert_(value))
            {
                case Room::Full:
                    return false;
                case Room::MustGrow:
                    GrowAndLink_(std::forward<V>(value), true);
                    return true;
                case Room::Available:
                    break;
            }
            LinkFront_(std::forward<V>(value));
            return true;
        }

        template<class V>
        bool InsertBack_(V&& value)
        {
            switch (PrepareInsert_(value))
            {
                case Room::Full:
                    return false;
                case Room::MustGrow:
                    GrowAndLink_(std::forward<V>(value), false);
                    return true;
                case Room::Available:
                    break;
            }
            LinkBack_(std::forward<V>(value));
            return true;
        }

        template<class V>
        void PushFront_(V&& value)
        {
            if (!InsertFront_(std::forward<V>(value)))
                throw Exceptions::FullContainerException("Deque::PushFront: bounded deque is full");
        }

        template<class V>
        void PushBack_(V&& value)
        {
            if (!InsertBack_(std::forward<V>(value)))
                throw Exceptions::FullContainerException("Deque::PushBack: bounded deque is full");
        }

        template<class V>
        void LinkFront_(V&& value)
        {
            const UIntSize head = m_head == 0 ? m_capacity - 1 : m_head - 1;
            m_slots[head].Construct(std::forward<V>(value));
            m_head = head;
            ++m_count;
            ++m_generation;
        }

        template<class V>
        void LinkBack_(V&& value)
        {
            m_slots[Physical_(m_count)].Construct(std::forward<V>(value));
            ++m_count;
            ++m_generation;
        }

        T TakeFront_()
        {
            Slot& slot = m_slots[m_head];
            T     value(std::move(slot.Ref()));
            slot.Destroy();
            m_head = m_head + 1 == m_capacity ? 0 : m_head + 1;
            --m_count;
            ++m_generation;
            return value;
        }

        T TakeBack_()
        {
            Slot& slot = m_slots[Physical_(m_count - 1)];
            T     value(std::move(slot.Ref()));
            slot.Destroy();
            --m_count;
            ++m_generation;
            return value;
        }

        /// Removes the element at logical `index` by shifting the shorter side over it.
        /// Elements after `index` end up one logical position lower; those before keep theirs.
        void EraseAt_(UIntSize index)
        {
            if (index < m_count / 2)
            {
                for (UIntSize i = index; i > 0; --i)
                    Slot_(i) = std::move(Slot_(i - 1));
                m_slots[m_head].Destroy();
                m_head = m_head + 1 == m_capacity ? 0 : m_head + 1;
            }
            else
            {
                for (UIntSize i = index; i + 1 < m_count; ++i)
                    Slot_(i) = std::move(Slot_(i + 1));
                m_slots[Physical_(m_count - 1)].Destroy();
            }
            --m_count;
            ++m_generation;
        }

        void DestroyAll_() noexcept
        {
            for (UIntSize i = 0; i < m_count; ++i)
                m_slots[Physical_(i)].Destroy();
            m_count = 0;
            m_head  = 0;
        }

        void Release_() noexcept
        {
            DestroyAll_();
            if (m_slots)
                ReleaseSlots_(m_slots, m_capacity);
            m_slots    = nullptr;
            m_capacity = 0;
        }

        [[no_unique_address]] AllocatorType m_allocator;

        Slot*         m_slots {nullptr};
        UIntSize      m_head {0};
        UIntSize      m_count {0};
        UIntSize      m_capacity {0};
        UIntSize      m_initialCapacity {kMinimumCapacity};
        DequeCapacity m_mode {DequeCapacity::Growable};
        Generation    m_generation {0};
    };

    /// @brief Fail-fast cursor over a deque, front to back or back to front.
    ///
    /// Same contract as the hash table cursors: `Next()` yields a pointer, `nullptr` when exhausted,
    /// or `IterationError::ConcurrentModification` after a structural change made elsewhere.
    template<class DequeType, bool Descending>
    class DequeCursor
    {
        using Element = std::conditional_t<std::is_const_v<DequeType>,
                                           const typename std::remove_const_t<DequeType>::value_type,
                                           typename std::remove_const_t<DequeType>::value_type>;

    public:
        using ElementType  = Element;
        using NextResult   = Utilities::Expected<Element*, IterationError>;
        using RemoveResult = Utilities::Expected<void, IterationError>;

        DequeCursor() noexcept = default;

        explicit DequeCursor(DequeType& deque) noexcept
            : m_deque(&deque), m_guard(deque.GenerationCounter()), m_next(Descending ? deque.Size() : 0)
        {
        }

        NextResult Next() noexcept
        {
            if (m_state == IteratorState::Invalidated)
                return NextResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            if (m_state == IteratorState::Exhausted)
                return NextResult {static_cast<Element*>(nullptr)};
            if (!m_guard.IsCurrent())
            {
                m_state      = IteratorState::Invalidated;
                m_hasCurrent = false;
                return NextResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            }

            if constexpr (Descending)
            {
                if (m_next == 0)
                    return Exhaust_();
                m_current = --m_next;
            }
            else
            {
                if (m_next >= m_deque->Size())
                    return Exhaust_();
                m_current = m_next++;
            }
            m_hasCurrent = true;
            return NextResult {&m_deque->Slot_(m_current)};
        }

        /// @brief Removes the element last returned by `Next()` without invalidating this cursor.
        RemoveResult Remove()
            requires(!std::is_const_v<DequeType>)
        {
            if (m_state == IteratorState::Invalidated)
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            if (!m_guard.IsCurrent())
            {
                m_state      = IteratorState::Invalidated;
                m_hasCurrent = false;
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            }
            if (!m_hasCurrent)
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::NoCurrentElement}};

            m_deque->EraseAt_(m_current);
            if constexpr (!Descending)
                m_next = m_current;
            m_hasCurrent = false;
            m_guard.Resync();
            return RemoveResult {};
        }

        [[nodiscard]] IteratorState GetState() const noexcept { return m_state; }

    private:
        NextResult Exhaust_() noexcept
        {
            m_state      = IteratorState::Exhausted;
            m_hasCurrent = false;
            return NextResult {static_cast<Element*>(nullptr)};
        }

        DequeType*      m_deque {nullptr};
        GenerationGuard m_guard {};
        UIntSize        m_next {0};
        UIntSize        m_current {0};
        bool            m_hasCurrent {false};
        IteratorState   m_state {IteratorState::Active};
    };

    /// @brief Range-for adapter over a deque cursor; throws `ConcurrentModificationException`
    /// where the cursor would report `IterationError::ConcurrentModification`.
    template<class DequeType, bool Descending>
    class DequeIterator
    {
    public:
        using Cursor            = DequeCursor<DequeType, Descending>;
        using Element           = typename Cursor::ElementType;
        using difference_type   = std::ptrdiff_t;
        using value_type        = std::remove_const_t<Element>;
        using reference         = Element&;
        using pointer           = Element*;
        using iterator_category = std::input_iterator_tag;

        DequeIterator() noexcept = default;

        explicit DequeIterator(DequeType& deque)
            : m_cursor(deque)
        {
            Advance_();
        }

        reference operator*() const noexcept { return *m_element; }
        pointer operator->() const noexcept { return m_element; }

        DequeIterator& operator++()
        {
            Advance_();
            return *this;
        }

        bool operator==(const DequeIterator& other) const noexcept { return m_element == other.m_element; }
        bool operator!=(const DequeIterator& other) const noexcept { return !(*this == other); }

    private:
        void Advance_()
        {
            auto next = m_cursor.Next();
            if (!next)
                throw Exceptions::ConcurrentModificationException();
            m_element = next.Value();
        }

        Cursor   m_cursor {};
        Element* m_element {nullptr};
    };
}// namespace Corral::Containers
