/// @file HashTable.hpp
/// @brief Header-only chained hash table with a null-key slot, allocator support and fail-fast cursors.
///
/// Semantics / constraints:
/// - Capacity is always a power-of-two (>= 16); the bucket of a key is `SpreadHash(hash) & (capacity - 1)`.
/// - Collisions chain: each bucket is a singly linked list of entries, new entries are appended at the tail.
/// - Entries are individually allocated and are never moved by a resize; a resize relinks them.
///   Pointers and references to entries stay valid until that entry is erased.
/// - A key for which `NullTraits<Key>::IsNull` holds is stored in one dedicated slot outside the
///   buckets. It counts towards `Size()`, is found, erased and iterated like any other key, and is
///   never passed to the hasher.
/// - The generation counter is bumped once per structural change: a new key, an erased key, a resize,
///   a clear of a non-empty table, or an assignment. Replacing the value of an existing key never bumps it.
///   A resize is a change of its own, so an insert that triggers one advances the counter by two.
/// - Equivalent keys must produce equal hashes. Violating this is undefined behavior for lookup.
/// - Not synchronized. See Iteration.hpp for the threading contract.

#pragma once

#include <Corral/Defines.hpp>
#include <Corral/Primitives.hpp>
#include <Corral/Containers/Iteration.hpp>
#include <Corral/Containers/NullTraits.hpp>
#include <Corral/Exceptions/ContainerExceptions.hpp>
#include <Corral/Memory/AllocatorConcept.hpp>
#include <Corral/Memory/SystemAllocator.hpp>
#include <Corral/Utilities/Expected.hpp>
#include <Corral/Utilities/Optional.hpp>

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <functional>
#include <iterator>
#include <limits>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Corral::Containers
{
    /// @brief Construction-time configuration of a hash table. Immutable once the table exists.
    struct HashTableOptions
    {
        /// Requested bucket count; rounded up to a power of two, never below 16.
        UIntSize initialCapacity {16};
        /// Resize trigger: the table doubles as soon as `size / capacity` would exceed this.
        F64 maxLoadFactor {0.75};
    };

    namespace detail
    {
        constexpr std::size_t NextPow2(std::size_t value) noexcept
        {
            if (value <= 1)
                return 1;
            return std::bit_ceil(value);
        }

        /// @brief Folds the high half of a hash into the low bits that the bucket mask keeps.
        constexpr std::size_t SpreadHash(std::size_t h) noexcept
        {
            if constexpr (sizeof(std::size_t) > 4)
                h ^= h >> (sizeof(std::size_t) * 4);
            h ^= h >> 16;
            return h;
        }
    }// namespace detail

    template<typename Key,
             typename Value,
             typename Hash                          = std::hash<Key>,
             typename KeyEqual                      = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class HashTable
    {
    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = KeyEqual;
        using allocator_type = AllocatorType;
        using size_type      = std::size_t;

        static constexpr F64       kDefaultMaxLoadFactor = 0.75;
        static constexpr size_type kMinimumCapacity      = 16;
        static constexpr bool      kHasNullKey           = NullTraits<Key>::HasNull;

        /// @brief One key/value pair. Owned by the table; callers only ever see it through pointers.
        class Entry
        {
        public:
            Entry(const Entry&)            = delete;
            Entry& operator=(const Entry&) = delete;

            [[nodiscard]] const Key& GetKey() const noexcept { return m_key; }
            [[nodiscard]] Value& GetValue() noexcept { return m_value; }
            [[nodiscard]] const Value& GetValue() const noexcept { return m_value; }

            /// @brief Replaces the value in place. Not a structural change.
            template<class V>
            void SetValue(V&& value)
            {
                m_value = std::forward<V>(value);
            }

        private:
            friend class HashTable;

            template<class K, class V>
            Entry(std::size_t hash, K&& key, V&& value)
                : m_hash(hash), m_key(std::forward<K>(key)), m_value(std::forward<V>(value))
            {
            }

            ~Entry() = default;

            Entry*      m_next {nullptr};
            std::size_t m_hash;
            Key         m_key;
            Value       m_value;
        };

        HashTable()
            : HashTable(HashTableOptions {})
        {
        }

        explicit HashTable(const HashTableOptions& options,
                           const Hash& hash               = Hash {},
                           const KeyEqual& equal          = KeyEqual {},
                           const AllocatorType& allocator = AllocatorType {})
            : m_hash(hash), m_equal(equal), m_allocator(allocator), m_maxLoadFactor(options.maxLoadFactor)
        {
            if (!(options.maxLoadFactor > 0.0) || !std::isfinite(options.maxLoadFactor))
                throw std::invalid_argument("HashTable: maxLoadFactor must be a positive finite number");
            m_initialCapacity = ClampCapacity_(options.initialCapacity);
            Initialize_(m_initialCapacity);
        }

        HashTable(const HashTable& other)
            requires(std::is_copy_constructible_v<Key> && std::is_copy_constructible_v<Value>)
            : m_hash(other.m_hash),
              m_equal(other.m_equal),
              m_allocator(other.m_allocator),
              m_maxLoadFactor(other.m_maxLoadFactor),
              m_initialCapacity(other.m_initialCapacity)
        {
            Initialize_(other.m_capacity ? other.m_capacity : m_initialCapacity);
            try
            {
                for (const Entry* e = other.FirstEntry(); e; e = other.NextEntry(e))
                    LinkNew_(CreateEntry_(e->m_hash, e->m_key, e->m_value));
            }
            catch (...)
            {
                ReleaseAll_();
                throw;
            }
        }

        HashTable(HashTable&& other) noexcept
            : m_hash(std::move(other.m_hash)),
              m_equal(std::move(other.m_equal)),
              m_allocator(std::move(other.m_allocator)),
              m_buckets(other.m_buckets),
              m_capacity(other.m_capacity),
              m_mask(other.m_mask),
              m_size(other.m_size),
              m_threshold(other.m_threshold),
              m_nullEntry(other.m_nullEntry),
              m_maxLoadFactor(other.m_maxLoadFactor),
              m_initialCapacity(other.m_initialCapacity)
        {
            other.m_buckets   = nullptr;
            other.m_capacity  = 0;
            other.m_mask      = 0;
            other.m_size      = 0;
            other.m_threshold = 0;
            other.m_nullEntry = nullptr;
            ++other.m_generation;
        }

        HashTable& operator=(const HashTable& other)
            requires(std::is_copy_constructible_v<Key> && std::is_copy_constructible_v<Value>)
        {
            if (this == &other)
                return *this;
            HashTable copy(other);
            SwapContents_(copy);
            ++m_generation;
            return *this;
        }

        HashTable& operator=(HashTable&& other) noexcept
        {
            if (this == &other)
                return *this;
            ReleaseAll_();
            m_hash            = std::move(other.m_hash);
            m_equal           = std::move(other.m_equal);
            m_allocator       = std::move(other.m_allocator);
            m_buckets         = other.m_buckets;
            m_capacity        = other.m_capacity;
            m_mask            = other.m_mask;
            m_size            = other.m_size;
            m_threshold       = other.m_threshold;
            m_nullEntry       = other.m_nullEntry;
            m_maxLoadFactor   = other.m_maxLoadFactor;
            m_initialCapacity = other.m_initialCapacity;
            ++m_generation;

            other.m_buckets   = nullptr;
            other.m_capacity  = 0;
            other.m_mask      = 0;
            other.m_size      = 0;
            other.m_threshold = 0;
            other.m_nullEntry = nullptr;
            ++other.m_generation;
            return *this;
        }

        ~HashTable() { ReleaseAll_(); }

        //--------------------------------------------------------------------------
        // Core ops
        //--------------------------------------------------------------------------

        /// @brief Inserts `key` or replaces its value.
        /// @return The previous value when `key` was present, empty when it was inserted.
        template<class K, class V>
        Utilities::Optional<Value> Upsert(K&& key, V&& value)
        {
            if constexpr (!std::is_same_v<std::remove_cvref_t<K>, Key>)
            {
                return Upsert(Key(std::forward<K>(key)), std::forward<V>(value));
            }
            else
            {
                const std::size_t h = HashOf_(key);
                if (Entry* e = FindEntry_(key, h))
                {
                    Value                      replacement(std::forward<V>(value));
                    Utilities::Optional<Value> previous {std::move(e->m_value)};
                    e->m_value = std::move(replacement);
                    return previous;
                }
                InsertNew_(h, std::forward<K>(key), std::forward<V>(value));
                return {};
            }
        }

        /// @brief Returns the entry for `key`, inserting one built from `makeValue()` when absent.
        ///
        /// `makeValue` runs at most once and only when `key` is absent. If it throws, the table is
        /// unchanged. If it structurally modifies this table, `ConcurrentModificationException` is thrown
        /// and nothing is inserted.
        ///
        /// @return The entry and whether it was inserted by this call.
        template<class K, class Factory>
        std::pair<Entry*, bool> FindOrInsert(K&& key, Factory&& makeValue)
        {
            if constexpr (!std::is_same_v<std::remove_cvref_t<K>, Key>)
            {
                return FindOrInsert(Key(std::forward<K>(key)), std::forward<Factory>(makeValue));
            }
            else
            {
                const std::size_t h = HashOf_(key);
                if (Entry* e = FindEntry_(key, h))
                    return {e, false};

                const Generation before = m_generation;
                Value            value(std::forward<Factory>(makeValue)());
                if (m_generation != before)
                    throw Exceptions::ConcurrentModificationException("HashTable: value factory modified the table");
                return {InsertNew_(h, std::forward<K>(key), std::move(value)), true};
            }
        }

        /// @brief Removes `key`.
        /// @return The removed value, or empty when `key` was absent (not an error).
        Utilities::Optional<Value> Erase(const Key& key)
        {
            Entry* e = FindEntry_(key, HashOf_(key));
            if (!e)
                return {};
            Utilities::Optional<Value> previous {std::move(e->m_value)};
            EraseEntry(e);
            return previous;
        }

        /// @brief Removes an entry previously obtained from this table.
        void EraseEntry(Entry* entry) noexcept
        {
            if (entry == m_nullEntry)
            {
                m_nullEntry = nullptr;
            }
            else
            {
                Entry** link = &m_buckets[entry->m_hash & m_mask];
                while (*link != entry)
                    link = &(*link)->m_next;
                *link = entry->m_next;
            }
            DestroyEntry_(entry);
            --m_size;
            ++m_generation;
        }

        [[nodiscard]] Entry* FindEntry(const Key& key)
        {
            return FindEntry_(key, HashOf_(key));
        }

        [[nodiscard]] const Entry* FindEntry(const Key& key) const
        {
            return FindEntry_(key, HashOf_(key));
        }

        /// @brief Pointer to the value stored for `key`, or `nullptr`.
        [[nodiscard]] Value* Find(const Key& key)
        {
            Entry* e = FindEntry(key);
            return e ? &e->m_value : nullptr;
        }

        [[nodiscard]] const Value* Find(const Key& key) const
        {
            const Entry* e = FindEntry(key);
            return e ? &e->m_value : nullptr;
        }

        /// @brief Copy of the value stored for `key`, or empty.
        [[nodiscard]] Utilities::Optional<Value> Lookup(const Key& key) const
            requires(std::is_copy_constructible_v<Value>)
        {
            const Entry* e = FindEntry(key);
            if (!e)
                return {};
            return Utilities::Optional<Value> {e->m_value};
        }

        [[nodiscard]] bool Contains(const Key& key) const { return FindEntry(key) != nullptr; }

        void Clear() noexcept
        {
            if (m_size == 0)
                return;
            DestroyAllEntries_();
            ++m_generation;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] CORRAL_ALWAYS_INLINE UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] CORRAL_ALWAYS_INLINE bool IsEmpty() const noexcept { return m_size == 0; }
        [[nodiscard]] CORRAL_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] F64 MaxLoadFactor() const noexcept { return m_maxLoadFactor; }

        [[nodiscard]] F64 LoadFactor() const noexcept
        {
            if (m_capacity == 0)
                return 0.0;
            return static_cast<F64>(m_size) / static_cast<F64>(m_capacity);
        }

        /// @brief Grows the bucket array so that `count` keys fit without a resize.
        void Reserve(UIntSize count)
        {
            const size_type target = CapacityFor_(count);
            if (target <= m_capacity)
                return;
            Resize_(target);
        }

        /// @brief Rebuilds the bucket array with at least `newCapacity` buckets.
        ///
        /// The result never violates the load factor for the current size, so asking for less than
        /// that only shrinks down to the smallest admissible capacity.
        void Rehash(UIntSize newCapacity)
        {
            size_type target = ClampCapacity_(newCapacity);
            const size_type needed = CapacityFor_(m_size);
            if (target < needed)
                target = needed;
            if (target == m_capacity)
                return;
            Resize_(target);
        }

        //--------------------------------------------------------------------------
        // Iteration support
        //--------------------------------------------------------------------------

        [[nodiscard]] Generation GetGeneration() const noexcept { return m_generation; }

        /// @brief The counter itself, for cursors that snapshot it.
        [[nodiscard]] const Generation& GenerationCounter() const noexcept { return m_generation; }

        /// @brief First entry in iteration order: the null-key slot, then buckets in index order.
        [[nodiscard]] Entry* FirstEntry() noexcept { return FirstEntry_(); }
        [[nodiscard]] const Entry* FirstEntry() const noexcept { return FirstEntry_(); }

        [[nodiscard]] Entry* NextEntry(const Entry* entry) noexcept { return NextEntry_(entry); }
        [[nodiscard]] const Entry* NextEntry(const Entry* entry) const noexcept { return NextEntry_(entry); }

        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_allocator; }
        [[nodiscard]] const Hash& GetHasher() const noexcept { return m_hash; }
        [[nodiscard]] const KeyEqual& GetKeyEqual() const noexcept { return m_equal; }

        /// @brief Length of the longest bucket chain. Diagnostic for hash quality.
        [[nodiscard]] UIntSize LongestChain() const noexcept
        {
            UIntSize longest = 0;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                UIntSize length = 0;
                for (const Entry* e = m_buckets[i]; e; e = e->m_next)
                    ++length;
                if (length > longest)
                    longest = length;
            }
            return longest;
        }

    private:
        [[nodiscard]] static bool IsNullKey_(const Key& key) noexcept
        {
            if constexpr (kHasNullKey)
                return NullTraits<Key>::IsNull(key);
            else
                return false;
        }

        [[nodiscard]] std::size_t HashOf_(const Key& key) const
        {
            if (IsNullKey_(key))
                return 0;
            return detail::SpreadHash(static_cast<std::size_t>(m_hash(key)));
        }

        [[nodiscard]] static size_type ClampCapacity_(size_type requested)
        {
            if (requested > (std::numeric_limits<size_type>::max() >> 1))
                throw std::length_error("HashTable: capacity overflow");
            size_type cap = detail::NextPow2(requested);
            if (cap < kMinimumCapacity)
                cap = kMinimumCapacity;
            return cap;
        }

        /// Smallest admissible capacity that keeps `count` keys within the load factor.
        [[nodiscard]] size_type CapacityFor_(size_type count) const
        {
            const F64 desired = std::ceil(static_cast<F64>(count) / m_maxLoadFactor);
            if (desired >= static_cast<F64>(std::numeric_limits<size_type>::max() >> 1))
                throw std::length_error("HashTable: capacity overflow");
            return ClampCapacity_(static_cast<size_type>(desired));
        }

        [[nodiscard]] size_type ThresholdFor_(size_type capacity) const noexcept
        {
            const F64 limit = static_cast<F64>(capacity) * m_maxLoadFactor;
            if (limit >= static_cast<F64>(std::numeric_limits<size_type>::max()))
                return std::numeric_limits<size_type>::max();
            return static_cast<size_type>(limit);
        }

        [[nodiscard]] Entry** AllocateBuckets_(size_type capacity)
        {
            if (capacity > Memory::AllocatorTraits<AllocatorType>::template MaxElements<Entry*>(m_allocator))
                throw std::bad_alloc();
            const auto bytes = capacity * sizeof(Entry*);
            void*      mem   = m_allocator.Allocate(bytes, alignof(Entry*));
            if (!mem)
                throw std::bad_alloc();
            std::memset(mem, 0, bytes);
            return static_cast<Entry**>(mem);
        }

        void DeallocateBuckets_(Entry** buckets, size_type capacity) noexcept
        {
            m_allocator.Deallocate(buckets, capacity * sizeof(Entry*), alignof(Entry*));
        }

        void Initialize_(size_type capacity)
        {
            m_buckets   = AllocateBuckets_(capacity);
            m_capacity  = capacity;
            m_mask      = capacity - 1;
            m_threshold = ThresholdFor_(capacity);
        }

        template<class K, class V>
        [[nodiscard]] Entry* CreateEntry_(std::size_t h, K&& key, V&& value)
        {
            void* mem = m_allocator.Allocate(sizeof(Entry), alignof(Entry));
            if (!mem)
                throw std::bad_alloc();
            try
            {
                return ::new (mem) Entry(h, std::forward<K>(key), std::forward<V>(value));
            }
            catch (...)
            {
                m_allocator.Deallocate(mem, sizeof(Entry), alignof(Entry));
                throw;
            }
        }

        void DestroyEntry_(Entry* entry) noexcept
        {
            entry->~Entry();
            m_allocator.Deallocate(entry, sizeof(Entry), alignof(Entry));
        }

        static void LinkTail_(Entry** buckets, size_type mask, Entry* entry) noexcept
        {
            entry->m_next = nullptr;
            Entry** link  = &buckets[entry->m_hash & mask];
            while (*link)
                link = &(*link)->m_next;
            *link = entry;
        }

        /// Links a freshly created entry and counts it; no generation bump, no growth check.
        void LinkNew_(Entry* entry) noexcept
        {
            if (IsNullKey_(entry->m_key))
                m_nullEntry = entry;
            else
                LinkTail_(m_buckets, m_mask, entry);
            ++m_size;
        }

        template<class K, class V>
        Entry* InsertNew_(std::size_t h, K&& key, V&& value)
        {
            if (!m_buckets)
                Initialize_(m_initialCapacity);

            Entry* entry = CreateEntry_(h, std::forward<K>(key), std::forward<V>(value));
            LinkNew_(entry);
            ++m_generation;

            while (m_size > m_threshold)
            {
                if (m_capacity > (std::numeric_limits<size_type>::max() >> 2))
                    throw std::length_error("HashTable: capacity overflow");
                Resize_(m_capacity * 2);
            }
            return entry;
        }

        /// Moves every hashed entry into a new bucket array. Entries are relinked, never copied.
        void Resize_(size_type newCapacity)
        {
            Entry**         newBuckets = AllocateBuckets_(newCapacity);
            const size_type newMask    = newCapacity - 1;

            for (size_type i = 0; i < m_capacity; ++i)
            {
                Entry* e = m_buckets[i];
                while (e)
                {
                    Entry* next = e->m_next;
                    LinkTail_(newBuckets, newMask, e);
                    e = next;
                }
            }

            if (m_buckets)
                DeallocateBuckets_(m_buckets, m_capacity);
            m_buckets   = newBuckets;
            m_capacity  = newCapacity;
            m_mask      = newMask;
            m_threshold = ThresholdFor_(newCapacity);
            ++m_generation;
        }

        [[nodiscard]] Entry* FindEntry_(const Key& key, std::size_t h) const
        {
            if (IsNullKey_(key))
                return m_nullEntry;
            if (!m_buckets)
                return nullptr;
            for (Entry* e = m_buckets[h & m_mask]; e; e = e->m_next)
            {
                if (e->m_hash == h && m_equal(e->m_key, key))
                    return e;
            }
            return nullptr;
        }

        [[nodiscard]] Entry* FirstInBuckets_(size_type from) const noexcept
        {
            for (size_type i = from; i < m_capacity; ++i)
            {
                if (m_buckets[i])
                    return m_buckets[i];
            }
            return nullptr;
        }

        [[nodiscard]] Entry* FirstEntry_() const noexcept
        {
            if (m_nullEntry)
                return m_nullEntry;
            return FirstInBuckets_(0);
        }

        [[nodiscard]] Entry* NextEntry_(const Entry* entry) const noexcept
        {
            if (entry == m_nullEntry)
                return FirstInBuckets_(0);
            if (entry->m_next)
                return entry->m_next;
            return FirstInBuckets_((entry->m_hash & m_mask) + 1);
        }

        void DestroyAllEntries_() noexcept
        {
            if (m_nullEntry)
            {
                DestroyEntry_(m_nullEntry);
                m_nullEntry = nullptr;
            }
            for (size_type i = 0; i < m_capacity; ++i)
            {
                Entry* e = m_buckets[i];
                while (e)
                {
                    Entry* next = e->m_next;
                    DestroyEntry_(e);
                    e = next;
                }
                m_buckets[i] = nullptr;
            }
            m_size = 0;
        }

        void ReleaseAll_() noexcept
        {
            DestroyAllEntries_();
            if (m_buckets)
                DeallocateBuckets_(m_buckets, m_capacity);
            m_buckets   = nullptr;
            m_capacity  = 0;
            m_mask      = 0;
            m_threshold = 0;
        }

        void SwapContents_(HashTable& other) noexcept
        {
            using std::swap;
            swap(m_hash, other.m_hash);
            swap(m_equal, other.m_equal);
            swap(m_allocator, other.m_allocator);
            swap(m_buckets, other.m_buckets);
            swap(m_capacity, other.m_capacity);
            swap(m_mask, other.m_mask);
            swap(m_size, other.m_size);
            swap(m_threshold, other.m_threshold);
            swap(m_nullEntry, other.m_nullEntry);
            swap(m_maxLoadFactor, other.m_maxLoadFactor);
            swap(m_initialCapacity, other.m_initialCapacity);
        }

        [[no_unique_address]] Hash          m_hash {};
        [[no_unique_address]] KeyEqual      m_equal {};
        [[no_unique_address]] AllocatorType m_allocator;

        Entry**    m_buckets {nullptr};
        size_type  m_capacity {0};
        size_type  m_mask {0};
        size_type  m_size {0};
        size_type  m_threshold {0};
        Entry*     m_nullEntry {nullptr};
        F64        m_maxLoadFactor {kDefaultMaxLoadFactor};
        size_type  m_initialCapacity {kMinimumCapacity};
        Generation m_generation {0};
    };

    //--------------------------------------------------------------------------
    // Live views and fail-fast cursors
    //--------------------------------------------------------------------------

    enum class ViewKind : UInt8
    {
        Keys,
        Values,
        Entries,
    };

    namespace detail
    {
        template<class Table>
        using EntryOf = std::conditional_t<std::is_const_v<Table>,
                                           const typename std::remove_const_t<Table>::Entry,
                                           typename std::remove_const_t<Table>::Entry>;

        template<class Table, ViewKind Kind>
        struct ViewElement;

        template<class Table>
        struct ViewElement<Table, ViewKind::Keys>
        {
            using Type = const typename std::remove_const_t<Table>::key_type;
            static Type* Project(EntryOf<Table>* entry) noexcept { return &entry->GetKey(); }
        };

        template<class Table>
        struct ViewElement<Table, ViewKind::Values>
        {
            using Type = std::conditional_t<std::is_const_v<Table>,
                                            const typename std::remove_const_t<Table>::mapped_type,
                                            typename std::remove_const_t<Table>::mapped_type>;
            static Type* Project(EntryOf<Table>* entry) noexcept { return &entry->GetValue(); }
        };

        template<class Table>
        struct ViewElement<Table, ViewKind::Entries>
        {
            using Type = EntryOf<Table>;
            static Type* Project(EntryOf<Table>* entry) noexcept { return entry; }
        };
    }// namespace detail

    /// @brief Fail-fast cursor over a hash table.
    ///
    /// `Next()` yields a pointer into the table, `nullptr` once exhausted, or
    /// `IterationError::ConcurrentModification` once the table was structurally changed behind the
    /// cursor's back. Both terminal states are sticky.
    template<class Table, ViewKind Kind>
    class HashTableCursor
    {
    public:
        using Element      = typename detail::ViewElement<Table, Kind>::Type;
        using NextResult   = Utilities::Expected<Element*, IterationError>;
        using RemoveResult = Utilities::Expected<void, IterationError>;

        HashTableCursor() noexcept = default;

        explicit HashTableCursor(Table& table) noexcept
            : m_table(&table), m_guard(table.GenerationCounter()), m_next(table.FirstEntry())
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
                m_state   = IteratorState::Invalidated;
                m_current = nullptr;
                return NextResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            }
            if (!m_next)
            {
                m_state   = IteratorState::Exhausted;
                m_current = nullptr;
                return NextResult {static_cast<Element*>(nullptr)};
            }
            m_current = m_next;
            m_next    = m_table->NextEntry(m_current);
            return NextResult {detail::ViewElement<Table, Kind>::Project(m_current)};
        }

        /// @brief Erases the element last returned by `Next()` without invalidating this cursor.
        RemoveResult Remove()
            requires(!std::is_const_v<Table>)
        {
            if (m_state == IteratorState::Invalidated)
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            if (!m_guard.IsCurrent())
            {
                m_state   = IteratorState::Invalidated;
                m_current = nullptr;
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::ConcurrentModification}};
            }
            if (!m_current)
                return RemoveResult {Utilities::Unexpected<IterationError> {IterationError::NoCurrentElement}};
            m_table->EraseEntry(m_current);
            m_current = nullptr;
            m_guard.Resync();
            return RemoveResult {};
        }

        [[nodiscard]] IteratorState GetState() const noexcept { return m_state; }

    private:
        using EntryPtr = detail::EntryOf<Table>*;

        Table*          m_table {nullptr};
        GenerationGuard m_guard {};
        EntryPtr        m_next {nullptr};
        EntryPtr        m_current {nullptr};
        IteratorState   m_state {IteratorState::Active};
    };

    /// @brief Range-for adapter over a cursor. Throws `ConcurrentModificationException` where the
    /// cursor would report `IterationError::ConcurrentModification`.
    template<class Table, ViewKind Kind>
    class HashTableIterator
    {
    public:
        using Cursor            = HashTableCursor<Table, Kind>;
        using Element           = typename Cursor::Element;
        using difference_type   = std::ptrdiff_t;
        using value_type        = std::remove_const_t<Element>;
        using reference         = Element&;
        using pointer           = Element*;
        using iterator_category = std::input_iterator_tag;

        HashTableIterator() noexcept = default;

        explicit HashTableIterator(Table& table)
            : m_cursor(table)
        {
            Advance_();
        }

        reference operator*() const noexcept { return *m_element; }
        pointer operator->() const noexcept { return m_element; }

        HashTableIterator& operator++()
        {
            Advance_();
            return *this;
        }

        bool operator==(const HashTableIterator& other) const noexcept { return m_element == other.m_element; }
        bool operator!=(const HashTableIterator& other) const noexcept { return !(*this == other); }

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

    /// @brief Live, non-copying view of a table's keys, values or entries.
    template<class Table, ViewKind Kind>
    class HashTableView
    {
    public:
        using Cursor   = HashTableCursor<Table, Kind>;
        using Iterator = HashTableIterator<Table, Kind>;

        explicit HashTableView(Table& table) noexcept
            : m_table(&table)
        {
        }

        [[nodiscard]] Cursor Iterate() const noexcept { return Cursor(*m_table); }

        Iterator begin() const { return Iterator(*m_table); }
        Iterator end() const noexcept { return Iterator(); }

        [[nodiscard]] UIntSize Size() const noexcept { return m_table->Size(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_table->IsEmpty(); }

    private:
        Table* m_table;
    };

}// namespace Corral::Containers
