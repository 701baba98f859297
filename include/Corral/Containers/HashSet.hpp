/// @file HashSet.hpp
/// @brief Set of unique keys, implemented as a `HashMap` whose values are `Unit`.
#pragma once

#include <Corral/Containers/HashMap.hpp>

#include <functional>
#include <initializer_list>
#include <utility>

namespace Corral::Containers
{
    /// @brief Empty marker stored as the value of every set member.
    struct Unit
    {
        friend constexpr bool operator==(Unit, Unit) noexcept { return true; }
    };

    template<typename Key,
             typename Hash                          = std::hash<Key>,
             typename KeyEqual                      = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class HashSet
    {
    public:
        using MapType        = HashMap<Key, Unit, Hash, KeyEqual, AllocatorType>;
        using key_type       = Key;
        using value_type     = Key;
        using allocator_type = AllocatorType;
        using View           = typename MapType::KeyView;
        using ConstView      = typename MapType::ConstKeyView;
        using Cursor         = typename View::Cursor;
        using ConstCursor    = typename ConstView::Cursor;

        HashSet() = default;

        explicit HashSet(const HashTableOptions& options,
                         const Hash& hash               = Hash {},
                         const KeyEqual& equal          = KeyEqual {},
                         const AllocatorType& allocator = AllocatorType {})
            : m_map(options, hash, equal, allocator)
        {
        }

        HashSet(std::initializer_list<Key> init)
        {
            m_map.Reserve(init.size());
            for (const Key& key: init)
                Add(key);
        }

        /// @return true when `key` was not yet a member.
        template<class K>
        bool Add(K&& key)
        {
            return !m_map.PutIfAbsent(std::forward<K>(key), Unit {}).HasValue();
        }

        /// @return true when `key` was a member.
        bool Remove(const Key& key) { return m_map.Remove(key).HasValue(); }

        [[nodiscard]] bool Contains(const Key& key) const { return m_map.Contains(key); }

        /// @brief Adds every element of `range`.
        /// @return Number of elements that were not yet members.
        template<class Range>
        UIntSize AddAll(const Range& range)
        {
            UIntSize added = 0;
            for (const auto& key: range)
            {
                if (Add(key))
                    ++added;
            }
            return added;
        }

        template<class Range>
        [[nodiscard]] bool ContainsAll(const Range& range) const
        {
            for (const auto& key: range)
            {
                if (!Contains(key))
                    return false;
            }
            return true;
        }

        /// @brief Removes every member for which `predicate(key)` holds, through a single cursor.
        /// @return Number of removed members.
        /// @throws ConcurrentModificationException if `predicate` structurally modifies the set.
        template<class Predicate>
        UIntSize RemoveIf(Predicate&& predicate)
        {
            UIntSize removed = 0;
            Cursor   cursor  = m_map.Keys().Iterate();
            for (;;)
            {
                auto next = cursor.Next();
                if (!next)
                    throw Exceptions::ConcurrentModificationException("HashSet: predicate structurally modified the set");
                const Key* key = next.Value();
                if (!key)
                    break;
                if (!std::invoke(predicate, *key))
                    continue;
                if (!cursor.Remove())
                    throw Exceptions::ConcurrentModificationException("HashSet: predicate structurally modified the set");
                ++removed;
            }
            return removed;
        }

        void Clear() noexcept { m_map.Clear(); }
        void Reserve(UIntSize count) { m_map.Reserve(count); }

        [[nodiscard]] UIntSize Size() const noexcept { return m_map.Size(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_map.IsEmpty(); }
        [[nodiscard]] UIntSize Capacity() const noexcept { return m_map.Capacity(); }
        [[nodiscard]] Generation GetGeneration() const noexcept { return m_map.GetGeneration(); }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_map.GetAllocator(); }

        /// @brief Fail-fast cursor over the members.
        [[nodiscard]] Cursor Iterate() noexcept { return m_map.Keys().Iterate(); }
        [[nodiscard]] ConstCursor Iterate() const noexcept { return m_map.Keys().Iterate(); }

        auto begin() const { return m_map.Keys().begin(); }
        auto end() const noexcept { return m_map.Keys().end(); }

        friend bool operator==(const HashSet& lhs, const HashSet& rhs) { return lhs.m_map == rhs.m_map; }

    private:
        MapType m_map {};
    };
}// namespace Corral::Containers
