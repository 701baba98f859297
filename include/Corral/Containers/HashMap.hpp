/// @file HashMap.hpp
/// @brief Keyed map over `HashTable`, with the compute/merge family and live views.
///
/// Composite operations (`ComputeIfAbsent`, `ComputeIfPresent`, `Compute`, `Merge`, `ReplaceAll`)
/// call back into user code. If a callback throws, the exception propagates and the map is left
/// as it was. If a callback structurally modifies the same map, `ConcurrentModificationException`
/// is thrown and the callback's result is discarded.
#pragma once

#include <Corral/Containers/HashTable.hpp>

#include <functional>
#include <initializer_list>
#include <type_traits>
#include <utility>

namespace Corral::Containers
{
    template<typename Key,
             typename Value,
             typename Hash                          = std::hash<Key>,
             typename KeyEqual                      = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class HashMap
    {
    public:
        using TableType      = HashTable<Key, Value, Hash, KeyEqual, AllocatorType>;
        using key_type       = Key;
        using mapped_type    = Value;
        using allocator_type = AllocatorType;
        using EntryRef       = typename TableType::Entry;

        using KeyView        = HashTableView<TableType, ViewKind::Keys>;
        using ValueView      = HashTableView<TableType, ViewKind::Values>;
        using EntryView      = HashTableView<TableType, ViewKind::Entries>;
        using ConstKeyView   = HashTableView<const TableType, ViewKind::Keys>;
        using ConstValueView = HashTableView<const TableType, ViewKind::Values>;
        using ConstEntryView = HashTableView<const TableType, ViewKind::Entries>;

        HashMap() = default;

        explicit HashMap(const HashTableOptions& options,
                         const Hash& hash               = Hash {},
                         const KeyEqual& equal          = KeyEqual {},
                         const AllocatorType& allocator = AllocatorType {})
            : m_table(options, hash, equal, allocator)
        {
        }

        HashMap(std::initializer_list<std::pair<Key, Value>> init)
        {
            m_table.Reserve(init.size());
            for (const auto& [key, value]: init)
                m_table.Upsert(key, value);
        }

        HashMap(const HashMap&)            = default;
        HashMap(HashMap&&) noexcept        = default;
        HashMap& operator=(const HashMap&) = default;
        HashMap& operator=(HashMap&&)      = default;
        ~HashMap()                         = default;

        /// @brief Associates `value` with `key`; the last write wins.
        /// @return The value previously mapped to `key`, or empty.
        template<class K, class V>
        Utilities::Optional<Value> Put(K&& key, V&& value)
        {
            return m_table.Upsert(std::forward<K>(key), std::forward<V>(value));
        }

        /// @brief Copy of the value mapped to `key`, or empty. Never mutates the map.
        [[nodiscard]] Utilities::Optional<Value> Get(const Key& key) const { return m_table.Lookup(key); }

        [[nodiscard]] Value* GetPtr(const Key& key) { return m_table.Find(key); }
        [[nodiscard]] const Value* GetPtr(const Key& key) const { return m_table.Find(key); }

        /// @return The removed value, or empty when `key` was absent.
        Utilities::Optional<Value> Remove(const Key& key) { return m_table.Erase(key); }

        /// @brief Removes `key` only while it maps to `expected`.
        bool Remove(const Key& key, const Value& expected)
        {
            EntryRef* entry = m_table.FindEntry(key);
            if (!entry || !(entry->GetValue() == expected))
                return false;
            m_table.EraseEntry(entry);
            return true;
        }

        [[nodiscard]] bool Contains(const Key& key) const { return m_table.Contains(key); }

        /// @brief Linear scan for a value.
        [[nodiscard]] bool ContainsValue(const Value& value) const
        {
            for (const Value& candidate: Values())
            {
                if (candidate == value)
                    return true;
            }
            return false;
        }

        /// @brief Value mapped to `key`, or `fallback`. Never inserts.
        [[nodiscard]] Value GetOrDefault(const Key& key, Value fallback) const
        {
            if (const Value* value = m_table.Find(key))
                return *value;
            return fallback;
        }

        /// @brief Inserts `value` only when `key` is absent.
        /// @return The existing value (left unmodified) when present, empty when inserted.
        template<class K, class V>
        Utilities::Optional<Value> PutIfAbsent(K&& key, V&& value)
        {
            auto [entry, inserted] = m_table.FindOrInsert(std::forward<K>(key), [&]() -> decltype(auto) {
                return std::forward<V>(value);
            });
            if (inserted)
                return {};
            return Utilities::Optional<Value> {entry->GetValue()};
        }

        /// @brief Returns the value for `key`, inserting `fn(key)` first when absent.
        ///
        /// `fn` runs at most once and never when `key` is already present.
        template<class K, class Fn>
        Value& ComputeIfAbsent(K&& key, Fn&& fn)
        {
            if constexpr (!std::is_same_v<std::remove_cvref_t<K>, Key>)
            {
                return ComputeIfAbsent(Key(std::forward<K>(key)), std::forward<Fn>(fn));
            }
            else
            {
                const Key& keyRef = key;
                auto [entry, inserted] = m_table.FindOrInsert(std::forward<K>(key), [&] {
                    return std::invoke(fn, keyRef);
                });
                return entry->GetValue();
            }
        }

        /// @brief When `key` is present, replaces its value with `fn(key, current)`.
        ///
        /// `fn` returns `Optional<Value>`; an empty result removes the key.
        /// @return The new value, or `nullptr` when absent or removed.
        template<class Fn>
        Value* ComputeIfPresent(const Key& key, Fn&& fn)
        {
            EntryRef* entry = m_table.FindEntry(key);
            if (!entry)
                return nullptr;

            const Generation           before = m_table.GetGeneration();
            Utilities::Optional<Value> result {std::invoke(fn, entry->GetKey(), std::as_const(entry->GetValue()))};
            EnsureUnchanged_(before);
            return Store_(entry, std::move(result));
        }

        /// @brief Replaces the mapping of `key` with `fn(key, current)`, where `current` is
        /// a `const Value*` that is `nullptr` when `key` is absent.
        ///
        /// An empty result removes `key` if it was present and is a no-op otherwise.
        /// @return The stored value, or `nullptr` when nothing is mapped afterwards.
        template<class K, class Fn>
        Value* Compute(K&& key, Fn&& fn)
        {
            if constexpr (!std::is_same_v<std::remove_cvref_t<K>, Key>)
            {
                return Compute(Key(std::forward<K>(key)), std::forward<Fn>(fn));
            }
            else
            {
                EntryRef*    entry   = m_table.FindEntry(key);
                const Value* current = entry ? &entry->GetValue() : nullptr;

                const Generation           before = m_table.GetGeneration();
                Utilities::Optional<Value> result {std::invoke(fn, std::as_const(key), current)};
                EnsureUnchanged_(before);

                if (entry)
                    return Store_(entry, std::move(result));
                if (!result)
                    return nullptr;
                return &InsertAbsent_(std::forward<K>(key), std::move(*result));
            }
        }

        /// @brief Inserts `value` when `key` is absent, otherwise replaces the existing value with
        /// `combine(existing, value)`. An empty combined result removes the key.
        /// @return The stored value, or `nullptr` when the key was removed.
        template<class K, class V, class Combine>
        Value* Merge(K&& key, V&& value, Combine&& combine)
        {
            if constexpr (!std::is_same_v<std::remove_cvref_t<K>, Key>)
            {
                return Merge(Key(std::forward<K>(key)), std::forward<V>(value), std::forward<Combine>(combine));
            }
            else
            {
                EntryRef* entry = m_table.FindEntry(key);
                if (!entry)
                    return &InsertAbsent_(std::forward<K>(key), std::forward<V>(value));

                const Generation           before = m_table.GetGeneration();
                Utilities::Optional<Value> result {std::invoke(combine, std::as_const(entry->GetValue()), std::as_const(value))};
                EnsureUnchanged_(before);
                return Store_(entry, std::move(result));
            }
        }

        /// @brief Replaces the value of `key` only when present.
        /// @return The previous value, or empty when `key` was absent.
        template<class V>
        Utilities::Optional<Value> Replace(const Key& key, V&& value)
        {
            EntryRef* entry = m_table.FindEntry(key);
            if (!entry)
                return {};
            Value                      replacement(std::forward<V>(value));
            Utilities::Optional<Value> previous {std::move(entry->GetValue())};
            entry->SetValue(std::move(replacement));
            return previous;
        }

        /// @brief Replaces the value of `key` only while it equals `expected`.
        template<class V>
        bool Replace(const Key& key, const Value& expected, V&& value)
        {
            EntryRef* entry = m_table.FindEntry(key);
            if (!entry || !(entry->GetValue() == expected))
                return false;
            entry->SetValue(std::forward<V>(value));
            return true;
        }

        /// @brief Calls `fn(key, value)` for every mapping.
        /// @throws ConcurrentModificationException if `fn` structurally modifies the map.
        template<class Fn>
        void ForEach(Fn&& fn) const
        {
            for (const EntryRef& entry: Entries())
                std::invoke(fn, entry.GetKey(), entry.GetValue());
        }

        /// @brief Replaces every value with `fn(key, value)`. Not a structural change.
        /// @throws ConcurrentModificationException if `fn` structurally modifies the map.
        template<class Fn>
        void ReplaceAll(Fn&& fn)
        {
            for (EntryRef& entry: Entries())
                entry.SetValue(std::invoke(fn, entry.GetKey(), std::as_const(entry.GetValue())));
        }

        /// @brief Value for `key`, default-constructing it first when absent.
        template<class K>
        Value& operator[](K&& key)
            requires(std::is_default_constructible_v<Value>)
        {
            return m_table.FindOrInsert(std::forward<K>(key), [] { return Value {}; }).first->GetValue();
        }

        void Clear() noexcept { m_table.Clear(); }
        void Reserve(UIntSize count) { m_table.Reserve(count); }
        void Rehash(UIntSize capacity) { m_table.Rehash(capacity); }

        [[nodiscard]] UIntSize Size() const noexcept { return m_table.Size(); }
        [[nodiscard]] bool IsEmpty() const noexcept { return m_table.IsEmpty(); }
        [[nodiscard]] UIntSize Capacity() const noexcept { return m_table.Capacity(); }
        [[nodiscard]] F64 LoadFactor() const noexcept { return m_table.LoadFactor(); }
        [[nodiscard]] F64 MaxLoadFactor() const noexcept { return m_table.MaxLoadFactor(); }
        [[nodiscard]] Generation GetGeneration() const noexcept { return m_table.GetGeneration(); }
        [[nodiscard]] const AllocatorType& GetAllocator() const noexcept { return m_table.GetAllocator(); }

        [[nodiscard]] KeyView Keys() noexcept { return KeyView(m_table); }
        [[nodiscard]] ValueView Values() noexcept { return ValueView(m_table); }
        [[nodiscard]] EntryView Entries() noexcept { return EntryView(m_table); }
        [[nodiscard]] ConstKeyView Keys() const noexcept { return ConstKeyView(m_table); }
        [[nodiscard]] ConstValueView Values() const noexcept { return ConstValueView(m_table); }
        [[nodiscard]] ConstEntryView Entries() const noexcept { return ConstEntryView(m_table); }

        auto begin() { return Entries().begin(); }
        auto end() noexcept { return Entries().end(); }
        auto begin() const { return Entries().begin(); }
        auto end() const noexcept { return Entries().end(); }

        /// @brief Same mappings, regardless of capacity or iteration order.
        friend bool operator==(const HashMap& lhs, const HashMap& rhs)
        {
            if (lhs.Size() != rhs.Size())
                return false;
            for (const EntryRef& entry: lhs.Entries())
            {
                const Value* other = rhs.GetPtr(entry.GetKey());
                if (!other || !(*other == entry.GetValue()))
                    return false;
            }
            return true;
        }

    private:
        void EnsureUnchanged_(Generation before) const
        {
            if (CORRAL_UNLIKELY(m_table.GetGeneration() != before))
                throw Exceptions::ConcurrentModificationException("HashMap: callback structurally modified the map");
        }

        Value* Store_(EntryRef* entry, Utilities::Optional<Value>&& result)
        {
            if (!result)
            {
                m_table.EraseEntry(entry);
                return nullptr;
            }
            entry->SetValue(std::move(*result));
            return &entry->GetValue();
        }

        template<class V>
        Value& InsertAbsent_(Key&& key, V&& value)
        {
            return m_table.FindOrInsert(std::move(key), [&]() -> decltype(auto) { return std::forward<V>(value); })
                    .first->GetValue();
        }

        template<class V>
        Value& InsertAbsent_(const Key& key, V&& value)
        {
            return m_table.FindOrInsert(key, [&]() -> decltype(auto) { return std::forward<V>(value); })
                    .first->GetValue();
        }

        TableType m_table {};
    };
}// namespace Corral::Containers
