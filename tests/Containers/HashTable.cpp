/// @file HashTable.cpp
/// @brief Tests for Corral::Containers::HashTable using Catch2.

#include <Corral/Containers/HashTable.hpp>
#include <Corral/Memory/TrackingAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using Corral::Containers::HashTable;
using Corral::Containers::HashTableOptions;

namespace
{
    /// Sends every key to the same bucket.
    struct ConstantHash
    {
        std::size_t operator()(int) const noexcept { return 42; }
    };

    /// Fails loudly if the table ever hashes a null pointer.
    struct NonNullHash
    {
        std::size_t operator()(const int* key) const
        {
            if (key == nullptr)
                throw std::logic_error("null key was hashed");
            return std::hash<const int*> {}(key);
        }
    };

    using TrackedAllocator = Corral::Memory::Tracking<Corral::Memory::SystemAllocator>;
}// namespace

TEST_CASE("HashTable default construction", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    CHECK(table.Size() == 0U);
    CHECK(table.IsEmpty());
    CHECK(table.Capacity() == 16U);
    CHECK(table.MaxLoadFactor() == 0.75);
    CHECK(table.GetGeneration() == 0U);
    CHECK(table.FirstEntry() == nullptr);
}

TEST_CASE("HashTable rounds the initial capacity to a power of two", "[Containers][HashTable]")
{
    CHECK(HashTable<int, int>(HashTableOptions {.initialCapacity = 100}).Capacity() == 128U);
    CHECK(HashTable<int, int>(HashTableOptions {.initialCapacity = 64}).Capacity() == 64U);
    CHECK(HashTable<int, int>(HashTableOptions {.initialCapacity = 0}).Capacity() == 16U);
    CHECK(HashTable<int, int>(HashTableOptions {.initialCapacity = 3}).Capacity() == 16U);
}

TEST_CASE("HashTable rejects invalid load factors", "[Containers][HashTable]")
{
    using Table = HashTable<int, int>;
    CHECK_THROWS_AS(Table(HashTableOptions {.maxLoadFactor = 0.0}), std::invalid_argument);
    CHECK_THROWS_AS(Table(HashTableOptions {.maxLoadFactor = -0.5}), std::invalid_argument);
    CHECK_THROWS_AS(Table(HashTableOptions {.maxLoadFactor = std::nan("")}), std::invalid_argument);
    CHECK_THROWS_AS(Table(HashTableOptions {.maxLoadFactor = std::numeric_limits<double>::infinity()}),
                    std::invalid_argument);
    CHECK_NOTHROW(Table(HashTableOptions {.maxLoadFactor = 4.0}));
}

TEST_CASE("HashTable upsert returns the previous value", "[Containers][HashTable]")
{
    HashTable<std::string, int> table;

    auto first = table.Upsert("k", 1);
    CHECK_FALSE(first.HasValue());
    const auto generation = table.GetGeneration();
    CHECK(generation == 1U);

    auto second = table.Upsert("k", 2);
    REQUIRE(second.HasValue());
    CHECK(second.Value() == 1);
    CHECK(table.Size() == 1U);
    CHECK(*table.Find("k") == 2);
    CHECK(table.GetGeneration() == generation);
}

TEST_CASE("HashTable resize preserves every entry", "[Containers][HashTable]")
{
    HashTable<int, std::string> table;
    constexpr int count = 100;

    for (int i = 0; i < count; ++i)
        table.Upsert(i, std::to_string(i));

    // 16 -> 32 -> 64 -> 128 -> 256 with the default 0.75 load factor.
    CHECK(table.Capacity() == 256U);
    CHECK(table.Size() == static_cast<std::size_t>(count));
    CHECK(table.LoadFactor() <= table.MaxLoadFactor());
    CHECK(table.GetGeneration() == static_cast<std::size_t>(count) + 4U);

    for (int i = 0; i < count; ++i)
    {
        const std::string* value = table.Find(i);
        REQUIRE(value != nullptr);
        CHECK(*value == std::to_string(i));
    }

    std::size_t visited = 0;
    for (auto* entry = table.FirstEntry(); entry; entry = table.NextEntry(entry))
        ++visited;
    CHECK(visited == static_cast<std::size_t>(count));
}

TEST_CASE("HashTable entries stay in place across a resize", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    table.Upsert(7, 70);
    int* value = table.Find(7);

    for (int i = 100; i < 200; ++i)
        table.Upsert(i, i);

    CHECK(table.Find(7) == value);
    CHECK(*value == 70);
}

TEST_CASE("HashTable chains colliding keys", "[Containers][HashTable]")
{
    HashTable<int, int, ConstantHash> table;
    for (int i = 0; i < 10; ++i)
        table.Upsert(i, i * 10);

    CHECK(table.LongestChain() == 10U);
    CHECK(*table.Find(5) == 50);

    auto removed = table.Erase(5);
    REQUIRE(removed.HasValue());
    CHECK(removed.Value() == 50);
    CHECK(table.Find(5) == nullptr);
    CHECK(table.LongestChain() == 9U);
    for (int i = 0; i < 10; ++i)
    {
        if (i != 5)
            CHECK(*table.Find(i) == i * 10);
    }
}

TEST_CASE("HashTable erase of an absent key is a no-op", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    table.Upsert(1, 1);
    const auto generation = table.GetGeneration();

    CHECK_FALSE(table.Erase(2).HasValue());
    CHECK(table.Size() == 1U);
    CHECK(table.GetGeneration() == generation);
}

TEST_CASE("HashTable reinsert after erase is a fresh insert", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    table.Upsert(1, 10);
    table.Erase(1);
    CHECK_FALSE(table.Lookup(1).HasValue());

    const auto generation = table.GetGeneration();
    CHECK_FALSE(table.Upsert(1, 11).HasValue());
    CHECK(table.GetGeneration() == generation + 1U);
    CHECK(table.Lookup(1).Value() == 11);
}

TEST_CASE("HashTable stores a null key outside the buckets", "[Containers][HashTable]")
{
    HashTable<const int*, std::string, NonNullHash> table;
    const int                                       a = 1;

    CHECK_FALSE(table.Upsert(nullptr, "null").HasValue());
    CHECK(table.Upsert(&a, "a").HasValue() == false);
    CHECK(table.Size() == 2U);
    CHECK(table.Contains(nullptr));
    CHECK(*table.Find(nullptr) == "null");

    auto previous = table.Upsert(nullptr, "again");
    REQUIRE(previous.HasValue());
    CHECK(previous.Value() == "null");
    CHECK(table.Size() == 2U);

    REQUIRE(table.FirstEntry() != nullptr);
    CHECK(table.FirstEntry()->GetKey() == nullptr);

    CHECK(table.Erase(nullptr).Value() == "again");
    CHECK_FALSE(table.Contains(nullptr));
    CHECK(table.Size() == 1U);
}

TEST_CASE("HashTable clear keeps the capacity", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    for (int i = 0; i < 20; ++i)
        table.Upsert(i, i);
    const auto capacity = table.Capacity();

    const auto generation = table.GetGeneration();
    table.Clear();
    CHECK(table.IsEmpty());
    CHECK(table.Capacity() == capacity);
    CHECK(table.GetGeneration() == generation + 1U);

    table.Clear();
    CHECK(table.GetGeneration() == generation + 1U);
}

TEST_CASE("HashTable reserve and rehash", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    table.Reserve(100);
    CHECK(table.Capacity() == 256U);

    const auto generation = table.GetGeneration();
    for (int i = 0; i < 100; ++i)
        table.Upsert(i, i);
    CHECK(table.Capacity() == 256U);
    CHECK(table.GetGeneration() == generation + 100U);

    table.Rehash(16);
    CHECK(table.Capacity() == 256U);

    for (int i = 0; i < 90; ++i)
        table.Erase(i);
    table.Rehash(0);
    CHECK(table.Capacity() == 16U);
    for (int i = 90; i < 100; ++i)
        CHECK(*table.Find(i) == i);
}

TEST_CASE("HashTable FindOrInsert calls the factory only for absent keys", "[Containers][HashTable]")
{
    HashTable<std::string, int> table;
    int                         calls = 0;

    auto [first, inserted] = table.FindOrInsert("x", [&] {
        ++calls;
        return 5;
    });
    CHECK(inserted);
    CHECK(first->GetValue() == 5);

    auto [second, insertedAgain] = table.FindOrInsert("x", [&] {
        ++calls;
        return 6;
    });
    CHECK_FALSE(insertedAgain);
    CHECK(second == first);
    CHECK(calls == 1);
}

TEST_CASE("HashTable FindOrInsert leaves the table unchanged when the factory throws", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    table.Upsert(1, 1);
    const auto generation = table.GetGeneration();

    CHECK_THROWS_AS(table.FindOrInsert(2, []() -> int { throw std::runtime_error("factory failed"); }),
                    std::runtime_error);
    CHECK(table.Size() == 1U);
    CHECK_FALSE(table.Contains(2));
    CHECK(table.GetGeneration() == generation);
}

TEST_CASE("HashTable FindOrInsert detects a factory that modifies the table", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    CHECK_THROWS_AS(table.FindOrInsert(1,
                                       [&] {
                                           table.Upsert(2, 2);
                                           return 1;
                                       }),
                    Corral::Exceptions::ConcurrentModificationException);
    CHECK_FALSE(table.Contains(1));
    CHECK(table.Contains(2));
}

TEST_CASE("HashTable copy is deep and starts a fresh generation", "[Containers][HashTable]")
{
    HashTable<int, std::string> original;
    original.Upsert(1, "one");
    original.Upsert(2, "two");

    HashTable<int, std::string> copy {original};
    CHECK(copy.Size() == 2U);
    CHECK(copy.GetGeneration() == 0U);
    CHECK(copy.Capacity() == original.Capacity());

    copy.Upsert(3, "three");
    *copy.Find(1) = "uno";
    CHECK(original.Size() == 2U);
    CHECK(*original.Find(1) == "one");

    const auto generation = original.GetGeneration();
    original = copy;
    CHECK(original.Size() == 3U);
    CHECK(*original.Find(1) == "uno");
    CHECK(original.GetGeneration() > generation);
}

TEST_CASE("HashTable move leaves an empty, reusable source", "[Containers][HashTable]")
{
    HashTable<int, int> source;
    source.Upsert(1, 1);
    source.Upsert(2, 2);

    HashTable<int, int> target {std::move(source)};
    CHECK(target.Size() == 2U);
    CHECK(source.Size() == 0U);
    CHECK(source.Capacity() == 0U);
    CHECK(source.FirstEntry() == nullptr);
    CHECK_FALSE(source.Contains(1));

    source.Upsert(3, 3);
    CHECK(source.Capacity() == 16U);
    CHECK(*source.Find(3) == 3);
}

TEST_CASE("HashTable returns every node to its allocator", "[Containers][HashTable]")
{
    Corral::Memory::AllocationStats stats;
    {
        using Table = HashTable<int, std::string, std::hash<int>, std::equal_to<int>, TrackedAllocator>;
        Table table(HashTableOptions {}, {}, {}, TrackedAllocator {stats});

        for (int i = 0; i < 50; ++i)
            table.Upsert(i, std::to_string(i));
        for (int i = 0; i < 25; ++i)
            table.Erase(i);

        Table copy {table};
        CHECK(copy.Size() == 25U);
        CHECK(stats.currentCount == 25U + 1U + 25U + 1U);
    }
    CHECK(stats.currentBytes == 0U);
    CHECK(stats.currentCount == 0U);
    CHECK(stats.totalCount > 0U);
}

TEST_CASE("HashTable insert that resizes advances the generation by two", "[Containers][HashTable]")
{
    HashTable<int, int> table;
    for (int i = 0; i < 12; ++i)
        table.Upsert(i, i);
    REQUIRE(table.Capacity() == 16U);
    CHECK(table.GetGeneration() == 12U);

    table.Upsert(12, 12);
    CHECK(table.Capacity() == 32U);
    CHECK(table.GetGeneration() == 14U);

    table.Upsert(13, 13);
    CHECK(table.GetGeneration() == 15U);
}
