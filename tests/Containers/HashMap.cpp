/// @file HashMap.cpp
/// @brief Tests for Corral::Containers::HashMap using Catch2.

#include <Corral/Containers/HashMap.hpp>
#include <Corral/Utilities/Optional.hpp>
#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Corral::Containers::HashMap;
using Corral::Utilities::Optional;

TEST_CASE("HashMap default construction", "[Containers][HashMap]")
{
    HashMap<int, int> map;
    CHECK(map.Size() == 0U);
    CHECK(map.IsEmpty());
    CHECK(map.Capacity() >= 16U);
}

TEST_CASE("HashMap put and get", "[Containers][HashMap]")
{
    HashMap<std::string, int> map;
    map.Put("one", 1);
    map.Put("two", 2);
    CHECK(map.Size() == 2U);
    CHECK(map.Get("one").Value() == 1);
    CHECK(map.Get("two").Value() == 2);
    CHECK_FALSE(map.Get("three").HasValue());
    CHECK(map.GetPtr("three") == nullptr);
}

TEST_CASE("HashMap last write wins", "[Containers][HashMap]")
{
    HashMap<std::string, int> map;
    CHECK_FALSE(map.Put("key", 1).HasValue());
    auto previous = map.Put("key", 2);
    REQUIRE(previous.HasValue());
    CHECK(previous.Value() == 1);
    CHECK(map.Get("key").Value() == 2);
    CHECK(map.Size() == 1U);
}

TEST_CASE("HashMap removes keys", "[Containers][HashMap]")
{
    HashMap<int, int> map {{1, 100}, {2, 200}};

    auto removed = map.Remove(1);
    REQUIRE(removed.HasValue());
    CHECK(removed.Value() == 100);
    CHECK(map.Size() == 1U);
    CHECK_FALSE(map.Get(1).HasValue());
    CHECK(map.Get(2).Value() == 200);

    CHECK_FALSE(map.Remove(1).HasValue());
}

TEST_CASE("HashMap conditional remove and replace", "[Containers][HashMap]")
{
    HashMap<std::string, int> map {{"a", 1}};

    CHECK_FALSE(map.Remove("a", 2));
    CHECK(map.Contains("a"));

    CHECK_FALSE(map.Replace("a", 2, 3));
    CHECK(map.Replace("a", 1, 3));
    CHECK(map.Get("a").Value() == 3);

    CHECK_FALSE(map.Replace("missing", 9).HasValue());
    CHECK_FALSE(map.Contains("missing"));
    CHECK(map.Replace("a", 4).Value() == 3);

    CHECK(map.Remove("a", 4));
    CHECK(map.IsEmpty());
}

TEST_CASE("HashMap contains key and value", "[Containers][HashMap]")
{
    HashMap<int, std::string> map {{42, "answer"}};
    CHECK(map.Contains(42));
    CHECK_FALSE(map.Contains(99));
    CHECK(map.ContainsValue("answer"));
    CHECK_FALSE(map.ContainsValue("question"));
}

TEST_CASE("HashMap GetOrDefault never inserts", "[Containers][HashMap]")
{
    HashMap<std::string, int> map {{"a", 1}};
    const auto generation = map.GetGeneration();

    CHECK(map.GetOrDefault("a", 0) == 1);
    CHECK(map.GetOrDefault("b", -1) == -1);
    CHECK_FALSE(map.Contains("b"));
    CHECK(map.GetGeneration() == generation);
}

TEST_CASE("HashMap PutIfAbsent keeps existing values", "[Containers][HashMap]")
{
    HashMap<std::string, int> map;
    CHECK_FALSE(map.PutIfAbsent("a", 1).HasValue());

    auto existing = map.PutIfAbsent("a", 2);
    REQUIRE(existing.HasValue());
    CHECK(existing.Value() == 1);
    CHECK(map.Get("a").Value() == 1);
}

TEST_CASE("HashMap ComputeIfAbsent evaluates the function at most once", "[Containers][HashMap]")
{
    HashMap<std::string, std::size_t> map;
    int                               calls  = 0;
    auto                              length = [&](const std::string& key) {
        ++calls;
        return key.size();
    };

    CHECK(map.ComputeIfAbsent("four", length) == 4U);
    CHECK(map.ComputeIfAbsent("four", length) == 4U);
    CHECK(calls == 1);

    map.ComputeIfAbsent("four", length) = 10U;
    CHECK(map.Get("four").Value() == 10U);
}

TEST_CASE("HashMap ComputeIfPresent updates or removes", "[Containers][HashMap]")
{
    HashMap<std::string, int> map {{"a", 1}, {"b", 2}};

    int* updated = map.ComputeIfPresent("a", [](const std::string&, const int& value) {
        return Optional<int> {value + 10};
    });
    REQUIRE(updated != nullptr);
    CHECK(*updated == 11);

    CHECK(map.ComputeIfPresent("b", [](const std::string&, const int&) { return Optional<int> {}; }) == nullptr);
    CHECK_FALSE(map.Contains("b"));

    bool called = false;
    CHECK(map.ComputeIfPresent("zzz", [&](const std::string&, const int&) {
        called = true;
        return Optional<int> {1};
    }) == nullptr);
    CHECK_FALSE(called);
    CHECK_FALSE(map.Contains("zzz"));
}

TEST_CASE("HashMap Compute with an empty result removes the key", "[Containers][HashMap]")
{
    HashMap<std::string, int> map {{"present", 1}};
    auto                      drop = [](const std::string&, const int*) { return Optional<int> {}; };

    const auto generation = map.GetGeneration();
    CHECK(map.Compute("absent", drop) == nullptr);
    CHECK(map.Size() == 1U);
    CHECK(map.GetGeneration() == generation);

    CHECK(map.Compute("present", drop) == nullptr);
    CHECK_FALSE(map.Contains("present"));
    CHECK(map.GetGeneration() == generation + 1U);
}

TEST_CASE("HashMap Compute inserts and updates", "[Containers][HashMap]")
{
    HashMap<std::string, int> map;
    auto                      increment = [](const std::string&, const int* current) {
        return Optional<int> {current ? *current + 1 : 1};
    };

    CHECK(*map.Compute("hits", increment) == 1);
    CHECK(*map.Compute("hits", increment) == 2);
    CHECK(*map.Compute("hits", increment) == 3);
    CHECK(map.Size() == 1U);
}

TEST_CASE("HashMap Merge inserts, combines and removes", "[Containers][HashMap]")
{
    HashMap<std::string, std::string> map;
    auto                              concat = [](const std::string& existing, const std::string& value) {
        return Optional<std::string> {existing + value};
    };

    CHECK(*map.Merge("k", std::string {"a"}, concat) == "a");
    CHECK(*map.Merge("k", std::string {"b"}, concat) == "ab");

    auto drop = [](const std::string&, const std::string&) { return Optional<std::string> {}; };
    CHECK(map.Merge("k", std::string {"c"}, drop) == nullptr);
    CHECK_FALSE(map.Contains("k"));
}

TEST_CASE("HashMap composite operations leave the map unchanged when the function throws", "[Containers][HashMap]")
{
    HashMap<std::string, int> map {{"a", 1}};
    const auto                generation = map.GetGeneration();

    CHECK_THROWS_AS(map.ComputeIfAbsent("b", [](const std::string&) -> int { throw std::runtime_error("no"); }),
                    std::runtime_error);
    CHECK_THROWS_AS(map.Compute("a", [](const std::string&, const int*) -> Optional<int> { throw std::runtime_error("no"); }),
                    std::runtime_error);
    CHECK_THROWS_AS(map.Merge("a", 5, [](const int&, const int&) -> Optional<int> { throw std::runtime_error("no"); }),
                    std::runtime_error);

    CHECK(map.Size() == 1U);
    CHECK(map.Get("a").Value() == 1);
    CHECK(map.GetGeneration() == generation);
}

TEST_CASE("HashMap composite operations detect a function that modifies the map", "[Containers][HashMap]")
{
    HashMap<int, int> map {{1, 1}};

    CHECK_THROWS_AS(map.Compute(1,
                                [&](const int&, const int*) {
                                    map.Put(2, 2);
                                    return Optional<int> {5};
                                }),
                    Corral::Exceptions::ConcurrentModificationException);
    CHECK(map.Get(1).Value() == 1);

    CHECK_THROWS_AS(map.ComputeIfAbsent(3,
                                        [&](const int&) {
                                            map.Remove(2);
                                            return 3;
                                        }),
                    Corral::Exceptions::ConcurrentModificationException);
    CHECK_FALSE(map.Contains(3));
}

TEST_CASE("HashMap operator[] inserts and updates", "[Containers][HashMap]")
{
    HashMap<std::string, int> map;
    map["foo"] = 123;
    CHECK(map["foo"] == 123);
    map["foo"] += 1;
    CHECK(map.Get("foo").Value() == 124);
    CHECK(map.Size() == 1U);
}

TEST_CASE("HashMap ForEach and ReplaceAll visit every mapping", "[Containers][HashMap]")
{
    HashMap<int, int> map {{1, 10}, {2, 20}, {3, 30}};

    int sum = 0;
    map.ForEach([&](const int& key, const int& value) { sum += key + value; });
    CHECK(sum == 66);

    const auto generation = map.GetGeneration();
    map.ReplaceAll([](const int& key, const int& value) { return value * key; });
    CHECK(map.Get(2).Value() == 40);
    CHECK(map.Get(3).Value() == 90);
    CHECK(map.GetGeneration() == generation);

    CHECK_THROWS_AS(map.ForEach([&](const int& key, const int&) { map.Remove(key); }),
                    Corral::Exceptions::ConcurrentModificationException);
}

TEST_CASE("HashMap accepts the null key once and overwrites it", "[Containers][HashMap]")
{
    HashMap<std::optional<int>, std::string> map;

    CHECK_FALSE(map.Put(std::nullopt, "first").HasValue());
    CHECK(map.Put(std::nullopt, "second").Value() == "first");
    map.Put(std::optional<int> {0}, "zero");

    CHECK(map.Size() == 2U);
    CHECK(map.Get(std::nullopt).Value() == "second");
    CHECK(map.Get(std::optional<int> {0}).Value() == "zero");
}

TEST_CASE("HashMap entry view writes values without invalidating", "[Containers][HashMap]")
{
    HashMap<int, int> map {{1, 1}, {2, 2}};
    const auto        generation = map.GetGeneration();

    for (auto& entry: map.Entries())
        entry.SetValue(entry.GetValue() * 100);
    for (int& value: map.Values())
        value += 1;

    CHECK(map.Get(1).Value() == 101);
    CHECK(map.Get(2).Value() == 201);
    CHECK(map.GetGeneration() == generation);

    std::vector<int> keys;
    for (const int& key: map.Keys())
        keys.push_back(key);
    CHECK(keys.size() == 2U);
}

TEST_CASE("HashMap equality ignores capacity and order", "[Containers][HashMap]")
{
    HashMap<int, int> small {{1, 1}, {2, 2}};
    HashMap<int, int> large {Corral::Containers::HashTableOptions {.initialCapacity = 1024}};
    large.Put(2, 2);
    large.Put(1, 1);

    CHECK(small == large);
    large.Put(1, 5);
    CHECK_FALSE(small == large);
}
