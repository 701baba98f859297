/// @file StorageForTests.cpp
/// @brief Tests for Corral::Memory::StorageFor.

#include <Corral/Memory/StorageFor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <type_traits>

namespace
{
    struct NonTrivial
    {
        inline static int s_destructCount = 0;

        NonTrivial() = default;
        explicit NonTrivial(int v)
            : value {v}
        {
        }
        NonTrivial(const NonTrivial&)            = default;
        NonTrivial(NonTrivial&&)                 = default;
        NonTrivial& operator=(const NonTrivial&) = default;
        NonTrivial& operator=(NonTrivial&&)      = default;

        ~NonTrivial() { ++s_destructCount; }

        int value {0};
    };

    static_assert(!std::is_trivially_destructible_v<NonTrivial>);
}// namespace

TEST_CASE("StorageFor is never copyable", "[Memory][StorageFor]")
{
    static_assert(!std::is_copy_constructible_v<Corral::Memory::StorageFor<int>>);
    static_assert(!std::is_copy_assignable_v<Corral::Memory::StorageFor<NonTrivial>>);
    static_assert(sizeof(Corral::Memory::StorageFor<NonTrivial>) == sizeof(NonTrivial));
    static_assert(alignof(Corral::Memory::StorageFor<double>) == alignof(double));
}

TEST_CASE("StorageFor Construct/Ref/Destroy drives lifetime", "[Memory][StorageFor]")
{
    NonTrivial::s_destructCount = 0;

    Corral::Memory::StorageFor<NonTrivial> storage;
    storage.Construct(7);
    storage.Ref().value += 35;

    CHECK(storage.Ref().value == 42);
    CHECK(storage.Ptr() == &storage.Ref());

    storage.Destroy();
    CHECK(NonTrivial::s_destructCount == 1);

    storage.DestroyIf(false);
    CHECK(NonTrivial::s_destructCount == 1);
}
