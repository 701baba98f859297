/// @file NullTraits.hpp
/// @brief Names the "null-equivalent" value of a type, if it has one.
///
/// Hash tables route a null-equivalent key into a dedicated slot outside the hashed buckets.
/// The deque refuses to store a null-equivalent element. Types without a specialization have
/// no null-equivalent and never take either path.
#pragma once

#include <Corral/Utilities/Optional.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace Corral::Containers
{
    template<class T>
    struct NullTraits
    {
        static constexpr bool HasNull = false;
    };

    template<class T>
    struct NullTraits<T*>
    {
        static constexpr bool HasNull = true;
        static constexpr bool IsNull(const T* value) noexcept { return value == nullptr; }
    };

    template<>
    struct NullTraits<std::nullptr_t>
    {
        static constexpr bool HasNull = true;
        static constexpr bool IsNull(std::nullptr_t) noexcept { return true; }
    };

    template<class U>
    struct NullTraits<Utilities::Optional<U>>
    {
        static constexpr bool HasNull = true;
        static bool IsNull(const Utilities::Optional<U>& value) noexcept { return !value.HasValue(); }
    };

    template<class U>
    struct NullTraits<std::optional<U>>
    {
        static constexpr bool HasNull = true;
        static bool IsNull(const std::optional<U>& value) noexcept { return !value.has_value(); }
    };

    template<class U, class D>
    struct NullTraits<std::unique_ptr<U, D>>
    {
        static constexpr bool HasNull = true;
        static bool IsNull(const std::unique_ptr<U, D>& value) noexcept { return value == nullptr; }
    };

    template<class U>
    struct NullTraits<std::shared_ptr<U>>
    {
        static constexpr bool HasNull = true;
        static bool IsNull(const std::shared_ptr<U>& value) noexcept { return value == nullptr; }
    };

    /// @brief True when `value` is the null-equivalent of its type.
    template<class T>
    [[nodiscard]] constexpr bool IsNullEquivalent(const T& value) noexcept
    {
        if constexpr (NullTraits<T>::HasNull)
        {
            return NullTraits<T>::IsNull(value);
        }
        else
        {
            (void) value;
            return false;
        }
    }
}// namespace Corral::Containers
