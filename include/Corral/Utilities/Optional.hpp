/// @file Optional.hpp
/// @brief `Corral::Utilities::Optional<T>`: the "value or absence" result type of every container query.
#pragma once

#include <Corral/Defines.hpp>
#include <Corral/Memory/StorageFor.hpp>
#include <Corral/Primitives.hpp>

#include <concepts>
#include <type_traits>
#include <utility>

namespace Corral::Utilities
{
    /// @brief Tag for an empty `Optional`, as in `Optional<int> none {nullopt};`.
    struct nullopt_t
    {
        explicit constexpr nullopt_t(int) noexcept {}
    };

    inline constexpr nullopt_t nullopt {0};

    /// @brief Selects the in-place constructors of `Optional` and `Expected`.
    template <class T>
    struct InPlaceType
    {
        explicit constexpr InPlaceType() noexcept = default;
    };

    /// @brief Inline "maybe a T" with explicit lifetime and zero allocations.
    ///
    /// @details
    /// - Empty state is an internal flag, never a reserved value of `T`.
    /// - Checked accessors (`Value()`) follow a contract-fatal policy: assert in debug, abort in release.
    /// - Unsafe accessors (`operator*`, `operator->`) are undefined behavior if empty.
    ///
    /// @tparam T Stored value type. References are not supported.
    template <class T>
    class Optional
    {
        static_assert(!std::is_reference_v<T>, "Optional<T&> is not supported.");

    public:
        using ValueType = T;

        constexpr Optional() noexcept = default;

        constexpr Optional(nullopt_t) noexcept {}

        /// @note `explicit` to avoid accidental implicit conversions into `Optional<T>`.
        explicit Optional(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            requires(std::is_copy_constructible_v<T>)
        {
            Engage(value);
        }

        explicit Optional(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            requires(std::is_move_constructible_v<T>)
        {
            Engage(std::move(value));
        }

        template <class... Args>
        explicit Optional(InPlaceType<T>, Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        {
            Engage(std::forward<Args>(args)...);
        }

        Optional(const Optional& other) noexcept(std::is_nothrow_copy_constructible_v<T>)
            requires(std::is_copy_constructible_v<T>)
        {
            if (other.m_hasValue)
                Engage(other.m_value.Ref());
        }

        Optional(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
            requires(std::is_move_constructible_v<T>)
        {
            if (other.m_hasValue)
                Engage(std::move(other.m_value.Ref()));
        }

        Optional& operator=(const Optional& other)
            requires(std::is_copy_constructible_v<T>)
        {
            if (this == &other)
                return *this;
            if (!other.m_hasValue)
            {
                Reset();
                return *this;
            }
            if (m_hasValue)
            {
                if constexpr (std::is_copy_assignable_v<T>)
                {
                    m_value.Ref() = other.m_value.Ref();
                    return *this;
                }
                Reset();
            }
            Engage(other.m_value.Ref());
            return *this;
        }

        Optional& operator=(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                       (!std::is_move_assignable_v<T> || std::is_nothrow_move_assignable_v<T>))
            requires(std::is_move_constructible_v<T>)
        {
            if (this == &other)
                return *this;
            if (!other.m_hasValue)
            {
                Reset();
                return *this;
            }
            if (m_hasValue)
            {
                if constexpr (std::is_move_assignable_v<T>)
                {
                    m_value.Ref() = std::move(other.m_value.Ref());
                    return *this;
                }
                Reset();
            }
            Engage(std::move(other.m_value.Ref()));
            return *this;
        }

        Optional& operator=(nullopt_t) noexcept
        {
            Reset();
            return *this;
        }

        ~Optional() { Reset(); }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return m_hasValue; }

        /// @brief Returns a pointer to the contained value, or `nullptr` if empty.
        [[nodiscard]] T* Ptr() noexcept { return m_hasValue ? m_value.Ptr() : nullptr; }
        [[nodiscard]] const T* Ptr() const noexcept { return m_hasValue ? m_value.Ptr() : nullptr; }

        /// @brief Checked accessor: if empty, triggers the contract policy.
        T& Value() & noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                FailEmpty();
            return m_value.Ref();
        }

        const T& Value() const& noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                FailEmpty();
            return m_value.Ref();
        }

        T&& Value() && noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                FailEmpty();
            return std::move(m_value.Ref());
        }

        /// @warning Undefined behavior if the optional is empty.
        T& operator*() noexcept { return m_value.Ref(); }
        const T& operator*() const noexcept { return m_value.Ref(); }
        T* operator->() noexcept { return m_value.Ptr(); }
        const T* operator->() const noexcept { return m_value.Ptr(); }

        /// @brief Returns the contained value if present, otherwise `fallback`.
        [[nodiscard]] const T& ValueOr(const T& fallback) const& noexcept
        {
            return m_hasValue ? m_value.Ref() : fallback;
        }

        [[nodiscard]] T ValueOr(T fallback) && noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            return m_hasValue ? std::move(m_value.Ref()) : std::move(fallback);
        }

        void Reset() noexcept
        {
            if (m_hasValue)
            {
                m_value.Destroy();
                m_hasValue = false;
            }
        }

        /// @brief Destroys any existing value and constructs a new one in-place.
        template <class... Args>
        T& Emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        {
            Reset();
            return Engage(std::forward<Args>(args)...);
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
            requires requires(const T& a, const T& b) { { a == b } -> std::convertible_to<bool>; }
        {
            if (lhs.m_hasValue != rhs.m_hasValue)
                return false;
            return !lhs.m_hasValue || *lhs == *rhs;
        }

    private:
        [[noreturn]] static void FailEmpty() noexcept
        {
            CORRAL_ASSERT(false && "Corral::Utilities::Optional::Value called when empty");
            CORRAL_ABORT("Corral::Utilities::Optional::Value called when empty");
        }

        template <class... Args>
        T& Engage(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        {
            T& ref     = m_value.Construct(std::forward<Args>(args)...);
            m_hasValue = true;
            return ref;
        }

        Memory::StorageFor<T> m_value {};
        bool                  m_hasValue {false};
    };

    /// @brief Builds an engaged optional, deducing `T`.
    template <class T>
    [[nodiscard]] Optional<std::decay_t<T>> MakeOptional(T&& value)
    {
        return Optional<std::decay_t<T>> {std::forward<T>(value)};
    }
}// namespace Corral::Utilities
