/// @file Expected.hpp
/// @brief `Corral::Utilities::Expected<T, E>`: "value or typed error" result used by fail-fast cursors.
#pragma once

#include <Corral/Defines.hpp>
#include <Corral/Primitives.hpp>
#include <Corral/Utilities/Optional.hpp>

#include <new>
#include <type_traits>
#include <utility>

namespace Corral::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    template <class E>
    class Unexpected
    {
    public:
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E& Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&& Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    namespace detail
    {
        [[noreturn]] inline void ExpectedFailNoValue() noexcept
        {
            CORRAL_ASSERT(false && "Corral::Utilities::Expected::Value called when holding error");
            CORRAL_ABORT("Corral::Utilities::Expected::Value called when holding error");
        }

        [[noreturn]] inline void ExpectedFailNoError() noexcept
        {
            CORRAL_ASSERT(false && "Corral::Utilities::Expected::Error called when holding value");
            CORRAL_ABORT("Corral::Utilities::Expected::Error called when holding value");
        }
    }// namespace detail

    /// @brief Inline "value or error" return type with explicit lifetime and zero allocations.
    ///
    /// Both alternatives must be nothrow-move-constructible so state transitions cannot fail halfway.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template <class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");
        static_assert(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>,
                      "Expected requires nothrow move constructible value and error types.");

    public:
        using ValueType = T;
        using ErrorType = E;

        template <class... Args>
        explicit Expected(InPlaceType<T>, Args&&... args)
            : m_hasValue {true}
        {
            ::new (static_cast<void*>(&m_value)) T(std::forward<Args>(args)...);
        }

        explicit Expected(const T& value)
            : m_hasValue {true}
        {
            ::new (static_cast<void*>(&m_value)) T(value);
        }

        explicit Expected(T&& value) noexcept
            : m_hasValue {true}
        {
            ::new (static_cast<void*>(&m_value)) T(std::move(value));
        }

        explicit Expected(const Unexpected<E>& unexpected)
            : m_hasValue {false}
        {
            ::new (static_cast<void*>(&m_error)) E(unexpected.Error());
        }

        explicit Expected(Unexpected<E>&& unexpected) noexcept
            : m_hasValue {false}
        {
            ::new (static_cast<void*>(&m_error)) E(std::move(unexpected).Error());
        }

        Expected(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                ::new (static_cast<void*>(&m_value)) T(other.m_value);
            else
                ::new (static_cast<void*>(&m_error)) E(other.m_error);
        }

        Expected(Expected&& other) noexcept
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                ::new (static_cast<void*>(&m_value)) T(std::move(other.m_value));
            else
                ::new (static_cast<void*>(&m_error)) E(std::move(other.m_error));
        }

        Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
        {
            if (this != &other)
            {
                Expected copy {other};
                *this = std::move(copy);
            }
            return *this;
        }

        Expected& operator=(Expected&& other) noexcept
        {
            if (this == &other)
                return *this;
            DestroyActive();
            m_hasValue = other.m_hasValue;
            if (m_hasValue)
                ::new (static_cast<void*>(&m_value)) T(std::move(other.m_value));
            else
                ::new (static_cast<void*>(&m_error)) E(std::move(other.m_error));
            return *this;
        }

        ~Expected() { DestroyActive(); }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return m_hasValue; }

        /// @brief Checked accessor: if holding an error, triggers the contract policy.
        [[nodiscard]] T& Value() & noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] const T& Value() const& noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] T&& Value() && noexcept
        {
            if (CORRAL_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return std::move(m_value);
        }

        /// @brief Checked accessor: if holding a value, triggers the contract policy.
        [[nodiscard]] const E& Error() const& noexcept
        {
            if (CORRAL_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] E&& Error() && noexcept
        {
            if (CORRAL_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return std::move(m_error);
        }

        [[nodiscard]] const T& ValueOr(const T& fallback) const& noexcept
        {
            return m_hasValue ? m_value : fallback;
        }

    private:
        void DestroyActive() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    m_value.~T();
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    m_error.~E();
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue;
    };

    /// @brief Specialization for "success or error" without a value payload.
    template <class E>
    class [[nodiscard]] Expected<void, E>
    {
        static_assert(!std::is_reference_v<E>, "Expected<void,E&> is not supported.");

    public:
        using ValueType = void;
        using ErrorType = E;

        /// @brief Constructs a success state.
        constexpr Expected() noexcept = default;

        explicit Expected(const Unexpected<E>& unexpected)
            : m_error {unexpected.Error()}
            , m_hasValue {false}
        {
        }

        explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(unexpected).Error()}
            , m_hasValue {false}
        {
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return m_hasValue; }

        [[nodiscard]] const E& Error() const& noexcept
        {
            if (CORRAL_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

    private:
        E    m_error {};
        bool m_hasValue {true};
    };
}// namespace Corral::Utilities
