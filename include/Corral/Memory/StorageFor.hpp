#pragma once

#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace Corral::Memory
{
    /// @brief Raw, properly-aligned inline storage for a value of type `T` without tracking lifetime.
    ///
    /// @details
    /// `StorageFor<T>` is `sizeof(T)` bytes with `alignof(T)` alignment plus helpers to construct,
    /// access and destroy a `T` in place. It has no "engaged" flag: the owner (Optional, Expected,
    /// a deque slot ring) tracks which slots hold a live object.
    ///
    /// Undefined behavior contracts:
    /// - `Ptr()` / `Ref()` / `Destroy()` when no `T` is alive.
    /// - `Construct()` twice without destroying the previous object.
    ///
    /// @tparam T The stored type. References are not supported.
    template <class T>
    class StorageFor
    {
        static_assert(!std::is_reference_v<T>, "StorageFor<T&> is not supported.");

    public:
        using ValueType = T;

        constexpr StorageFor() noexcept = default;

        StorageFor(const StorageFor&)            = delete;
        StorageFor& operator=(const StorageFor&) = delete;

        ~StorageFor() = default;

        /// @warning Undefined behavior if no `T` is alive.
        T* Ptr() noexcept
        {
            return std::launder(reinterpret_cast<T*>(m_data));
        }

        /// @warning Undefined behavior if no `T` is alive.
        const T* Ptr() const noexcept
        {
            return std::launder(reinterpret_cast<const T*>(m_data));
        }

        T& Ref() noexcept { return *Ptr(); }
        const T& Ref() const noexcept { return *Ptr(); }

        /// @brief Constructs a `T` in-place using perfect forwarding.
        template <class... Args>
        T& Construct(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>)
        {
            ::new (static_cast<void*>(m_data)) T(std::forward<Args>(args)...);
            return Ref();
        }

        /// @brief Destroys the contained `T`; a no-op for trivially destructible types.
        void Destroy() noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
            {
                Ref().~T();
            }
        }

        void DestroyIf(bool isAlive) noexcept
        {
            if (isAlive)
            {
                Destroy();
            }
        }

    private:
        alignas(T) std::byte m_data[sizeof(T)];
    };
}// namespace Corral::Memory
