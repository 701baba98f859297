#pragma once

/// @file ContainerExceptions.hpp
/// @brief Typed failures reported by the throwing forms of the Corral containers.

#include <Corral/Exceptions/Exception.hpp>

namespace Corral::Exceptions
{
    /// @class EmptyContainerException
    /// @brief Thrown by the throwing pop/peek forms when the container holds no element.
    ///
    /// @details
    /// Fatal to the call only. The container is unchanged and remains usable.
    class EmptyContainerException : public Exception
    {
    public:
        EmptyContainerException()
            : Exception("container is empty")
        {
        }

        explicit EmptyContainerException(const char* message)
            : Exception(message)
        {
        }
    };

    /// @class FullContainerException
    /// @brief Thrown by the throwing push forms of a capacity-bounded container that is full.
    class FullContainerException : public Exception
    {
    public:
        FullContainerException()
            : Exception("container is full")
        {
        }

        explicit FullContainerException(const char* message)
            : Exception(message)
        {
        }
    };

    /// @class InvalidElementException
    /// @brief Thrown when a caller tries to store a null-equivalent element into a container that reserves it.
    ///
    /// @details
    /// Raised before any state change, so the container's contents and generation are untouched.
    class InvalidElementException : public Exception
    {
    public:
        InvalidElementException()
            : Exception("null-equivalent elements cannot be stored")
        {
        }

        explicit InvalidElementException(const char* message)
            : Exception(message)
        {
        }
    };

    /// @class ConcurrentModificationException
    /// @brief Thrown when a structural change is observed where none was allowed.
    ///
    /// @details
    /// Raised by range-for iterators whose snapshotted generation no longer matches their container,
    /// and by composite map operations whose callback structurally modified the same map.
    /// Fatal to the iterator or call only; a freshly created iterator over the container works.
    class ConcurrentModificationException : public Exception
    {
    public:
        ConcurrentModificationException()
            : Exception("container was structurally modified during iteration")
        {
        }

        explicit ConcurrentModificationException(const char* message)
            : Exception(message)
        {
        }
    };
}// namespace Corral::Exceptions
