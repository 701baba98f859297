#pragma once

#include <stdexcept>
#include <string>

namespace Corral::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions thrown by Corral.
    ///
    /// @details
    /// Every Corral failure that is reported by exception derives from this type, so callers can
    /// catch the whole family in one place while still branching on the concrete type.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor.
        explicit Exception(const char* message)
            : std::runtime_error(message)
        {
        }

        /// @brief Constructor with an owned message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message)
        {
        }

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace Corral::Exceptions
