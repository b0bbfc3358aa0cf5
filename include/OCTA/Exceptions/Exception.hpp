#pragma once

#include <stdexcept>
#include <string>

namespace OCTA::Exceptions
{
    /// @class Exception
    /// @brief Base class for all exceptions in OCTA.
    ///
    /// @details
    /// `Exception` is the base class for all exceptions in OCTA. It provides a common interface
    /// for exception handling and allows for retrieval of the exception message.
    class Exception : public std::runtime_error
    {
    public:
        /// @brief Constructor with a C-style string message.
        explicit Exception(const char* message)
            : std::runtime_error(message) {}

        /// @brief Constructor with a string message.
        explicit Exception(const std::string& message)
            : std::runtime_error(message) {}

        /// @brief Destructor.
        ~Exception() noexcept override = default;

        /// @brief Returns the exception message.
        [[nodiscard]] const char* GetMessage() const noexcept { return this->what(); }
    };
}// namespace OCTA::Exceptions
