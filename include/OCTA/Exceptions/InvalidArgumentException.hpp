#pragma once

/// @file InvalidArgumentException.hpp
/// @brief Declares the InvalidArgumentException class.

#include <OCTA/Exceptions/Exception.hpp>

namespace OCTA::Exceptions
{
    /// @class InvalidArgumentException
    /// @brief Exception thrown when an argument violates a function's contract,
    /// such as a null buffer paired with a non-zero length.
    class InvalidArgumentException : public Exception
    {
    public:
        using Exception::Exception;
    };
}// namespace OCTA::Exceptions
