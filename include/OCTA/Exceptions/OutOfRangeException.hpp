#pragma once

/// @file OutOfRangeException.hpp
/// @brief Declares the OutOfRangeException class.

#include <OCTA/Exceptions/Exception.hpp>

namespace OCTA::Exceptions
{
    /// @class OutOfRangeException
    /// @brief Exception thrown when an index falls outside the valid range of a container.
    class OutOfRangeException : public Exception
    {
    public:
        using Exception::Exception;
    };
}// namespace OCTA::Exceptions
