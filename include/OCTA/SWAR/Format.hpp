/// @file Format.hpp
/// <summary>
/// Stream insertion for the byte-lane types, used by diagnostics and test reports.
/// </summary>
#pragma once

#include <ostream>

#include "OCTA/SWAR/U8x8.hpp"

namespace OCTA::SWAR
{
    /// <summary>
    /// Prints the lanes in lane order, e.g. <c>U8x8[1, 2, 3, 4, 5, 6, 7, 8]</c>.
    /// </summary>
    inline std::ostream& operator<<(std::ostream& os, const U8x8& value)
    {
        os << "U8x8[";
        const auto lanes = value.ToArray();
        for (std::size_t lane = 0; lane < lanes.size(); ++lane)
        {
            if (lane != 0)
            {
                os << ", ";
            }
            os << static_cast<unsigned>(lanes[lane]);
        }
        return os << ']';
    }

    /// <summary>
    /// Prints the lanes in lane order, e.g. <c>Mask8x8[true, false, ...]</c>.
    /// </summary>
    inline std::ostream& operator<<(std::ostream& os, const Mask8x8& mask)
    {
        os << "Mask8x8[";
        const auto lanes = mask.ToArray();
        for (std::size_t lane = 0; lane < lanes.size(); ++lane)
        {
            if (lane != 0)
            {
                os << ", ";
            }
            os << (lanes[lane] ? "true" : "false");
        }
        return os << ']';
    }
}// namespace OCTA::SWAR
