#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Primary type forward declarations for the OCTA SWAR byte-lane types.

#include "OCTA/SWAR/Config.hpp"

namespace OCTA::SWAR {

// Forward declarations --------------------------------------------------------
class U8x8;
class Mask8x8;

template<class Byte, class Word>
struct ByteSlice;

// Lane geometry ---------------------------------------------------------------
inline constexpr int laneCount = 8;
inline constexpr int laneBits  = 8;

} // namespace OCTA::SWAR
