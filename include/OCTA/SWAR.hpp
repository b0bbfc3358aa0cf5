#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Umbrella header for the OCTA SWAR byte-lane types and the algorithms built
// on them.

#include "OCTA/SWAR/Config.hpp"
#include "OCTA/SWAR/Forward.hpp"
#include "OCTA/SWAR/Mask8x8.hpp"
#include "OCTA/SWAR/U8x8.hpp"
#include "OCTA/SWAR/ByteSlice.hpp"
#include "OCTA/SWAR/Scan.hpp"
#include "OCTA/SWAR/Format.hpp"
