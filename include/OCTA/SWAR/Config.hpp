#pragma once

// SPDX-License-Identifier: Apache-2.0
//
// Common compile-time configuration knobs for the OCTA SWAR byte-lane types.

// Scan thresholds -------------------------------------------------------------
// Buffers shorter than this many bytes are scanned one byte at a time. Below a
// few words the aligned split costs more than it saves.
#ifndef OCTA_SWAR_SCAN_MIN_BYTES
#define OCTA_SWAR_SCAN_MIN_BYTES 32
#endif

// Lane index checks -----------------------------------------------------------
// Define to 1 to assert lane indices in the unchecked accessors (GetLane). The
// checked accessors (At) always validate and throw.
#ifndef OCTA_SWAR_ENABLE_LANE_CHECKS
#if defined(NDEBUG)
#define OCTA_SWAR_ENABLE_LANE_CHECKS 0
#else
#define OCTA_SWAR_ENABLE_LANE_CHECKS 1
#endif
#endif
