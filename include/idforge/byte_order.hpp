#pragma once

#include <array>
#include <cstdint>

namespace idforge {

// Swap bytes 0<->3, 1<->2, 4<->5 and 6<->7 in place; bytes 8..15 are left
// alone. Converts between RFC network order and the mixed-endian GUID
// layout (time_low, time_mid and time_hi_and_version stored little-endian).
// The operation is its own inverse.
//
// buf must point to at least 16 bytes.
void swap_byte_order(uint8_t* buf);
void swap_byte_order(std::array<uint8_t, 16>& buf);

} // namespace idforge
