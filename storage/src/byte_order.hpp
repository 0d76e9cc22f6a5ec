#pragma once
#include <cstdint>

// Page headers are stored little-endian regardless of host order.

inline void store_u16(uint8_t* out, uint16_t v) {
    out[0] = static_cast<uint8_t>(v);
    out[1] = static_cast<uint8_t>(v >> 8);
}

inline uint16_t load_u16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (uint16_t(in[1]) << 8));
}
