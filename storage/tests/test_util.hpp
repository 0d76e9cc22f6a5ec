#pragma once
#include <cstdint>
#include <vector>

#include "storage/types.hpp"

// 16-byte employee record: id and age as little-endian u32, then padding.
constexpr uint16_t EMPLOYEE_SIZE = 16;

inline Bytes employee(uint32_t id, uint32_t age) {
    Bytes buf(EMPLOYEE_SIZE, 0);
    for (int i = 0; i < 4; i++) buf[i] = static_cast<uint8_t>(id >> (i * 8));
    for (int i = 0; i < 4; i++) buf[4 + i] = static_cast<uint8_t>(age >> (i * 8));
    return buf;
}

inline uint32_t read_u32(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; i++) v |= (uint32_t(p[i]) << (i * 8));
    return v;
}

inline uint32_t employee_id(const TupleView& t) { return read_u32(t.data()); }
inline uint32_t employee_age(const TupleView& t) { return read_u32(t.data() + 4); }
