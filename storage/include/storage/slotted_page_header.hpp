#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "storage/types.hpp"

// Bookkeeping for a slotted page: the contiguous header fields followed by a
// slot occupancy bitmap.
//
//   byte 0      flags (bit 0 = dirty)
//   byte 1      padding, always 0
//   bytes 2-3   tuple size        (u16, little-endian)
//   bytes 4-5   free space offset (u16, little-endian; always header_size())
//   bytes 6-7   page capacity     (u16, little-endian)
//   bytes 8..   bitmap, ceil(slot_capacity / 8) bytes
//
// Bit i lives in byte i / 8 under mask 0x80 >> (i % 8); padding bits in the
// last byte are zero. Slot capacity is derived from tuple size and page
// capacity, never stored, so pack and unpack must agree on
// compute_slot_capacity().
class SlottedPageHeader {
public:
    static constexpr size_t BASE_SIZE = 8;
    static constexpr uint8_t DIRTY_MASK = 0x01;

    SlottedPageHeader(uint8_t* buffer, size_t buffer_size, uint16_t tuple_size);

    static SlottedPageHeader unpack(const uint8_t* buffer, size_t buffer_size);
    void pack(uint8_t* out) const;
    Bytes pack() const;

    // Largest n with BASE_SIZE + tuple_size * n + ceil(n / 8) <= page_capacity.
    static size_t compute_slot_capacity(size_t page_capacity, size_t tuple_size);

    size_t header_size() const { return BASE_SIZE + (bitmap_.size() + 7) / 8; }
    size_t slot_capacity() const { return bitmap_.size(); }
    uint16_t tuple_size() const { return tuple_size_; }
    uint16_t page_capacity() const { return page_capacity_; }
    uint16_t free_space_offset() const { return free_space_offset_; }
    uint8_t flags() const { return flags_; }

    bool flag(uint8_t mask) const { return (flags_ & mask) != 0; }
    void set_flag(uint8_t mask, bool on);

    bool is_dirty() const { return flag(DIRTY_MASK); }
    void set_dirty(bool dirty) { set_flag(DIRTY_MASK, dirty); }

    // Slot operations. Indices at or past slot_capacity() are never live.
    bool has_slot(size_t slot) const { return slot < bitmap_.size() && bitmap_[slot]; }
    void set_slot(size_t slot);
    void reset_slot(size_t slot);
    size_t offset_of_slot(size_t slot) const { return header_size() + slot * tuple_size_; }
    std::vector<size_t> free_slots() const;
    std::vector<size_t> used_slots() const;
    std::optional<size_t> next_used_slot(size_t from) const;

    size_t num_tuples() const;
    size_t free_space() const { return (bitmap_.size() - num_tuples()) * tuple_size_; }
    size_t used_space() const { return num_tuples() * tuple_size_; }
    bool has_free_tuple() const;

    // First-fit: marks the lowest unset slot as used and returns its index,
    // or nullopt when every slot is taken.
    std::optional<size_t> next_free_tuple();

    bool operator==(const SlottedPageHeader& other) const;
    bool operator!=(const SlottedPageHeader& other) const { return !(*this == other); }

private:
    SlottedPageHeader(uint8_t flags, uint16_t tuple_size, uint16_t free_space_offset,
                      uint16_t page_capacity, std::vector<bool> bitmap);

    uint8_t flags_;
    uint16_t tuple_size_;
    uint16_t free_space_offset_;
    uint16_t page_capacity_;
    std::vector<bool> bitmap_;
};
