#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "storage/types.hpp"

// Bookkeeping for a contiguous (write-once) page of fixed-size tuples.
//
// Tuples are appended at free_space_offset, which only moves forward on
// insert and back by one tuple width on delete. The on-page record is
//
//   byte 0      flags (bit 0 = dirty)
//   byte 1      padding, always 0
//   bytes 2-3   tuple size        (u16, little-endian)
//   bytes 4-5   free space offset (u16, little-endian)
//   bytes 6-7   page capacity     (u16, little-endian)
//
// The page refreshes this record only when it is packed; in between, the
// in-memory header is authoritative.
class PageHeader {
public:
    static constexpr size_t SIZE = 8;
    static constexpr uint8_t DIRTY_MASK = 0x01;

    struct TupleRange {
        size_t tuple_index;
        size_t start;
        size_t end;
    };

    // Initialises an empty header for a page of buffer_size bytes and writes
    // its packed form to the start of buffer.
    PageHeader(uint8_t* buffer, size_t buffer_size, uint16_t tuple_size);

    static PageHeader unpack(const uint8_t* buffer, size_t buffer_size);
    void pack(uint8_t* out) const;
    Bytes pack() const;

    size_t header_size() const { return SIZE; }
    uint16_t tuple_size() const { return tuple_size_; }
    uint16_t page_capacity() const { return page_capacity_; }
    uint16_t free_space_offset() const { return free_space_offset_; }
    uint8_t flags() const { return flags_; }

    bool flag(uint8_t mask) const { return (flags_ & mask) != 0; }
    void set_flag(uint8_t mask, bool on);

    bool is_dirty() const { return flag(DIRTY_MASK); }
    void set_dirty(bool dirty) { set_flag(DIRTY_MASK, dirty); }

    size_t num_tuples() const { return used_space() / tuple_size_; }
    size_t free_space() const { return page_capacity_ - free_space_offset_; }
    size_t used_space() const { return free_space_offset_ - SIZE; }
    bool has_free_tuple() const { return free_space() >= tuple_size_; }

    // Allocates the next tuple and returns its byte offset in the page, or
    // nullopt once the page is full. A returned offset is consumed; callers
    // must write the tuple there.
    std::optional<uint16_t> next_free_tuple();

    // Like next_free_tuple(), reported as (tuple index, start, end).
    std::optional<TupleRange> next_tuple_range();

    // Gives back the last allocated tuple. Returns false on an empty page.
    bool release_last_tuple();

    bool operator==(const PageHeader& other) const;
    bool operator!=(const PageHeader& other) const { return !(*this == other); }

private:
    PageHeader(uint8_t flags, uint16_t tuple_size, uint16_t free_space_offset,
               uint16_t page_capacity);

    uint8_t flags_;
    uint16_t tuple_size_;
    uint16_t free_space_offset_;
    uint16_t page_capacity_;
};

namespace std {
template <>
struct hash<PageHeader> {
    size_t operator()(const PageHeader& h) const {
        size_t seed = std::hash<uint16_t>{}(h.tuple_size());
        seed = seed * 31 + std::hash<uint16_t>{}(h.free_space_offset());
        seed = seed * 31 + std::hash<uint16_t>{}(h.page_capacity());
        return seed * 31 + h.flags();
    }
};
} // namespace std
