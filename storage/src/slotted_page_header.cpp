#include "storage/slotted_page_header.hpp"
#include "storage/config.hpp"
#include "storage/errors.hpp"
#include "byte_order.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

SlottedPageHeader::SlottedPageHeader(uint8_t* buffer, size_t buffer_size, uint16_t tuple_size)
    : flags_(0), tuple_size_(tuple_size), free_space_offset_(0),
      page_capacity_(static_cast<uint16_t>(buffer_size)) {
    if (buffer == nullptr || buffer_size == 0) {
        throw InvalidConstruction("No backing buffer supplied for SlottedPageHeader");
    }
    if (buffer_size > MAX_PAGE_SIZE) {
        throw InvalidConstruction("Page of " + std::to_string(buffer_size) +
                                  " bytes does not fit the header capacity field");
    }
    if (tuple_size == 0) {
        throw InvalidConstruction("No tuple size supplied for SlottedPageHeader");
    }
    size_t capacity = compute_slot_capacity(buffer_size, tuple_size);
    if (capacity == 0) {
        throw InvalidConstruction("Tuple of " + std::to_string(tuple_size) +
                                  " bytes does not fit in a " + std::to_string(buffer_size) +
                                  " byte slotted page");
    }
    bitmap_.assign(capacity, false);
    free_space_offset_ = static_cast<uint16_t>(header_size());
    pack(buffer);
}

SlottedPageHeader::SlottedPageHeader(uint8_t flags, uint16_t tuple_size,
                                     uint16_t free_space_offset, uint16_t page_capacity,
                                     std::vector<bool> bitmap)
    : flags_(flags), tuple_size_(tuple_size), free_space_offset_(free_space_offset),
      page_capacity_(page_capacity), bitmap_(std::move(bitmap)) {}

size_t SlottedPageHeader::compute_slot_capacity(size_t page_capacity, size_t tuple_size) {
    if (tuple_size == 0 || page_capacity <= BASE_SIZE) {
        return 0;
    }
    size_t avail = page_capacity - BASE_SIZE;
    // Ignoring the rounding of the bitmap gives an upper bound.
    size_t capacity = (8 * avail) / (8 * tuple_size + 1);
    while (capacity > 0 && tuple_size * capacity + (capacity + 7) / 8 > avail) {
        --capacity;
    }
    return capacity;
}

SlottedPageHeader SlottedPageHeader::unpack(const uint8_t* buffer, size_t buffer_size) {
    if (buffer == nullptr || buffer_size < BASE_SIZE) {
        throw InvalidConstruction("Buffer too small to hold a slotted page header");
    }
    uint8_t flags = buffer[0];
    uint16_t tuple_size = load_u16(buffer + 2);
    uint16_t free_space_offset = load_u16(buffer + 4);
    uint16_t page_capacity = load_u16(buffer + 6);

    size_t capacity = compute_slot_capacity(page_capacity, tuple_size);
    size_t bitmap_bytes = (capacity + 7) / 8;
    if (capacity == 0 || buffer_size < BASE_SIZE + bitmap_bytes ||
        free_space_offset != BASE_SIZE + bitmap_bytes) {
        throw StorageError("Corrupt slotted page header: tuple_size=" +
                           std::to_string(tuple_size) +
                           " page_capacity=" + std::to_string(page_capacity));
    }

    std::vector<bool> bitmap(capacity, false);
    const uint8_t* bits = buffer + BASE_SIZE;
    for (size_t i = 0; i < capacity; ++i) {
        bitmap[i] = (bits[i / 8] & (0x80 >> (i % 8))) != 0;
    }
    return SlottedPageHeader(flags, tuple_size, free_space_offset, page_capacity,
                             std::move(bitmap));
}

void SlottedPageHeader::pack(uint8_t* out) const {
    out[0] = flags_;
    out[1] = 0;
    store_u16(out + 2, tuple_size_);
    store_u16(out + 4, free_space_offset_);
    store_u16(out + 6, page_capacity_);

    uint8_t* bits = out + BASE_SIZE;
    std::fill(bits, bits + (bitmap_.size() + 7) / 8, 0);
    for (size_t i = 0; i < bitmap_.size(); ++i) {
        if (bitmap_[i]) {
            bits[i / 8] = static_cast<uint8_t>(bits[i / 8] | (0x80 >> (i % 8)));
        }
    }
}

Bytes SlottedPageHeader::pack() const {
    Bytes out(header_size(), 0);
    pack(out.data());
    return out;
}

void SlottedPageHeader::set_flag(uint8_t mask, bool on) {
    if (on) {
        flags_ = static_cast<uint8_t>(flags_ | mask);
    } else {
        flags_ = static_cast<uint8_t>(flags_ & ~mask);
    }
}

void SlottedPageHeader::set_slot(size_t slot) {
    if (slot >= bitmap_.size()) {
        throw std::out_of_range("Slot " + std::to_string(slot) + " out of range");
    }
    bitmap_[slot] = true;
}

void SlottedPageHeader::reset_slot(size_t slot) {
    if (slot >= bitmap_.size()) {
        throw std::out_of_range("Slot " + std::to_string(slot) + " out of range");
    }
    bitmap_[slot] = false;
}

std::vector<size_t> SlottedPageHeader::free_slots() const {
    std::vector<size_t> slots;
    for (size_t i = 0; i < bitmap_.size(); ++i) {
        if (!bitmap_[i]) {
            slots.push_back(i);
        }
    }
    return slots;
}

std::vector<size_t> SlottedPageHeader::used_slots() const {
    std::vector<size_t> slots;
    for (size_t i = 0; i < bitmap_.size(); ++i) {
        if (bitmap_[i]) {
            slots.push_back(i);
        }
    }
    return slots;
}

std::optional<size_t> SlottedPageHeader::next_used_slot(size_t from) const {
    for (size_t i = from; i < bitmap_.size(); ++i) {
        if (bitmap_[i]) {
            return i;
        }
    }
    return std::nullopt;
}

size_t SlottedPageHeader::num_tuples() const {
    return static_cast<size_t>(std::count(bitmap_.begin(), bitmap_.end(), true));
}

bool SlottedPageHeader::has_free_tuple() const {
    return std::find(bitmap_.begin(), bitmap_.end(), false) != bitmap_.end();
}

std::optional<size_t> SlottedPageHeader::next_free_tuple() {
    auto it = std::find(bitmap_.begin(), bitmap_.end(), false);
    if (it == bitmap_.end()) {
        return std::nullopt;
    }
    *it = true;
    return static_cast<size_t>(it - bitmap_.begin());
}

bool SlottedPageHeader::operator==(const SlottedPageHeader& other) const {
    return flags_ == other.flags_ &&
           tuple_size_ == other.tuple_size_ &&
           free_space_offset_ == other.free_space_offset_ &&
           page_capacity_ == other.page_capacity_ &&
           bitmap_ == other.bitmap_;
}
