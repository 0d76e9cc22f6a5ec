#include "storage/page_header.hpp"
#include "storage/config.hpp"
#include "storage/errors.hpp"
#include "byte_order.hpp"

#include <string>

PageHeader::PageHeader(uint8_t* buffer, size_t buffer_size, uint16_t tuple_size)
    : flags_(0), tuple_size_(tuple_size), free_space_offset_(SIZE),
      page_capacity_(static_cast<uint16_t>(buffer_size)) {
    if (buffer == nullptr || buffer_size == 0) {
        throw InvalidConstruction("No backing buffer supplied for page header");
    }
    if (buffer_size > MAX_PAGE_SIZE) {
        throw InvalidConstruction("Page of " + std::to_string(buffer_size) +
                                  " bytes does not fit the header capacity field");
    }
    if (tuple_size == 0) {
        throw InvalidConstruction("No tuple size supplied for page header");
    }
    if (SIZE + tuple_size > buffer_size) {
        throw InvalidConstruction("Tuple of " + std::to_string(tuple_size) +
                                  " bytes does not fit in a " + std::to_string(buffer_size) +
                                  " byte page");
    }
    pack(buffer);
}

PageHeader::PageHeader(uint8_t flags, uint16_t tuple_size, uint16_t free_space_offset,
                       uint16_t page_capacity)
    : flags_(flags), tuple_size_(tuple_size), free_space_offset_(free_space_offset),
      page_capacity_(page_capacity) {}

PageHeader PageHeader::unpack(const uint8_t* buffer, size_t buffer_size) {
    if (buffer == nullptr || buffer_size < SIZE) {
        throw InvalidConstruction("Buffer too small to hold a page header");
    }
    uint8_t flags = buffer[0];
    uint16_t tuple_size = load_u16(buffer + 2);
    uint16_t free_space_offset = load_u16(buffer + 4);
    uint16_t page_capacity = load_u16(buffer + 6);

    if (tuple_size == 0 ||
        free_space_offset < SIZE || free_space_offset > page_capacity ||
        (free_space_offset - SIZE) % tuple_size != 0) {
        throw StorageError("Corrupt page header: tuple_size=" + std::to_string(tuple_size) +
                           " free_space_offset=" + std::to_string(free_space_offset) +
                           " page_capacity=" + std::to_string(page_capacity));
    }
    return PageHeader(flags, tuple_size, free_space_offset, page_capacity);
}

void PageHeader::pack(uint8_t* out) const {
    out[0] = flags_;
    out[1] = 0;
    store_u16(out + 2, tuple_size_);
    store_u16(out + 4, free_space_offset_);
    store_u16(out + 6, page_capacity_);
}

Bytes PageHeader::pack() const {
    Bytes out(SIZE, 0);
    pack(out.data());
    return out;
}

void PageHeader::set_flag(uint8_t mask, bool on) {
    if (on) {
        flags_ = static_cast<uint8_t>(flags_ | mask);
    } else {
        flags_ = static_cast<uint8_t>(flags_ & ~mask);
    }
}

std::optional<uint16_t> PageHeader::next_free_tuple() {
    uint16_t offset = free_space_offset_;
    if (size_t(offset) + tuple_size_ >= page_capacity_) {
        return std::nullopt;
    }
    free_space_offset_ = static_cast<uint16_t>(offset + tuple_size_);
    return offset;
}

std::optional<PageHeader::TupleRange> PageHeader::next_tuple_range() {
    auto start = next_free_tuple();
    if (!start) {
        return std::nullopt;
    }
    size_t index = (*start - SIZE) / tuple_size_;
    return TupleRange{index, *start, size_t(*start) + tuple_size_};
}

bool PageHeader::release_last_tuple() {
    if (free_space_offset_ < SIZE + tuple_size_) {
        return false;
    }
    free_space_offset_ = static_cast<uint16_t>(free_space_offset_ - tuple_size_);
    return true;
}

bool PageHeader::operator==(const PageHeader& other) const {
    return flags_ == other.flags_ &&
           tuple_size_ == other.tuple_size_ &&
           free_space_offset_ == other.free_space_offset_ &&
           page_capacity_ == other.page_capacity_;
}
