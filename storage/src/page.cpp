#include "storage/page.hpp"
#include "storage/errors.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace {

uint8_t* checked_buffer(uint8_t* buffer, size_t size) {
    if (buffer == nullptr || size == 0) {
        throw InvalidConstruction("No backing buffer provided to page constructor");
    }
    return buffer;
}

void check_tuple_width(const Bytes& data, size_t tuple_size) {
    if (data.size() != tuple_size) {
        throw InvalidConstruction("Tuple must be exactly " + std::to_string(tuple_size) +
                                    " bytes, got " + std::to_string(data.size()));
    }
}

} // namespace

Page::Page(const PageId& page_id, uint8_t* buffer, size_t size, uint16_t tuple_size)
    : page_id_(page_id), buffer_(checked_buffer(buffer, size)), size_(size),
      header_(buffer, size, tuple_size) {}

Page::Page(const PageId& page_id, uint8_t* buffer, size_t size, const PageHeader& header)
    : page_id_(page_id), buffer_(checked_buffer(buffer, size)), size_(size), header_(header) {
    if (header_.page_capacity() > size_) {
        throw InvalidConstruction("Header describes a " +
                                  std::to_string(header_.page_capacity()) +
                                  " byte page but the buffer holds " + std::to_string(size_));
    }
}

Page Page::unpack(const PageId& page_id, uint8_t* buffer, size_t size) {
    PageHeader header = PageHeader::unpack(checked_buffer(buffer, size), size);
    return Page(page_id, buffer, size, header);
}

uint8_t* Page::tuple_ptr(int64_t tuple_index) {
    if (tuple_index < 0) {
        throw std::out_of_range("Negative tuple index " + std::to_string(tuple_index));
    }
    size_t offset = header_.header_size() + size_t(tuple_index) * header_.tuple_size();
    if (offset + header_.tuple_size() > header_.page_capacity()) {
        throw std::out_of_range("Tuple index " + std::to_string(tuple_index) +
                                " lies outside the page");
    }
    return buffer_ + offset;
}

std::optional<TupleView> Page::get_tuple(const TupleId& tuple_id) {
    if (tuple_id.tuple_index < 0 || size_t(tuple_id.tuple_index) >= header_.num_tuples()) {
        return std::nullopt;
    }
    return TupleView(tuple_ptr(tuple_id.tuple_index), header_.tuple_size());
}

void Page::put_tuple(const TupleId& tuple_id, const Bytes& data) {
    check_tuple_width(data, header_.tuple_size());
    std::memcpy(tuple_ptr(tuple_id.tuple_index), data.data(), data.size());
    header_.set_dirty(true);
}

std::optional<TupleId> Page::insert_tuple(const Bytes& data) {
    check_tuple_width(data, header_.tuple_size());
    auto range = header_.next_tuple_range();
    if (!range) {
        return std::nullopt;
    }
    std::memcpy(buffer_ + range->start, data.data(), data.size());
    header_.set_dirty(true);
    return TupleId{page_id_, static_cast<int64_t>(range->tuple_index)};
}

void Page::clear_tuple(const TupleId& tuple_id) {
    std::memset(tuple_ptr(tuple_id.tuple_index), 0, header_.tuple_size());
    header_.set_dirty(true);
}

bool Page::delete_tuple(const TupleId& tuple_id) {
    size_t count = header_.num_tuples();
    if (tuple_id.tuple_index < 0 || size_t(tuple_id.tuple_index) >= count) {
        return false;
    }
    size_t index = size_t(tuple_id.tuple_index);
    size_t width = header_.tuple_size();
    uint8_t* slot = tuple_ptr(tuple_id.tuple_index);
    std::memmove(slot, slot + width, (count - index - 1) * width);
    std::memset(tuple_ptr(static_cast<int64_t>(count - 1)), 0, width);
    header_.release_last_tuple();
    header_.set_dirty(true);
    return true;
}

Bytes Page::pack() {
    header_.pack(buffer_);
    return Bytes(buffer_, buffer_ + header_.page_capacity());
}

std::optional<size_t> Page::next_live_index(size_t from) const {
    if (from >= header_.num_tuples()) {
        return std::nullopt;
    }
    return from;
}
