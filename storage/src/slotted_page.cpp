#include "storage/slotted_page.hpp"
#include "storage/errors.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace {

uint8_t* checked_buffer(uint8_t* buffer, size_t size) {
    if (buffer == nullptr || size == 0) {
        throw InvalidConstruction("No backing buffer provided to slotted page constructor");
    }
    return buffer;
}

} // namespace

SlottedPage::SlottedPage(const PageId& page_id, uint8_t* buffer, size_t size,
                         uint16_t tuple_size)
    : page_id_(page_id), buffer_(checked_buffer(buffer, size)), size_(size),
      header_(buffer, size, tuple_size) {}

SlottedPage::SlottedPage(const PageId& page_id, uint8_t* buffer, size_t size,
                         const SlottedPageHeader& header)
    : page_id_(page_id), buffer_(checked_buffer(buffer, size)), size_(size), header_(header) {
    if (header_.page_capacity() > size_) {
        throw InvalidConstruction("Header describes a " +
                                  std::to_string(header_.page_capacity()) +
                                  " byte page but the buffer holds " + std::to_string(size_));
    }
}

SlottedPage SlottedPage::unpack(const PageId& page_id, uint8_t* buffer, size_t size) {
    SlottedPageHeader header = SlottedPageHeader::unpack(checked_buffer(buffer, size), size);
    return SlottedPage(page_id, buffer, size, header);
}

uint8_t* SlottedPage::slot_ptr(int64_t slot) {
    if (slot < 0 || size_t(slot) >= header_.slot_capacity()) {
        throw std::out_of_range("Slot " + std::to_string(slot) + " out of range (capacity " +
                                std::to_string(header_.slot_capacity()) + ")");
    }
    return buffer_ + header_.offset_of_slot(size_t(slot));
}

std::optional<TupleView> SlottedPage::get_tuple(const TupleId& tuple_id) {
    if (tuple_id.tuple_index < 0 || !header_.has_slot(size_t(tuple_id.tuple_index))) {
        return std::nullopt;
    }
    return TupleView(slot_ptr(tuple_id.tuple_index), header_.tuple_size());
}

void SlottedPage::put_tuple(const TupleId& tuple_id, const Bytes& data) {
    if (data.size() != header_.tuple_size()) {
        throw InvalidConstruction("Tuple must be exactly " +
                                    std::to_string(header_.tuple_size()) + " bytes, got " +
                                    std::to_string(data.size()));
    }
    std::memcpy(slot_ptr(tuple_id.tuple_index), data.data(), data.size());
    header_.set_dirty(true);
}

std::optional<TupleId> SlottedPage::insert_tuple(const Bytes& data) {
    if (data.size() != header_.tuple_size()) {
        throw InvalidConstruction("Tuple must be exactly " +
                                    std::to_string(header_.tuple_size()) + " bytes, got " +
                                    std::to_string(data.size()));
    }
    auto slot = header_.next_free_tuple();
    if (!slot) {
        return std::nullopt;
    }
    std::memcpy(buffer_ + header_.offset_of_slot(*slot), data.data(), data.size());
    header_.set_dirty(true);
    return TupleId{page_id_, static_cast<int64_t>(*slot)};
}

void SlottedPage::clear_tuple(const TupleId& tuple_id) {
    std::memset(slot_ptr(tuple_id.tuple_index), 0, header_.tuple_size());
    header_.set_dirty(true);
}

bool SlottedPage::delete_tuple(const TupleId& tuple_id) {
    if (tuple_id.tuple_index < 0 || !header_.has_slot(size_t(tuple_id.tuple_index))) {
        return false;
    }
    header_.reset_slot(size_t(tuple_id.tuple_index));
    header_.set_dirty(true);
    return true;
}

Bytes SlottedPage::pack() {
    header_.pack(buffer_);
    return Bytes(buffer_, buffer_ + header_.page_capacity());
}

std::optional<size_t> SlottedPage::next_live_index(size_t from) const {
    return header_.next_used_slot(from);
}
