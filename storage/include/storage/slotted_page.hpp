#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "storage/slotted_page_header.hpp"
#include "storage/tuple_page.hpp"
#include "storage/types.hpp"

// Slotted page: a TupleId's index is a slot number, and the header bitmap says
// which slots hold live tuples. Deletes only clear a bit, so freed slots are
// reused by later inserts and tuple bytes never move.
class SlottedPage : public TuplePage {
public:
    SlottedPage(const PageId& page_id, uint8_t* buffer, size_t size, uint16_t tuple_size);
    SlottedPage(const PageId& page_id, uint8_t* buffer, size_t size,
                const SlottedPageHeader& header);

    SlottedPage(const SlottedPage&) = delete;
    SlottedPage& operator=(const SlottedPage&) = delete;
    SlottedPage(SlottedPage&&) = default;
    SlottedPage& operator=(SlottedPage&&) = default;

    static SlottedPage unpack(const PageId& page_id, uint8_t* buffer, size_t size);

    SlottedPageHeader& header() { return header_; }
    const SlottedPageHeader& header() const { return header_; }

    PageLayout layout() const override { return PageLayout::Slotted; }
    const PageId& page_id() const override { return page_id_; }

    uint8_t* data() override { return buffer_; }
    size_t page_capacity() const override { return header_.page_capacity(); }
    size_t header_size() const override { return header_.header_size(); }
    size_t tuple_size() const override { return header_.tuple_size(); }

    bool is_dirty() const override { return header_.is_dirty(); }
    void set_dirty(bool dirty) override { header_.set_dirty(dirty); }

    size_t num_tuples() const override { return header_.num_tuples(); }
    size_t free_space() const override { return header_.free_space(); }
    size_t used_space() const override { return header_.used_space(); }
    bool has_free_tuple() const override { return header_.has_free_tuple(); }

    std::optional<TupleView> get_tuple(const TupleId& tuple_id) override;
    void put_tuple(const TupleId& tuple_id, const Bytes& data) override;
    std::optional<TupleId> insert_tuple(const Bytes& data) override;
    // Zeroes the slot's bytes and leaves its bitmap bit alone.
    void clear_tuple(const TupleId& tuple_id) override;
    bool delete_tuple(const TupleId& tuple_id) override;

    Bytes pack() override;

    std::optional<size_t> next_live_index(size_t from) const override;

private:
    uint8_t* slot_ptr(int64_t slot);

    PageId page_id_;
    uint8_t* buffer_;
    size_t size_;
    SlottedPageHeader header_;
};
