#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "storage/page_header.hpp"
#include "storage/tuple_page.hpp"
#include "storage/types.hpp"

// Contiguous page: tuples sit back to back after the header, and a tuple's
// index is its physical position. Deleting a tuple shifts every later tuple
// down by one slot.
class Page : public TuplePage {
public:
    // Fresh page: writes an empty header for tuple_size-byte tuples.
    Page(const PageId& page_id, uint8_t* buffer, size_t size, uint16_t tuple_size);
    // Wraps a buffer whose state is described by an existing header.
    Page(const PageId& page_id, uint8_t* buffer, size_t size, const PageHeader& header);

    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;
    Page(Page&&) = default;
    Page& operator=(Page&&) = default;

    static Page unpack(const PageId& page_id, uint8_t* buffer, size_t size);

    PageHeader& header() { return header_; }
    const PageHeader& header() const { return header_; }

    PageLayout layout() const override { return PageLayout::Contiguous; }
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
    // Overwrites the slot in place; the caller is responsible for tuple_id
    // naming a live tuple.
    void put_tuple(const TupleId& tuple_id, const Bytes& data) override;
    std::optional<TupleId> insert_tuple(const Bytes& data) override;
    // Zeroes the tuple's bytes; the tuple stays live.
    void clear_tuple(const TupleId& tuple_id) override;
    bool delete_tuple(const TupleId& tuple_id) override;

    Bytes pack() override;

    std::optional<size_t> next_live_index(size_t from) const override;

private:
    uint8_t* tuple_ptr(int64_t tuple_index);

    PageId page_id_;
    uint8_t* buffer_;
    size_t size_;
    PageHeader header_;
};
