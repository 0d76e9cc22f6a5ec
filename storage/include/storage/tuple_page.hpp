#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>

#include "storage/config.hpp"
#include "storage/types.hpp"

class TuplePage;


// Forward iterator over the live tuples of a page, in increasing index order.
// Calling begin() again restarts the walk.
class TupleIterator {
public:
    typedef std::forward_iterator_tag iterator_category;
    typedef TupleView value_type;
    typedef std::ptrdiff_t difference_type;
    typedef void pointer;
    typedef TupleView reference;

    static constexpr size_t END = std::numeric_limits<size_t>::max();

    TupleIterator(TuplePage* page, size_t index) : page_(page), index_(index) {}

    TupleView operator*() const;
    TupleIterator& operator++();
    TupleIterator operator++(int);

    size_t index() const { return index_; }

    bool operator==(const TupleIterator& other) const {
        return page_ == other.page_ && index_ == other.index_;
    }
    bool operator!=(const TupleIterator& other) const { return !(*this == other); }

private:
    TuplePage* page_;
    size_t index_;
};


// Operations shared by the contiguous and slotted page layouts. A page is a
// view over a caller-owned buffer of page_capacity() bytes; it never owns the
// bytes, and its PageId is not part of them.
class TuplePage {
public:
    virtual ~TuplePage() = default;

    virtual PageLayout layout() const = 0;
    virtual const PageId& page_id() const = 0;

    virtual uint8_t* data() = 0;
    virtual size_t page_capacity() const = 0;
    virtual size_t header_size() const = 0;
    virtual size_t tuple_size() const = 0;

    virtual bool is_dirty() const = 0;
    virtual void set_dirty(bool dirty) = 0;

    virtual size_t num_tuples() const = 0;
    virtual size_t free_space() const = 0;
    virtual size_t used_space() const = 0;
    virtual bool has_free_tuple() const = 0;

    // nullopt if tuple_id does not name a live tuple.
    virtual std::optional<TupleView> get_tuple(const TupleId& tuple_id) = 0;
    virtual void put_tuple(const TupleId& tuple_id, const Bytes& data) = 0;
    // nullopt when the page is full.
    virtual std::optional<TupleId> insert_tuple(const Bytes& data) = 0;
    virtual void clear_tuple(const TupleId& tuple_id) = 0;
    // false if tuple_id does not name a live tuple.
    virtual bool delete_tuple(const TupleId& tuple_id) = 0;

    // Refreshes the packed header at the head of the buffer and returns a copy
    // of the whole page.
    virtual Bytes pack() = 0;

    // First live tuple index >= from, or nullopt past the last one.
    virtual std::optional<size_t> next_live_index(size_t from) const = 0;

    TupleIterator begin();
    TupleIterator end() { return TupleIterator(this, TupleIterator::END); }
};
