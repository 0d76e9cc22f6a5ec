#include "storage/tuple_page.hpp"

TupleView TupleIterator::operator*() const {
    return page_->get_tuple(TupleId{page_->page_id(), static_cast<int64_t>(index_)}).value();
}

TupleIterator& TupleIterator::operator++() {
    auto next = page_->next_live_index(index_ + 1);
    index_ = next ? *next : END;
    return *this;
}

TupleIterator TupleIterator::operator++(int) {
    TupleIterator prev = *this;
    ++(*this);
    return prev;
}

TupleIterator TuplePage::begin() {
    auto first = next_live_index(0);
    return TupleIterator(this, first ? *first : TupleIterator::END);
}
