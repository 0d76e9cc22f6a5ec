#include "storage/page_evictor.hpp"

#include <iterator>
#include <utility>

LruEvictor::LruEvictor(evict_page_callback_t flush_callback)
    : flush_page_(std::move(flush_callback)) {}

void LruEvictor::update_access(const PageId& page_id) {
    auto it = page_to_position_.find(page_id);
    if (it != page_to_position_.end()) {
        order_.splice(order_.end(), order_, it->second);
        return;
    }
    order_.push_back(page_id);
    page_to_position_[page_id] = std::prev(order_.end());
}

std::optional<PageId> LruEvictor::evict() {
    if (order_.empty()) {
        return std::nullopt;
    }
    PageId evicted_page = order_.front();
    if (flush_page_) {
        flush_page_(evicted_page);
    }
    order_.pop_front();
    page_to_position_.erase(evicted_page);
    return evicted_page;
}

std::optional<PageId> LruEvictor::victim() const {
    if (order_.empty()) {
        return std::nullopt;
    }
    return order_.front();
}

bool LruEvictor::remove_page(const PageId& page_id) {
    auto it = page_to_position_.find(page_id);
    if (it == page_to_position_.end()) {
        return false;
    }
    order_.erase(it->second);
    page_to_position_.erase(it);
    return true;
}

bool LruEvictor::contains(const PageId& page_id) const {
    return page_to_position_.find(page_id) != page_to_position_.end();
}

void LruEvictor::clear() {
    order_.clear();
    page_to_position_.clear();
}

std::vector<PageId> LruEvictor::recency_order() const {
    return std::vector<PageId>(order_.begin(), order_.end());
}
