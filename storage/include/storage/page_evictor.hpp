#ifndef LRU_EVICTOR_H
#define LRU_EVICTOR_H

#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

#include "storage/types.hpp"

typedef std::function<void(const PageId&)> evict_page_callback_t;

// Tracks recency of use for resident pages, least recent at the front.
class LruEvictor {
private:
    std::list<PageId> order_;
    std::unordered_map<PageId, std::list<PageId>::iterator, PageIdHash> page_to_position_;
    evict_page_callback_t flush_page_;

public:
    explicit LruEvictor(evict_page_callback_t flush_callback = nullptr);

    // Marks page_id most recently used, adding it if it is not tracked yet.
    void update_access(const PageId& page_id);

    // Picks the least recently used page, hands it to the flush callback and
    // stops tracking it. If the callback throws, the page stays tracked.
    std::optional<PageId> evict();
    std::optional<PageId> victim() const;

    bool remove_page(const PageId& page_id);
    bool contains(const PageId& page_id) const;
    void clear();

    size_t get_page_count() const { return page_to_position_.size(); }
    std::vector<PageId> recency_order() const;
};

#endif
