#include "storage/buffer_pool.hpp"
#include "storage/errors.hpp"

#include <string>
#include <utility>

namespace {

std::string describe(const PageId& pid) {
    return std::to_string(pid.file_id) + ":" + std::to_string(pid.page_index);
}

} // namespace

BufferPool::BufferPool(BufferPoolConfig config)
    : page_size_(config.page_size),
      pool_size_(config.pool_size),
      logger_(std::move(config.logger)),
      evictor_([this](const PageId& victim) {
          auto it = page_table_.find(victim);
          if (it != page_table_.end() && it->second.page->is_dirty()) {
              log(LogLevel::Info, "FLUSH dirty page " + describe(victim) + " before eviction");
              write_back(*it->second.page);
          }
      }) {
    config.validate();
    pool_.assign(pool_size_, 0);
    reset_free_slots();
}

BufferPool::BufferPool(size_t page_size, size_t pool_size)
    : BufferPool(BufferPoolConfig{page_size, pool_size, nullptr}) {}

void BufferPool::reset_free_slots() {
    free_slots_.clear();
    free_slots_.reserve(num_pages());
    // Highest offset first so that pop_back() hands out slots in arena order.
    for (size_t i = num_pages(); i > 0; --i) {
        free_slots_.push_back((i - 1) * page_size_);
    }
}

bool BufferPool::has_page(const PageId& page_id) const {
    return page_table_.find(page_id) != page_table_.end();
}

TuplePage& BufferPool::get_page(const PageId& page_id) {
    auto it = page_table_.find(page_id);
    if (it != page_table_.end()) {
        hits_++;
        evictor_.update_access(page_id);
        log(LogLevel::Debug, "HIT page " + describe(page_id) + " -> offset " +
                                 std::to_string(it->second.offset));
        return *it->second.page;
    }

    if (file_manager_ == nullptr) {
        throw UnsupportedOperation("Buffer pool has no file manager to load page " +
                                   describe(page_id));
    }

    if (free_slots_.empty()) {
        evict_page();
    }
    size_t offset = free_slots_.back();
    free_slots_.pop_back();

    std::unique_ptr<TuplePage> page;
    try {
        page = file_manager_->read_page(page_id, pool_.data() + offset, page_size_);
    } catch (...) {
        free_slots_.push_back(offset);
        throw;
    }

    misses_++;
    Frame& frame = page_table_[page_id];
    frame.offset = offset;
    frame.page = std::move(page);
    evictor_.update_access(page_id);
    log(LogLevel::Debug, "MISS load page " + describe(page_id) + " into offset " +
                             std::to_string(offset));
    return *frame.page;
}

std::optional<PageId> BufferPool::evict_page() {
    auto victim = evictor_.evict();
    if (!victim) {
        return std::nullopt;
    }
    auto it = page_table_.find(*victim);
    free_slots_.push_back(it->second.offset);
    log(LogLevel::Info, "EVICT page " + describe(*victim) + " from offset " +
                            std::to_string(it->second.offset));
    page_table_.erase(it);
    evictions_++;
    return victim;
}

bool BufferPool::discard_page(const PageId& page_id) {
    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return false;
    }
    if (it->second.page->is_dirty()) {
        log(LogLevel::Warn, "DISCARD dirty page " + describe(page_id) + ", changes dropped");
    } else {
        log(LogLevel::Info, "DISCARD page " + describe(page_id));
    }
    evictor_.remove_page(page_id);
    free_slots_.push_back(it->second.offset);
    page_table_.erase(it);
    return true;
}

void BufferPool::flush_page(const PageId& page_id) {
    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        throw PageNotResident("Page " + describe(page_id) + " not found in buffer pool");
    }
    TuplePage& page = *it->second.page;
    if (page.is_dirty()) {
        log(LogLevel::Info, "FLUSH page " + describe(page_id));
        write_back(page);
    }
}

void BufferPool::flush_all() {
    for (auto& entry : page_table_) {
        TuplePage& page = *entry.second.page;
        if (page.is_dirty()) {
            log(LogLevel::Info, "FLUSH page " + describe(entry.first));
            write_back(page);
        }
    }
}

void BufferPool::clear() {
    flush_all();
    page_table_.clear();
    evictor_.clear();
    reset_free_slots();
}

uint8_t* BufferPool::page_buffer(const PageId& page_id) {
    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return nullptr;
    }
    return pool_.data() + it->second.offset;
}

BufferPool::PoolStats BufferPool::get_stats() const {
    PoolStats stats;
    stats.total_frames = num_pages();
    stats.free_frames = num_free_pages();
    stats.dirty_frames = 0;
    for (const auto& entry : page_table_) {
        if (entry.second.page->is_dirty()) {
            stats.dirty_frames++;
        }
    }
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.flushes = flushes_;
    return stats;
}

// The on-disk copy is written clean; on failure the page stays dirty.
void BufferPool::write_back(TuplePage& page) {
    if (file_manager_ == nullptr) {
        throw UnsupportedOperation("Buffer pool has no file manager to write page " +
                                   describe(page.page_id()));
    }
    page.set_dirty(false);
    try {
        file_manager_->write_page(page);
    } catch (...) {
        page.set_dirty(true);
        throw;
    }
    flushes_++;
}
