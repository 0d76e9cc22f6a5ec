#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "storage/config.hpp"
#include "storage/file_manager.hpp"
#include "storage/log.hpp"
#include "storage/page_evictor.hpp"
#include "storage/tuple_page.hpp"
#include "storage/types.hpp"


// A resident page: the arena slot holding its bytes and the page view built
// over that slot. The view is torn down when the page leaves the pool.
struct Frame {
    size_t offset = 0;
    std::unique_ptr<TuplePage> page;
};


// Fixed-capacity page cache over one contiguous arena of pool_size bytes,
// cut into pool_size / page_size slots. Misses fault pages in through the
// attached FileManager; when every slot is taken the least recently used page
// is written back (if dirty) and evicted.
//
// Single-threaded. A reference returned by get_page() is invalidated when that
// page is evicted, discarded or the pool is cleared.
class BufferPool {
public:
    struct PoolStats {
        size_t total_frames;
        size_t free_frames;
        size_t dirty_frames;
        size_t hits;
        size_t misses;
        size_t evictions;
        size_t flushes;
    };

    explicit BufferPool(BufferPoolConfig config = BufferPoolConfig{});
    BufferPool(size_t page_size, size_t pool_size);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // The file manager is not owned and must outlive the pool.
    void set_file_manager(FileManager& file_manager) { file_manager_ = &file_manager; }

    bool has_page(const PageId& page_id) const;

    // Returns the resident page, faulting it in on a miss. Either way the page
    // becomes the most recently used.
    TuplePage& get_page(const PageId& page_id);

    // Writes back and drops the least recently used page, returning its id,
    // or nullopt if nothing is resident.
    std::optional<PageId> evict_page();

    // Drops a resident page without writing it back. Returns false if the
    // page was not resident.
    bool discard_page(const PageId& page_id);

    // Writes the page back if it is dirty. Throws PageNotResident otherwise.
    void flush_page(const PageId& page_id);
    void flush_all();

    // Flushes every dirty page and returns every slot to the free list.
    void clear();

    // Raw arena slot of a resident page, nullptr when absent.
    uint8_t* page_buffer(const PageId& page_id);

    size_t page_size() const { return page_size_; }
    size_t num_pages() const { return pool_size_ / page_size_; }
    size_t num_free_pages() const { return free_slots_.size(); }
    size_t size() const { return pool_size_; }
    size_t free_space() const { return num_free_pages() * page_size_; }
    size_t used_space() const { return size() - free_space(); }

    // Resident pages, least recently used first.
    std::vector<PageId> lru_order() const { return evictor_.recency_order(); }

    PoolStats get_stats() const;

private:
    void reset_free_slots();
    void write_back(TuplePage& page);
    void log(LogLevel level, const std::string& msg) const {
        if (logger_) logger_(level, msg);
    }

    size_t page_size_;
    size_t pool_size_;
    log_callback_t logger_;
    FileManager* file_manager_ = nullptr;

    std::vector<uint8_t> pool_;
    std::vector<size_t> free_slots_;
    std::unordered_map<PageId, Frame, PageIdHash> page_table_;
    LruEvictor evictor_;

    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
    size_t flushes_ = 0;
};
