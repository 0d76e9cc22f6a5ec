#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "storage/log.hpp"

constexpr size_t DEFAULT_PAGE_SIZE = 4 * 1024; // 4KB
constexpr size_t DEFAULT_POOL_SIZE = 10 * (1 << 20); // 10MB
// Page capacity is stored as a u16 in every page header.
constexpr size_t MAX_PAGE_SIZE = UINT16_MAX;

enum class PageLayout {
    Contiguous,
    Slotted
};

const char* to_string(PageLayout layout);

// Accepts "contiguous" or "slotted" in any case; throws UnsupportedOperation
// for anything else.
PageLayout page_layout_from_string(const std::string& name);


struct BufferPoolConfig {
    size_t page_size = DEFAULT_PAGE_SIZE;
    size_t pool_size = DEFAULT_POOL_SIZE;
    log_callback_t logger;

    // Throws InvalidConstruction unless at least one page fits in the pool and
    // the page size fits the header's capacity field.
    void validate() const;
};


struct StorageFile {
    std::string path;
    PageLayout layout = PageLayout::Contiguous;
    uint16_t tuple_size = 0;
};
