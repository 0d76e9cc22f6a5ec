#include "storage/config.hpp"
#include "storage/errors.hpp"

#include <algorithm>
#include <cctype>

const char* to_string(PageLayout layout) {
    switch (layout) {
        case PageLayout::Contiguous: return "contiguous";
        case PageLayout::Slotted:    return "slotted";
    }
    return "unknown";
}

PageLayout page_layout_from_string(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "contiguous") {
        return PageLayout::Contiguous;
    }
    if (lowered == "slotted") {
        return PageLayout::Slotted;
    }
    throw UnsupportedOperation("Unknown page layout: " + name);
}

void BufferPoolConfig::validate() const {
    if (page_size == 0) {
        throw InvalidConstruction("Page size must be > 0");
    }
    if (page_size > MAX_PAGE_SIZE) {
        throw InvalidConstruction("Page size " + std::to_string(page_size) +
                                  " exceeds the header capacity field");
    }
    if (pool_size < page_size) {
        throw InvalidConstruction("Pool must hold at least one page");
    }
}
