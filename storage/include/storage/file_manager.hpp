#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>

#include "storage/config.hpp"
#include "storage/tuple_page.hpp"
#include "storage/types.hpp"

// The buffer pool's view of persistent storage. A PageId always names the
// same location.
class FileManager {
public:
    virtual ~FileManager() = default;

    // Materialises the page's bytes into buffer (size bytes, owned by the
    // caller) and returns a page view over it.
    virtual std::unique_ptr<TuplePage> read_page(const PageId& page_id, uint8_t* buffer,
                                                 size_t size) = 0;

    // Persists the page's current bytes, header included.
    virtual void write_page(TuplePage& page) = 0;
};


// Builds a page view of the given layout over buffer. A buffer whose header
// carries no tuple size (a never-written, zeroed page) gets a fresh empty
// header for tuple_size-byte tuples; anything else is unpacked and must agree
// with tuple_size.
std::unique_ptr<TuplePage> open_page(PageLayout layout, const PageId& page_id, uint8_t* buffer,
                                     size_t size, uint16_t tuple_size);
