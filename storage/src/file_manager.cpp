#include "storage/file_manager.hpp"
#include "storage/errors.hpp"
#include "storage/page.hpp"
#include "storage/slotted_page.hpp"
#include "byte_order.hpp"

#include <string>

std::unique_ptr<TuplePage> open_page(PageLayout layout, const PageId& page_id, uint8_t* buffer,
                                     size_t size, uint16_t tuple_size) {
    if (buffer == nullptr || size < PageHeader::SIZE) {
        throw InvalidConstruction("No usable backing buffer for page " +
                                  std::to_string(page_id.page_index));
    }
    uint16_t stored_tuple_size = load_u16(buffer + 2);
    bool fresh = stored_tuple_size == 0;
    if (!fresh && stored_tuple_size != tuple_size) {
        throw StorageError("Page " + std::to_string(page_id.page_index) + " of file " +
                           std::to_string(page_id.file_id) + " holds " +
                           std::to_string(stored_tuple_size) + " byte tuples, expected " +
                           std::to_string(tuple_size));
    }

    switch (layout) {
        case PageLayout::Contiguous:
            if (fresh) {
                return std::make_unique<Page>(page_id, buffer, size, tuple_size);
            }
            return std::make_unique<Page>(Page::unpack(page_id, buffer, size));
        case PageLayout::Slotted:
            if (fresh) {
                return std::make_unique<SlottedPage>(page_id, buffer, size, tuple_size);
            }
            return std::make_unique<SlottedPage>(SlottedPage::unpack(page_id, buffer, size));
    }
    throw UnsupportedOperation("Unknown page layout");
}
