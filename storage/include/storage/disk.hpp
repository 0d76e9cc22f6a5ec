#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "storage/config.hpp"
#include "storage/file_manager.hpp"
#include "storage/types.hpp"

// File manager over plain files: page i of a file lives at byte
// i * page_size. Pages past the end of a file (or in a file that does not
// exist yet) read as zeros and come up as fresh, empty pages.
class DiskFileManager : public FileManager {
public:
    explicit DiskFileManager(size_t page_size = DEFAULT_PAGE_SIZE);

    void register_file(FileId file_id, const StorageFile& file);
    bool has_file(FileId file_id) const;
    // Throws UnsupportedOperation for an unregistered file.
    const StorageFile& file(FileId file_id) const;

    size_t page_size() const { return page_size_; }
    uint64_t num_pages(FileId file_id) const;

    std::vector<uint8_t> read_bytes(const PageId& page_id) const;
    void write_bytes(const PageId& page_id, const std::vector<uint8_t>& data);

    std::unique_ptr<TuplePage> read_page(const PageId& page_id, uint8_t* buffer,
                                         size_t size) override;
    void write_page(TuplePage& page) override;

private:
    size_t page_size_;
    std::unordered_map<FileId, StorageFile> files_;
};
