#include "storage/disk.hpp"
#include "storage/errors.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

DiskFileManager::DiskFileManager(size_t page_size) : page_size_(page_size) {
    if (page_size_ == 0 || page_size_ > MAX_PAGE_SIZE) {
        throw InvalidConstruction("Unsupported page size " + std::to_string(page_size_));
    }
}

void DiskFileManager::register_file(FileId file_id, const StorageFile& file) {
    if (file.path.empty()) {
        throw InvalidConstruction("No path supplied for file " + std::to_string(file_id));
    }
    if (file.tuple_size == 0) {
        throw InvalidConstruction("No tuple size supplied for file " + std::to_string(file_id));
    }
    files_[file_id] = file;
}

bool DiskFileManager::has_file(FileId file_id) const {
    return files_.find(file_id) != files_.end();
}

const StorageFile& DiskFileManager::file(FileId file_id) const {
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        throw UnsupportedOperation("File " + std::to_string(file_id) + " is not registered");
    }
    return it->second;
}

uint64_t DiskFileManager::num_pages(FileId file_id) const {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(file(file_id).path, ec);
    if (ec) {
        return 0;
    }
    return (bytes + page_size_ - 1) / page_size_;
}

std::vector<uint8_t> DiskFileManager::read_bytes(const PageId& page_id) const {
    uint64_t offset = page_id.page_index * page_size_;
    std::vector<uint8_t> buf(page_size_, 0);
    std::ifstream in(file(page_id.file_id).path, std::ios::binary);
    if (!in.is_open()) {
        return buf;
    }
    in.seekg(offset, std::ios::beg);
    if (!in) {
        return buf;
    }
    in.read(reinterpret_cast<char*>(buf.data()), page_size_);
    if (in.bad()) {
        throw StorageError("Failed to read page " + std::to_string(page_id.page_index) +
                           " of file " + std::to_string(page_id.file_id));
    }
    return buf;
}

void DiskFileManager::write_bytes(const PageId& page_id, const std::vector<uint8_t>& data) {
    if (data.size() != page_size_) {
        throw std::invalid_argument("Page must be exactly " + std::to_string(page_size_) +
                                    " bytes");
    }
    const std::string& path = file(page_id.file_id).path;
    uint64_t offset = page_id.page_index * page_size_;
    std::fstream out(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!out.is_open()) {
        out.open(path, std::ios::out | std::ios::binary);
        out.close();
        out.open(path, std::ios::in | std::ios::out | std::ios::binary);
    }
    if (!out.is_open()) {
        throw StorageError("Cannot open " + path + " for writing");
    }
    out.seekp(offset, std::ios::beg);
    out.write(reinterpret_cast<const char*>(data.data()), page_size_);
    out.flush();
    if (!out) {
        throw StorageError("Failed to write page " + std::to_string(page_id.page_index) +
                           " to " + path);
    }
}

std::unique_ptr<TuplePage> DiskFileManager::read_page(const PageId& page_id, uint8_t* buffer,
                                                      size_t size) {
    if (size != page_size_) {
        throw std::invalid_argument("Buffer of " + std::to_string(size) +
                                    " bytes cannot hold a " + std::to_string(page_size_) +
                                    " byte page");
    }
    const StorageFile& f = file(page_id.file_id);
    std::vector<uint8_t> bytes = read_bytes(page_id);
    std::memcpy(buffer, bytes.data(), page_size_);
    auto page = open_page(f.layout, page_id, buffer, size, f.tuple_size);
    if (page->page_capacity() != page_size_) {
        throw StorageError("Page " + std::to_string(page_id.page_index) + " of " + f.path +
                           " claims a capacity of " + std::to_string(page->page_capacity()) +
                           " bytes");
    }
    return page;
}

void DiskFileManager::write_page(TuplePage& page) {
    write_bytes(page.page_id(), page.pack());
}
