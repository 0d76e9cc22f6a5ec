#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

typedef uint32_t FileId;
typedef std::vector<uint8_t> Bytes;


struct PageId {
    FileId file_id = 0;
    uint64_t page_index = 0;

    bool operator==(const PageId& other) const {
        return file_id == other.file_id && page_index == other.page_index;
    }

    bool operator!=(const PageId& other) const {
        return !(*this == other);
    }

    bool operator<(const PageId& other) const {
        if (file_id != other.file_id) {
            return file_id < other.file_id;
        }
        return page_index < other.page_index;
    }
};


struct PageIdHash {
    std::size_t operator()(const PageId& pid) const {
        std::size_t h1 = std::hash<FileId>{}(pid.file_id);
        std::size_t h2 = std::hash<uint64_t>{}(pid.page_index);
        return h1 ^ (h2 << 1);
    }
};


// A slotted page reads tuple_index as a slot number; negative indices are
// never live.
struct TupleId {
    PageId page_id;
    int64_t tuple_index = 0;

    bool operator==(const TupleId& other) const {
        return page_id == other.page_id && tuple_index == other.tuple_index;
    }

    bool operator!=(const TupleId& other) const {
        return !(*this == other);
    }
};


// Non-owning window onto one tuple inside a page buffer. Writes through
// data() are visible in the page.
class TupleView {
public:
    TupleView(uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }

    uint8_t* begin() const { return data_; }
    uint8_t* end() const { return data_ + size_; }

    uint8_t& operator[](std::size_t i) const { return data_[i]; }

    Bytes to_bytes() const { return Bytes(data_, data_ + size_); }

    bool operator==(const Bytes& bytes) const;
    bool operator!=(const Bytes& bytes) const { return !(*this == bytes); }

private:
    uint8_t* data_;
    std::size_t size_;
};

inline bool TupleView::operator==(const Bytes& bytes) const {
    if (bytes.size() != size_) {
        return false;
    }
    for (std::size_t i = 0; i < size_; ++i) {
        if (data_[i] != bytes[i]) {
            return false;
        }
    }
    return true;
}
