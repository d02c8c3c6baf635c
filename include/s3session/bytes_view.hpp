#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace s3session {

using Bytes = std::vector<std::uint8_t>;

// Non-owning view over a payload, accepted wherever an upload body is
// expected. C++17 has no std::span, so this stands in for
// std::span<const std::uint8_t>.
class bytes_view {
public:
    bytes_view() : data_(nullptr), size_(0) {}
    bytes_view(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    bytes_view(const Bytes& vec) : data_(vec.data()), size_(vec.size()) {}
    bytes_view(const std::string& str)
        : data_(reinterpret_cast<const std::uint8_t*>(str.data())), size_(str.size()) {}

    const std::uint8_t* data() const { return data_; }
    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const std::uint8_t* begin() const { return data_; }
    const std::uint8_t* end() const { return data_ + size_; }

    Bytes ToBytes() const { return Bytes(begin(), end()); }

    friend bool operator==(bytes_view a, bytes_view b) {
        return a.size_ == b.size_ && (a.size_ == 0 || std::memcmp(a.data_, b.data_, a.size_) == 0);
    }
    friend bool operator!=(bytes_view a, bytes_view b) { return !(a == b); }

private:
    const std::uint8_t* data_;
    std::size_t size_;
};

inline Bytes ToBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

} // namespace s3session
