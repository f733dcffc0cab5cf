#pragma once

#include <cstddef>
#include <string>

namespace katabox::sandbox {

// Append-only byte store with a fixed capacity. Keeps the head of the stream
// and drops whatever does not fit.
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t capacity);

    std::size_t Append(const char* data, std::size_t size);
    std::size_t Append(const std::string& data) { return Append(data.data(), data.size()); }

    const std::string& Data() const { return data_; }
    std::string Release();
    std::size_t Size() const { return data_.size(); }
    std::size_t Capacity() const { return capacity_; }
    bool Truncated() const { return truncated_; }

private:
    std::size_t capacity_;
    std::string data_;
    bool truncated_ = false;
};

}  // namespace katabox::sandbox
