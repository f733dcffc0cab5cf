#include "sandbox/bounded_buffer.hpp"

#include <algorithm>
#include <utility>

namespace katabox::sandbox {

BoundedBuffer::BoundedBuffer(std::size_t capacity)
    : capacity_(capacity) {}

std::size_t BoundedBuffer::Append(const char* data, std::size_t size) {
    if (size == 0) {
        return 0;
    }
    const auto room = capacity_ - std::min(capacity_, data_.size());
    const auto accepted = std::min(room, size);
    if (accepted > 0) {
        data_.append(data, accepted);
    }
    if (accepted < size) {
        truncated_ = true;
    }
    return accepted;
}

std::string BoundedBuffer::Release() {
    std::string out = std::move(data_);
    data_.clear();
    return out;
}

}  // namespace katabox::sandbox
