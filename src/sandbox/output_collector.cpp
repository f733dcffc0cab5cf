#include "sandbox/output_collector.hpp"

namespace katabox::sandbox {

OutputCollector::OutputCollector(std::size_t max_bytes_per_stream)
    : stdout_(max_bytes_per_stream)
    , stderr_(max_bytes_per_stream) {}

bool OutputCollector::Append(OutputStream stream, const char* data, std::size_t size) {
    if (sealed_) {
        return false;
    }
    auto& buffer = Buffer(stream);
    const bool was_truncated = buffer.Truncated();
    buffer.Append(data, size);
    return !was_truncated && buffer.Truncated();
}

CapturedOutput OutputCollector::Seal() {
    sealed_ = true;
    CapturedOutput output{};
    output.stdout_truncated = stdout_.Truncated();
    output.stderr_truncated = stderr_.Truncated();
    output.stdout_data = stdout_.Release();
    output.stderr_data = stderr_.Release();
    return output;
}

std::size_t OutputCollector::Size(OutputStream stream) const {
    return stream == OutputStream::Stdout ? stdout_.Size() : stderr_.Size();
}

BoundedBuffer& OutputCollector::Buffer(OutputStream stream) {
    return stream == OutputStream::Stdout ? stdout_ : stderr_;
}

}  // namespace katabox::sandbox
