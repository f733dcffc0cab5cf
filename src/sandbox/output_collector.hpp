#pragma once

#include <cstddef>
#include <string>

#include "sandbox/bounded_buffer.hpp"
#include "sandbox/execution_types.hpp"

namespace katabox::sandbox {

enum class OutputStream {
    Stdout,
    Stderr
};

inline const char* ToString(OutputStream stream) {
    return stream == OutputStream::Stdout ? "stdout" : "stderr";
}

// Accumulates the two output channels of one child. Once sealed, the
// captured bytes are frozen and later appends are discarded.
class OutputCollector {
public:
    explicit OutputCollector(std::size_t max_bytes_per_stream);

    // Returns true when this chunk pushed the stream past its cap.
    bool Append(OutputStream stream, const char* data, std::size_t size);

    CapturedOutput Seal();
    bool Sealed() const { return sealed_; }
    bool Truncated() const { return stdout_.Truncated() || stderr_.Truncated(); }
    std::size_t Size(OutputStream stream) const;

private:
    BoundedBuffer& Buffer(OutputStream stream);

    BoundedBuffer stdout_;
    BoundedBuffer stderr_;
    bool sealed_ = false;
};

}  // namespace katabox::sandbox
