#include <gtest/gtest.h>

#include <string>

#include "sandbox/bounded_buffer.hpp"
#include "sandbox/output_collector.hpp"

using katabox::sandbox::BoundedBuffer;
using katabox::sandbox::OutputCollector;
using katabox::sandbox::OutputStream;

TEST(BoundedBufferTest, KeepsEverythingUnderCapacity) {
    BoundedBuffer buffer(16);
    EXPECT_EQ(buffer.Append("hello "), 6u);
    EXPECT_EQ(buffer.Append("world"), 5u);
    EXPECT_EQ(buffer.Data(), "hello world");
    EXPECT_FALSE(buffer.Truncated());
}

TEST(BoundedBufferTest, TruncatesAtCapacityAndKeepsHead) {
    BoundedBuffer buffer(8);
    EXPECT_EQ(buffer.Append("abcdef"), 6u);
    EXPECT_EQ(buffer.Append("ghijkl"), 2u);
    EXPECT_EQ(buffer.Append("mnop"), 0u);
    EXPECT_EQ(buffer.Data(), "abcdefgh");
    EXPECT_EQ(buffer.Size(), buffer.Capacity());
    EXPECT_TRUE(buffer.Truncated());
}

TEST(BoundedBufferTest, ExactFitIsNotTruncation) {
    BoundedBuffer buffer(4);
    EXPECT_EQ(buffer.Append("abcd"), 4u);
    EXPECT_FALSE(buffer.Truncated());
    EXPECT_EQ(buffer.Append("", 0), 0u);
    EXPECT_FALSE(buffer.Truncated());
}

TEST(BoundedBufferTest, ZeroCapacityTruncatesFirstByte) {
    BoundedBuffer buffer(0);
    EXPECT_EQ(buffer.Append("x"), 0u);
    EXPECT_TRUE(buffer.Truncated());
    EXPECT_TRUE(buffer.Data().empty());
}

TEST(BoundedBufferTest, HandlesBinaryData) {
    BoundedBuffer buffer(8);
    const std::string data("a\0b\0c", 5);
    EXPECT_EQ(buffer.Append(data), 5u);
    EXPECT_EQ(buffer.Data(), data);
}

TEST(OutputCollectorTest, SeparatesStreams) {
    OutputCollector collector(64);
    EXPECT_FALSE(collector.Append(OutputStream::Stdout, "out", 3));
    EXPECT_FALSE(collector.Append(OutputStream::Stderr, "err", 3));
    EXPECT_FALSE(collector.Append(OutputStream::Stdout, "put", 3));

    const auto captured = collector.Seal();
    EXPECT_EQ(captured.stdout_data, "output");
    EXPECT_EQ(captured.stderr_data, "err");
    EXPECT_FALSE(captured.stdout_truncated);
    EXPECT_FALSE(captured.stderr_truncated);
}

TEST(OutputCollectorTest, ReportsCapCrossingOnce) {
    OutputCollector collector(4);
    EXPECT_FALSE(collector.Append(OutputStream::Stderr, "abc", 3));
    EXPECT_TRUE(collector.Append(OutputStream::Stderr, "def", 3));
    EXPECT_FALSE(collector.Append(OutputStream::Stderr, "ghi", 3));
    EXPECT_TRUE(collector.Truncated());

    const auto captured = collector.Seal();
    EXPECT_EQ(captured.stderr_data, "abcd");
    EXPECT_TRUE(captured.stderr_truncated);
    EXPECT_FALSE(captured.stdout_truncated);
}

TEST(OutputCollectorTest, DropsBytesAfterSeal) {
    OutputCollector collector(64);
    collector.Append(OutputStream::Stdout, "before", 6);
    const auto captured = collector.Seal();
    EXPECT_TRUE(collector.Sealed());

    EXPECT_FALSE(collector.Append(OutputStream::Stdout, "after", 5));
    EXPECT_EQ(collector.Size(OutputStream::Stdout), 0u);
    EXPECT_EQ(captured.stdout_data, "before");
}
