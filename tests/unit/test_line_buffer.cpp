#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "stream/line_buffer.hpp"

namespace {

using agentcli::stream::LineBuffer;

std::vector<std::string> feed(const std::vector<std::string>& chunks, bool flush = true) {
    std::vector<std::string> lines;
    LineBuffer buffer([&lines](const std::string& line) { lines.push_back(line); });
    for (const auto& chunk : chunks) {
        buffer.add(chunk);
    }
    if (flush) {
        buffer.flush();
    }
    return lines;
}

TEST(LineBufferTest, EmitsCompleteLinesInOrder) {
    const auto lines = feed({"{\"a\":1}\n{\"b\":2}\n"});
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "{\"a\":1}");
    EXPECT_EQ(lines[1], "{\"b\":2}");
}

TEST(LineBufferTest, ChunkBoundariesDoNotChangeOutput) {
    const std::string stream = "first line\nsecond\n\nthird without newline";
    const auto whole = feed({stream});

    std::vector<std::string> bytes;
    for (const char c : stream) {
        bytes.emplace_back(1, c);
    }
    EXPECT_EQ(feed(bytes), whole);
    EXPECT_EQ(feed({"fir", "st line\nsec", "ond\n", "\nthird ", "without newline"}), whole);
    ASSERT_EQ(whole.size(), 3u);
    EXPECT_EQ(whole[2], "third without newline");
}

TEST(LineBufferTest, LongRecordAcrossManyChunksArrivesWhole) {
    const std::string record = "{\"content\":\"" + std::string(1 << 20, 'x') + "\"}";
    std::vector<std::string> chunks;
    for (std::size_t offset = 0; offset < record.size(); offset += 4096) {
        chunks.push_back(record.substr(offset, 4096));
    }
    chunks.back() += "\nnext\n";

    const auto lines = feed(chunks, false);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], record);
    EXPECT_EQ(lines[1], "next");
}

TEST(LineBufferTest, SkipsBlankAndWhitespaceOnlyLines) {
    const auto lines = feed({"\n   \n\t\nvalue\n\n"});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "value");
}

TEST(LineBufferTest, StripsCarriageReturns) {
    const auto lines = feed({"one\r\ntwo\r\n"});
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
}

TEST(LineBufferTest, HoldsPartialLineUntilFlush) {
    std::vector<std::string> lines;
    LineBuffer buffer([&lines](const std::string& line) { lines.push_back(line); });

    buffer.add("partial");
    EXPECT_TRUE(lines.empty());
    EXPECT_TRUE(buffer.has_pending());

    buffer.flush();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "partial");
    EXPECT_FALSE(buffer.has_pending());
}

TEST(LineBufferTest, FlushEmitsTailOnlyOnce) {
    std::vector<std::string> lines;
    LineBuffer buffer([&lines](const std::string& line) { lines.push_back(line); });

    buffer.add("tail");
    buffer.flush();
    buffer.flush();
    EXPECT_EQ(lines.size(), 1u);
}

}  // namespace
