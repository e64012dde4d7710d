#include <gtest/gtest.h>
#include "stream/result_extractor.hpp"

namespace {

using agentcli::stream::extract_structured;

TEST(ResultExtractorTest, ParsesWholeTextAsJson) {
    const auto value = extract_structured("  {\"answer\": 4}\n");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["answer"], 4);
}

TEST(ResultExtractorTest, ParsesScalarReply) {
    const auto value = extract_structured("4");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 4);
}

TEST(ResultExtractorTest, ReadsFencedBlockWithLanguageTag) {
    const auto value = extract_structured("Here you go:\n```json\n{\"ok\": true}\n```\nDone.");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["ok"], true);
}

TEST(ResultExtractorTest, ReadsFencedBlockWithoutTag) {
    const auto value = extract_structured("```\n[1, 2, 3]\n```");
    ASSERT_TRUE(value.has_value());
    ASSERT_TRUE(value->is_array());
    EXPECT_EQ(value->size(), 3u);
}

TEST(ResultExtractorTest, FindsEmbeddedObject) {
    const auto value = extract_structured("The result is {\"files\": [\"a.cpp\"]} as requested.");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["files"][0], "a.cpp");
}

TEST(ResultExtractorTest, IgnoresBracesInsideStrings) {
    const auto value = extract_structured("prefix {\"text\": \"a } b {\"} suffix");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["text"], "a } b {");
}

TEST(ResultExtractorTest, SkipsUnparseableCandidates) {
    const auto value = extract_structured("{not json} then {\"n\": 1}");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ((*value)["n"], 1);
}

TEST(ResultExtractorTest, ReturnsNulloptForPlainProse) {
    EXPECT_FALSE(extract_structured("No structure here at all.").has_value());
    EXPECT_FALSE(extract_structured("   ").has_value());
    EXPECT_FALSE(extract_structured("").has_value());
}

}  // namespace
