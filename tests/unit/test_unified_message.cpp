#include <cstdint>
#include <limits>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/time/timestamp.hpp"
#include "protocol/execute_contract.hpp"
#include "protocol/unified_message.hpp"

namespace {

using namespace agentcli::protocol;
using agentcli::core::time::parse_iso8601_ms;

UnifiedMessage assistant_with_blocks(std::vector<ContentBlock> blocks) {
    UnifiedMessage message;
    message.id = "m1";
    message.role = Role::Assistant;
    message.content = std::move(blocks);
    message.timestamp = 1700000000000;
    message.tool = ToolId::Codex;
    return message;
}

TEST(UnifiedMessageTest, ExtractsTextFromStringContent) {
    UnifiedMessage message;
    message.content = std::string("hello");
    EXPECT_EQ(extract_text_content(message), "hello");
    EXPECT_TRUE(blocks_of(message).empty());
}

TEST(UnifiedMessageTest, ExtractsTextFromTextBlocksOnly) {
    const auto message = assistant_with_blocks(
        {ThinkingBlock{"pondering"}, TextBlock{"a"}, ToolUseBlock{"t1", "Bash", {{"command", "ls"}}},
         TextBlock{"b"}});
    EXPECT_EQ(extract_text_content(message), "ab");
}

TEST(UnifiedMessageTest, SerializesBlocksInProviderOrder) {
    const auto message = assistant_with_blocks(
        {ToolUseBlock{"t1", "Bash", {{"command", "ls"}}},
         ToolResultBlock{"t1", "file.txt", false}});
    const auto out = to_json(message);

    EXPECT_EQ(out["role"], "assistant");
    EXPECT_EQ(out["tool"], "codex");
    ASSERT_EQ(out["content"].size(), 2u);
    EXPECT_EQ(out["content"][0]["type"], "tool_use");
    EXPECT_EQ(out["content"][0]["name"], "Bash");
    EXPECT_EQ(out["content"][1]["type"], "tool_result");
    EXPECT_EQ(out["content"][1]["tool_use_id"], "t1");
    EXPECT_EQ(out["content"][1]["is_error"], false);
}

TEST(UnifiedMessageTest, UsageTotalsInputAndOutput) {
    const auto usage = make_usage(12, 30);
    EXPECT_EQ(usage.total_tokens, 42);
    const auto out = to_json(usage);
    EXPECT_EQ(out["inputTokens"], 12);
    EXPECT_FALSE(out.contains("cacheReadTokens"));
}

TEST(UnifiedMessageTest, UsageTotalSaturatesInsteadOfOverflowing) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    EXPECT_EQ(make_usage(kMax, 1).total_tokens, kMax);
    EXPECT_EQ(saturating_add(kMin, -5), kMin);
    EXPECT_EQ(saturating_add(kMax, kMin), -1);
    EXPECT_EQ(saturating_add(40, 2), 42);
}

TEST(UnifiedMessageTest, ToolPredicatesUseClaudeVocabulary) {
    EXPECT_TRUE(is_bash_tool(ToolUseBlock{"1", "Bash"}));
    EXPECT_TRUE(is_edit_tool(ToolUseBlock{"1", "Edit"}));
    EXPECT_TRUE(is_mcp_tool(ToolUseBlock{"1", "mcp__github__search"}));
    EXPECT_FALSE(is_read_tool(ToolUseBlock{"1", "read_file"}));
}

TEST(UnifiedMessageTest, RolesAndToolsRoundTripThroughNames) {
    EXPECT_EQ(parse_role("user"), Role::User);
    EXPECT_FALSE(parse_role("gemini").has_value());
    EXPECT_EQ(parse_tool_id("gemini"), ToolId::Gemini);
    EXPECT_FALSE(parse_tool_id("copilot").has_value());
    EXPECT_EQ(parse_permission_mode("acceptEdits"), PermissionMode::AcceptEdits);
}

TEST(ExecuteResultTest, SerializesFailureFlags) {
    ExecuteResult result;
    result.error = "Process timed out after 10 ms.";
    result.timed_out = true;
    const auto out = to_json(result);

    EXPECT_EQ(out["success"], false);
    EXPECT_EQ(out["exitCode"], -1);
    EXPECT_EQ(out["sessionId"], "unknown");
    EXPECT_EQ(out["timedOut"], true);
    EXPECT_FALSE(out.contains("cancelled"));
}

TEST(TimestampTest, ParsesUtcWithMilliseconds) {
    EXPECT_EQ(parse_iso8601_ms("2024-01-01T00:00:00.000Z"), 1704067200000);
    EXPECT_EQ(parse_iso8601_ms("2024-01-01T00:00:01.5Z"), 1704067201500);
}

TEST(TimestampTest, AppliesZoneOffset) {
    EXPECT_EQ(parse_iso8601_ms("2024-01-01T02:00:00+02:00"), 1704067200000);
    EXPECT_EQ(parse_iso8601_ms("2024-01-01"), 1704067200000);
}

TEST(TimestampTest, RejectsMalformedInput) {
    EXPECT_FALSE(parse_iso8601_ms("yesterday").has_value());
    EXPECT_FALSE(parse_iso8601_ms("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_iso8601_ms("2024-01-01T00:00:00Zjunk").has_value());
}

TEST(IdGeneratorTest, SimpleHashIsStable) {
    using agentcli::core::config::simple_hash;
    EXPECT_EQ(simple_hash("abc"), simple_hash("abc"));
    EXPECT_NE(simple_hash("abc"), simple_hash("abd"));
    EXPECT_EQ(simple_hash(""), "0");
}

TEST(IdGeneratorTest, GeneratedIdsKeepPrefix) {
    const auto id = agentcli::core::config::generate_id("msg_");
    EXPECT_EQ(id.rfind("msg_", 0), 0u);
    EXPECT_EQ(id.size(), 12u);
}

}  // namespace
