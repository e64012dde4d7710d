#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "parsers/gemini_parser.hpp"

namespace {

using namespace agentcli::protocol;
using agentcli::parsers::GeminiEventKind;
using agentcli::parsers::GeminiParser;
using agentcli::parsers::classify_gemini_event;
using agentcli::parsers::map_gemini_tool_name;
using nlohmann::json;

TEST(GeminiParserTest, StreamMessageKeepsRoleAndText) {
    GeminiParser parser;
    const auto message = parser.parse(
        R"({"type":"message","role":"assistant","content":"The answer is 4","delta":true})");
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->role, Role::Assistant);
    EXPECT_EQ(message->tool, ToolId::Gemini);
    EXPECT_EQ(message->id.rfind("msg_", 0), 0u);
    EXPECT_EQ(extract_text_content(message.value()), "The answer is 4");
}

TEST(GeminiParserTest, StreamToolUseAndResultShareToolId) {
    GeminiParser parser;
    const auto use_msg = parser.parse(
        R"({"type":"tool_use","tool_name":"read_file","tool_id":"read-1",)"
        R"("parameters":{"absolute_path":"/tmp/a.txt"}})");
    const auto result_msg = parser.parse(
        R"({"type":"tool_result","tool_id":"read-1","status":"success","output":"contents"})");
    ASSERT_TRUE(use_msg.has_value());
    ASSERT_TRUE(result_msg.has_value());

    const auto& use = std::get<ToolUseBlock>(blocks_of(use_msg.value())[0]);
    EXPECT_EQ(use.name, "Read");
    EXPECT_EQ(use.input["file_path"], "/tmp/a.txt");

    const auto& result = std::get<ToolResultBlock>(blocks_of(result_msg.value())[0]);
    EXPECT_EQ(result.tool_use_id, use.id);
    EXPECT_EQ(result.content, "contents");
    EXPECT_EQ(result.is_error, false);
}

TEST(GeminiParserTest, ErroredToolResultUsesErrorMessage) {
    GeminiParser parser;
    const auto message = parser.parse(
        R"({"type":"tool_result","tool_id":"t","status":"error","error":{"type":"x","message":"denied"}})");
    ASSERT_TRUE(message.has_value());
    const auto& result = std::get<ToolResultBlock>(blocks_of(message.value())[0]);
    EXPECT_EQ(result.content, "denied");
    EXPECT_EQ(result.is_error, true);
}

TEST(GeminiParserTest, StoredRecordWithThoughtsToolsAndTokens) {
    GeminiParser parser;
    const json record = json::parse(R"({
        "id": "m-2", "type": "gemini", "timestamp": "2024-01-01T00:00:00.000Z",
        "content": "Done.", "model": "gemini-2.5-pro",
        "thoughts": [{"subject": "Plan", "description": "list files"}],
        "toolCalls": [{"id": "ls-1", "name": "run_shell_command", "status": "success",
                       "args": {"command": "ls", "description": "list"},
                       "result": [{"functionResponse": {"response": {"output": "a.txt"}}}]}],
        "tokens": {"input": 10, "output": 4, "cached": 2, "total": 20}
    })");

    const auto message = parser.parse_record(record);
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->id, "m-2");
    EXPECT_EQ(message->role, Role::Assistant);
    EXPECT_EQ(message->timestamp, 1704067200000);
    EXPECT_EQ(message->model, "gemini-2.5-pro");

    const auto& blocks = blocks_of(message.value());
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(std::get<ThinkingBlock>(blocks[0]).thinking, "Plan: list files");
    EXPECT_EQ(std::get<ToolUseBlock>(blocks[1]).name, "Bash");
    EXPECT_EQ(std::get<ToolUseBlock>(blocks[1]).input["command"], "ls");
    EXPECT_EQ(std::get<ToolResultBlock>(blocks[2]).tool_use_id, "ls-1");
    EXPECT_EQ(std::get<ToolResultBlock>(blocks[2]).content, "a.txt");
    EXPECT_EQ(std::get<TextBlock>(blocks[3]).text, "Done.");

    ASSERT_TRUE(message->usage.has_value());
    EXPECT_EQ(message->usage->total_tokens, 20);
    EXPECT_EQ(message->usage->cache_read_tokens, 2);
}

TEST(GeminiParserTest, StoredUserRecordWithPartsArray) {
    GeminiParser parser;
    const auto message = parser.parse_record(json::parse(
        R"({"id":"m-1","type":"user","timestamp":"2024-01-01T00:00:00Z","content":[{"text":"What is "},{"text":"2+2?"}]})"));
    ASSERT_TRUE(message.has_value());
    EXPECT_EQ(message->role, Role::User);
    EXPECT_EQ(extract_text_content(message.value()), "What is 2+2?");
}

TEST(GeminiParserTest, ClassifiesStoredAndStreamShapes) {
    EXPECT_EQ(classify_gemini_event(json::parse(R"({"id":"a","type":"user","timestamp":"t"})")),
              GeminiEventKind::StoredRecord);
    EXPECT_EQ(classify_gemini_event(json::parse(R"({"type":"error","message":"x"})")),
              GeminiEventKind::Error);
    EXPECT_EQ(classify_gemini_event(json::parse(R"({"type":"init","session_id":"s"})")),
              GeminiEventKind::Init);
    EXPECT_EQ(classify_gemini_event(json::parse(R"({"type":"weird"})")),
              GeminiEventKind::Unknown);
}

TEST(GeminiParserTest, MapsToolNamesAndPassesUnknownThrough) {
    EXPECT_EQ(map_gemini_tool_name("write_file"), "Write");
    EXPECT_EQ(map_gemini_tool_name("replace"), "Edit");
    EXPECT_EQ(map_gemini_tool_name("list_directory"), "Glob");
    EXPECT_EQ(map_gemini_tool_name("google_web_search"), "WebSearch");
    EXPECT_EQ(map_gemini_tool_name("custom_tool"), "custom_tool");
}

TEST(GeminiParserTest, NonMessageEventsAndGarbageAreSkipped) {
    GeminiParser parser;
    EXPECT_FALSE(parser.parse(R"({"type":"init","session_id":"s","model":"m"})").has_value());
    EXPECT_FALSE(parser.parse(R"({"type":"result","status":"success","stats":{}})").has_value());
    EXPECT_FALSE(parser.parse("{").has_value());
    EXPECT_FALSE(parser.parse_record(json::array()).has_value());
}

}  // namespace
