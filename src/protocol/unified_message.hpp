#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_id.hpp"

namespace agentcli::protocol {

    enum class Role {
        User,
        Assistant,
        System
    };

    // Content blocks. Order inside a message is the order the provider
    // emitted them in.
    struct TextBlock {
        std::string text;
    };

    struct ThinkingBlock {
        std::string thinking;
    };

    struct ToolUseBlock {
        std::string id;
        std::string name;                 // Claude vocabulary: Bash, Read, Write, Edit, ...
        nlohmann::json input = nlohmann::json::object();
    };

    // tool_use_id must match the id of a ToolUseBlock emitted earlier in the
    // same conversation.
    struct ToolResultBlock {
        std::string tool_use_id;
        nlohmann::json content;
        std::optional<bool> is_error;
    };

    struct SlashCommandBlock {
        std::string command;
        std::optional<std::string> message;
        std::optional<std::string> args;
    };

    struct ImageBlock {
        std::string base64_data;
        std::string media_type = "image/png";
    };

    using ContentBlock = std::variant<
        TextBlock,
        ThinkingBlock,
        ToolUseBlock,
        ToolResultBlock,
        SlashCommandBlock,
        ImageBlock
    >;

    using MessageContent = std::variant<std::string, std::vector<ContentBlock>>;

    struct TokenUsage {
        std::int64_t input_tokens = 0;
        std::int64_t output_tokens = 0;
        std::int64_t total_tokens = 0;
        std::optional<std::int64_t> cache_creation_tokens;
        std::optional<std::int64_t> cache_read_tokens;
    };

    // One conversation turn, whatever provider it came from.
    struct UnifiedMessage {
        std::string id;
        Role role = Role::Assistant;
        MessageContent content;
        std::int64_t timestamp = 0;     // epoch millis
        ToolId tool = ToolId::Claude;
        std::optional<std::string> model;
        std::optional<TokenUsage> usage;

        // Untouched provider record. Kept for debugging only; nothing parses it again.
        nlohmann::json original;
    };

    std::string to_string(Role role);
    std::optional<Role> parse_role(const std::string& value);

    // Clamps at the int64 bounds instead of overflowing.
    std::int64_t saturating_add(std::int64_t a, std::int64_t b);

    TokenUsage make_usage(std::int64_t input_tokens, std::int64_t output_tokens);

    // Text blocks concatenated without separator; string content verbatim.
    std::string extract_text_content(const UnifiedMessage& message);

    // Blocks of the message; empty for plain string content.
    const std::vector<ContentBlock>& blocks_of(const UnifiedMessage& message);

    bool is_bash_tool(const ToolUseBlock& block);
    bool is_read_tool(const ToolUseBlock& block);
    bool is_write_tool(const ToolUseBlock& block);
    bool is_edit_tool(const ToolUseBlock& block);
    bool is_mcp_tool(const ToolUseBlock& block);

    // Claude-compatible JSON shapes
    nlohmann::json to_json(const ContentBlock& block);
    nlohmann::json to_json(const TokenUsage& usage);
    nlohmann::json to_json(const UnifiedMessage& message);
    nlohmann::json to_json(const std::vector<UnifiedMessage>& messages);

} // namespace agentcli::protocol
