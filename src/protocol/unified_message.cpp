#include "protocol/unified_message.hpp"

#include <limits>
#include <type_traits>

namespace agentcli::protocol {

using nlohmann::json;

namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

}  // namespace

std::string to_string(const Role role) {
    switch (role) {
        case Role::User:
            return "user";
        case Role::Assistant:
            return "assistant";
        case Role::System:
            return "system";
    }
    return "assistant";
}

std::optional<Role> parse_role(const std::string& value) {
    if (value == "user") return Role::User;
    if (value == "assistant") return Role::Assistant;
    if (value == "system") return Role::System;
    return std::nullopt;
}

std::int64_t saturating_add(const std::int64_t a, const std::int64_t b) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (b > 0 && a > kMax - b) {
        return kMax;
    }
    if (b < 0 && a < kMin - b) {
        return kMin;
    }
    return a + b;
}

TokenUsage make_usage(const std::int64_t input_tokens, const std::int64_t output_tokens) {
    TokenUsage usage;
    usage.input_tokens = input_tokens;
    usage.output_tokens = output_tokens;
    usage.total_tokens = saturating_add(input_tokens, output_tokens);
    return usage;
}

const std::vector<ContentBlock>& blocks_of(const UnifiedMessage& message) {
    static const std::vector<ContentBlock> kEmpty;
    if (const auto* blocks = std::get_if<std::vector<ContentBlock>>(&message.content)) {
        return *blocks;
    }
    return kEmpty;
}

std::string extract_text_content(const UnifiedMessage& message) {
    if (const auto* text = std::get_if<std::string>(&message.content)) {
        return *text;
    }

    std::string out;
    for (const auto& block : blocks_of(message)) {
        if (const auto* text_block = std::get_if<TextBlock>(&block)) {
            out += text_block->text;
        }
    }
    return out;
}

bool is_bash_tool(const ToolUseBlock& block) { return block.name == "Bash"; }
bool is_read_tool(const ToolUseBlock& block) { return block.name == "Read"; }
bool is_write_tool(const ToolUseBlock& block) { return block.name == "Write"; }
bool is_edit_tool(const ToolUseBlock& block) { return block.name == "Edit"; }

bool is_mcp_tool(const ToolUseBlock& block) {
    return block.name.rfind("mcp__", 0) == 0;
}

json to_json(const ContentBlock& block) {
    return std::visit(
        [](const auto& b) -> json {
            using T = std::decay_t<decltype(b)>;
            json out;
            if constexpr (std::is_same_v<T, TextBlock>) {
                out["type"] = "text";
                out["text"] = b.text;
            } else if constexpr (std::is_same_v<T, ThinkingBlock>) {
                out["type"] = "thinking";
                out["thinking"] = b.thinking;
            } else if constexpr (std::is_same_v<T, ToolUseBlock>) {
                out["type"] = "tool_use";
                out["id"] = b.id;
                out["name"] = b.name;
                out["input"] = b.input;
            } else if constexpr (std::is_same_v<T, ToolResultBlock>) {
                out["type"] = "tool_result";
                out["tool_use_id"] = b.tool_use_id;
                out["content"] = b.content;
                if (b.is_error.has_value()) {
                    out["is_error"] = b.is_error.value();
                }
            } else if constexpr (std::is_same_v<T, SlashCommandBlock>) {
                out["type"] = "slash_command";
                out["command"] = b.command;
                if (b.message.has_value()) {
                    out["message"] = b.message.value();
                }
                if (b.args.has_value()) {
                    out["args"] = b.args.value();
                }
            } else if constexpr (std::is_same_v<T, ImageBlock>) {
                out["type"] = "image";
                out["source"] = {{"type", "base64"},
                                 {"data", b.base64_data},
                                 {"media_type", b.media_type}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled content block");
            }
            return out;
        },
        block);
}

json to_json(const TokenUsage& usage) {
    json out;
    out["inputTokens"] = usage.input_tokens;
    out["outputTokens"] = usage.output_tokens;
    out["totalTokens"] = usage.total_tokens;
    if (usage.cache_creation_tokens.has_value()) {
        out["cacheCreationTokens"] = usage.cache_creation_tokens.value();
    }
    if (usage.cache_read_tokens.has_value()) {
        out["cacheReadTokens"] = usage.cache_read_tokens.value();
    }
    return out;
}

json to_json(const UnifiedMessage& message) {
    json out;
    out["id"] = message.id;
    out["role"] = to_string(message.role);
    if (const auto* text = std::get_if<std::string>(&message.content)) {
        out["content"] = *text;
    } else {
        json blocks = json::array();
        for (const auto& block : blocks_of(message)) {
            blocks.push_back(to_json(block));
        }
        out["content"] = std::move(blocks);
    }
    out["timestamp"] = message.timestamp;
    out["tool"] = to_string(message.tool);
    if (message.model.has_value()) {
        out["model"] = message.model.value();
    }
    if (message.usage.has_value()) {
        out["usage"] = to_json(message.usage.value());
    }
    out["_original"] = message.original;
    return out;
}

json to_json(const std::vector<UnifiedMessage>& messages) {
    json out = json::array();
    for (const auto& message : messages) {
        out.push_back(to_json(message));
    }
    return out;
}

}  // namespace agentcli::protocol
