#include "parsers/claude_parser.hpp"

#include <cctype>
#include <vector>
#include "core/logging/logger.hpp"

namespace agentcli::parsers {

using nlohmann::json;
using protocol::ContentBlock;

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Inner text of the first <tag>...</tag>, if any.
std::optional<std::string> find_tag(const std::string& text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const auto start = text.find(open);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    const auto body = start + open.size();
    const auto end = text.find(close, body);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return text.substr(body, end - body);
}

std::string strip_tags(std::string text, const std::string& tag) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    while (true) {
        const auto start = text.find(open);
        if (start == std::string::npos) {
            break;
        }
        const auto end = text.find(close, start + open.size());
        if (end == std::string::npos) {
            break;
        }
        text.erase(start, end + close.size() - start);
    }
    return text;
}

// User turns produced by a slash command carry it in pseudo-XML tags.
std::vector<ContentBlock> split_slash_command(const std::string& text) {
    const auto command = find_tag(text, "command-name");
    if (!command.has_value()) {
        return {protocol::TextBlock{text}};
    }

    std::vector<ContentBlock> blocks;
    const std::string name = trim(command.value());
    if (!name.empty()) {
        protocol::SlashCommandBlock slash;
        slash.command = name;
        if (const auto message = find_tag(text, "command-message")) {
            slash.message = trim(message.value());
        }
        if (const auto args = find_tag(text, "command-args")) {
            slash.args = trim(args.value());
        }
        blocks.emplace_back(std::move(slash));
    }

    std::string remaining = text;
    for (const char* tag : {"command-name", "command-message", "command-args"}) {
        remaining = strip_tags(remaining, tag);
    }
    remaining = trim(remaining);
    if (!remaining.empty()) {
        blocks.emplace_back(protocol::TextBlock{remaining});
    }
    return blocks;
}

void append_block(const json& block, const ClaudeEventKind event_kind,
                  std::vector<ContentBlock>& out) {
    const std::string type = fields::string_or(block, "type");
    switch (classify_claude_block(type)) {
        case ClaudeBlockKind::Text: {
            const std::string text = fields::string_or(block, "text");
            if (event_kind == ClaudeEventKind::User &&
                text.find("<command-name>") != std::string::npos) {
                for (auto& split : split_slash_command(text)) {
                    out.push_back(std::move(split));
                }
            } else {
                out.emplace_back(protocol::TextBlock{text});
            }
            return;
        }
        case ClaudeBlockKind::Thinking:
            out.emplace_back(protocol::ThinkingBlock{fields::string_or(block, "thinking")});
            return;
        case ClaudeBlockKind::ToolUse: {
            protocol::ToolUseBlock use;
            use.id = fields::string_or(block, "id");
            use.name = fields::string_or(block, "name");
            const json& input = fields::child_or_null(block, "input");
            if (input.is_object()) {
                use.input = input;
            }
            out.emplace_back(std::move(use));
            return;
        }
        case ClaudeBlockKind::ToolResult: {
            protocol::ToolResultBlock result;
            result.tool_use_id = fields::string_or(block, "tool_use_id");
            result.content = fields::child_or_null(block, "content");
            const json& is_error = fields::child_or_null(block, "is_error");
            if (is_error.is_boolean()) {
                result.is_error = is_error.get<bool>();
            }
            out.emplace_back(std::move(result));
            return;
        }
        case ClaudeBlockKind::Image: {
            const json& source = fields::child_or_null(block, "source");
            protocol::ImageBlock image;
            image.base64_data = fields::string_or(source, "data");
            image.media_type = fields::string_or(source, "media_type", "image/png");
            out.emplace_back(std::move(image));
            return;
        }
        case ClaudeBlockKind::Unknown:
            LOG_DEBUG("claude parser: skipping unknown content block '" + type + "'");
            return;
    }
}

std::optional<protocol::TokenUsage> read_usage(const json& usage) {
    if (!usage.is_object()) {
        return std::nullopt;
    }
    auto out = protocol::make_usage(fields::optional_int(usage, "input_tokens").value_or(0),
                                    fields::optional_int(usage, "output_tokens").value_or(0));
    out.cache_creation_tokens = fields::optional_int(usage, "cache_creation_input_tokens");
    out.cache_read_tokens = fields::optional_int(usage, "cache_read_input_tokens");
    return out;
}

}  // namespace

ClaudeEventKind classify_claude_event(const std::string& type) {
    if (type == "user") return ClaudeEventKind::User;
    if (type == "assistant") return ClaudeEventKind::Assistant;
    if (type == "system") return ClaudeEventKind::System;
    if (type == "result") return ClaudeEventKind::Result;
    return ClaudeEventKind::Unknown;
}

ClaudeBlockKind classify_claude_block(const std::string& type) {
    if (type == "text") return ClaudeBlockKind::Text;
    if (type == "thinking") return ClaudeBlockKind::Thinking;
    if (type == "tool_use") return ClaudeBlockKind::ToolUse;
    if (type == "tool_result") return ClaudeBlockKind::ToolResult;
    if (type == "image") return ClaudeBlockKind::Image;
    return ClaudeBlockKind::Unknown;
}

std::optional<protocol::UnifiedMessage> ClaudeParser::translate(const json& event) const {
    const std::string type = fields::string_or(event, "type");
    const ClaudeEventKind kind = classify_claude_event(type);
    switch (kind) {
        case ClaudeEventKind::User:
        case ClaudeEventKind::Assistant:
            break;
        case ClaudeEventKind::System:
        case ClaudeEventKind::Result:
            return std::nullopt;
        case ClaudeEventKind::Unknown:
            LOG_DEBUG("claude parser: ignoring record type '" + type + "'");
            return std::nullopt;
    }

    const json& message = fields::child_or_null(event, "message");
    if (!message.is_object()) {
        return std::nullopt;
    }

    std::vector<ContentBlock> blocks;
    const json& content = fields::child_or_null(message, "content");
    if (content.is_string()) {
        append_block(json{{"type", "text"}, {"text", content.get<std::string>()}}, kind,
                     blocks);
    } else if (content.is_array()) {
        for (const auto& block : content) {
            append_block(block, kind, blocks);
        }
    }

    protocol::UnifiedMessage out;
    const auto raw_timestamp = fields::optional_string(event, "timestamp");
    out.timestamp = fields::timestamp_or_now(event, "timestamp");

    if (auto uuid = fields::optional_string(event, "uuid"); uuid && !uuid->empty()) {
        out.id = uuid.value();
    } else if (auto id = fields::optional_string(message, "id"); id && !id->empty()) {
        out.id = id.value();
    } else {
        out.id = raw_timestamp.value_or(std::to_string(out.timestamp)) + "-" + type;
    }

    const auto role = protocol::parse_role(fields::string_or(message, "role", type));
    out.role = role.value_or(kind == ClaudeEventKind::User ? protocol::Role::User
                                                           : protocol::Role::Assistant);
    out.content = std::move(blocks);
    out.tool = protocol::ToolId::Claude;
    out.model = fields::optional_string(message, "model");
    out.usage = read_usage(fields::child_or_null(message, "usage"));
    out.original = event;
    return out;
}

}  // namespace agentcli::parsers
