#pragma once

#include <string>
#include "parsers/event_parser.hpp"

namespace agentcli::parsers {

enum class ClaudeEventKind {
    User,
    Assistant,
    System,
    Result,
    Unknown
};

enum class ClaudeBlockKind {
    Text,
    Thinking,
    ToolUse,
    ToolResult,
    Image,
    Unknown
};

ClaudeEventKind classify_claude_event(const std::string& type);
ClaudeBlockKind classify_claude_block(const std::string& type);

// Claude's stream-json stdout and its persisted JSONL share one record shape.
class ClaudeParser : public EventParser {
public:
    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Claude; }

protected:
    std::optional<protocol::UnifiedMessage> translate(
        const nlohmann::json& event) const override;
};

}  // namespace agentcli::parsers
