#pragma once

#include <string>
#include "parsers/event_parser.hpp"

namespace agentcli::parsers {

enum class GeminiEventKind {
    StoredRecord,      // one entry of a chats/*.json "messages" array
    Init,
    Message,
    ToolUse,
    ToolResult,
    Error,
    Result,
    Unknown
};

GeminiEventKind classify_gemini_event(const nlohmann::json& event);

// Gemini tool vocabulary -> Claude tool vocabulary; unknown names pass through.
std::string map_gemini_tool_name(const std::string& name);

class GeminiParser : public EventParser {
public:
    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Gemini; }

    // One stored message from a session document.
    std::optional<protocol::UnifiedMessage> parse_record(
        const nlohmann::json& record) const noexcept;

protected:
    std::optional<protocol::UnifiedMessage> translate(
        const nlohmann::json& event) const override;

private:
    protocol::UnifiedMessage from_record(const nlohmann::json& record) const;
    std::optional<protocol::UnifiedMessage> from_stream_event(
        GeminiEventKind kind, const nlohmann::json& event) const;
};

}  // namespace agentcli::parsers
