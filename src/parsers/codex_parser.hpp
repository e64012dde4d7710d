#pragma once

#include <string>
#include "parsers/event_parser.hpp"

namespace agentcli::parsers {

enum class CodexEventKind {
    ItemCompleted,     // streaming
    ResponseItem,      // persisted
    EventMsg,          // persisted
    SessionMeta,
    TurnContext,
    ThreadStarted,
    TurnStarted,
    TurnCompleted,
    TurnFailed,
    ItemStarted,
    ItemUpdated,
    Error,
    Unknown
};

enum class CodexItemKind {
    Reasoning,
    AgentMessage,
    CommandExecution,
    FileChange,
    Unknown
};

enum class CodexPayloadKind {
    Message,
    Reasoning,
    FunctionCall,
    FunctionCallOutput,
    AgentMessage,
    AgentReasoning,
    UserMessage,
    TokenCount,
    Unknown
};

CodexEventKind classify_codex_event(const std::string& type);
CodexItemKind classify_codex_item(const std::string& type);
CodexPayloadKind classify_codex_payload(const std::string& type);

// One parser for both shapes Codex writes: `exec --json` stdout and the
// rollout files under ~/.codex/sessions.
class CodexParser : public EventParser {
public:
    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Codex; }

protected:
    std::optional<protocol::UnifiedMessage> translate(
        const nlohmann::json& event) const override;

private:
    std::optional<protocol::UnifiedMessage> from_item(const nlohmann::json& event) const;
    std::optional<protocol::UnifiedMessage> from_response_item(
        const nlohmann::json& event) const;
    std::optional<protocol::UnifiedMessage> from_event_msg(const nlohmann::json& event) const;
};

}  // namespace agentcli::parsers
