#include "parsers/codex_parser.hpp"

#include <vector>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamp.hpp"

namespace agentcli::parsers {

using nlohmann::json;
using protocol::ContentBlock;
using protocol::Role;
using protocol::UnifiedMessage;

namespace {

UnifiedMessage make_message(std::string id, const Role role, std::vector<ContentBlock> blocks,
                            const std::int64_t timestamp, const json& original) {
    UnifiedMessage out;
    out.id = std::move(id);
    out.role = role;
    out.content = std::move(blocks);
    out.timestamp = timestamp;
    out.tool = protocol::ToolId::Codex;
    out.original = original;
    return out;
}

// Persisted records carry no id of their own.
std::string persisted_id(const std::string& timestamp) {
    return "msg_" + core::config::simple_hash(timestamp + core::config::generate_id("-"));
}

std::string map_tool_name(const std::string& name) {
    if (name == "shell") return "Bash";
    return name;
}

json map_tool_input(const std::string& name, const json& arguments) {
    if (name != "shell") {
        return arguments;
    }
    // ["bash", "-lc", "ls"] -> "ls"
    const json& command = fields::child_or_null(arguments, "command");
    if (command.is_array()) {
        if (command.empty()) {
            return json{{"command", ""}};
        }
        const json& last = command.back();
        return json{{"command", last.is_string() ? last.get<std::string>() : last.dump()}};
    }
    if (command.is_string()) {
        return json{{"command", command.get<std::string>()}};
    }
    return json{{"command", command.dump()}};
}

}  // namespace

CodexEventKind classify_codex_event(const std::string& type) {
    if (type == "item.completed") return CodexEventKind::ItemCompleted;
    if (type == "response_item") return CodexEventKind::ResponseItem;
    if (type == "event_msg") return CodexEventKind::EventMsg;
    if (type == "session_meta") return CodexEventKind::SessionMeta;
    if (type == "turn_context") return CodexEventKind::TurnContext;
    if (type == "thread.started") return CodexEventKind::ThreadStarted;
    if (type == "turn.started") return CodexEventKind::TurnStarted;
    if (type == "turn.completed") return CodexEventKind::TurnCompleted;
    if (type == "turn.failed") return CodexEventKind::TurnFailed;
    if (type == "item.started") return CodexEventKind::ItemStarted;
    if (type == "item.updated") return CodexEventKind::ItemUpdated;
    if (type == "error") return CodexEventKind::Error;
    return CodexEventKind::Unknown;
}

CodexItemKind classify_codex_item(const std::string& type) {
    if (type == "reasoning") return CodexItemKind::Reasoning;
    if (type == "agent_message") return CodexItemKind::AgentMessage;
    if (type == "command_execution") return CodexItemKind::CommandExecution;
    if (type == "file_change") return CodexItemKind::FileChange;
    return CodexItemKind::Unknown;
}

CodexPayloadKind classify_codex_payload(const std::string& type) {
    if (type == "message") return CodexPayloadKind::Message;
    if (type == "reasoning") return CodexPayloadKind::Reasoning;
    if (type == "function_call") return CodexPayloadKind::FunctionCall;
    if (type == "function_call_output") return CodexPayloadKind::FunctionCallOutput;
    if (type == "agent_message") return CodexPayloadKind::AgentMessage;
    if (type == "agent_reasoning") return CodexPayloadKind::AgentReasoning;
    if (type == "user_message") return CodexPayloadKind::UserMessage;
    if (type == "token_count") return CodexPayloadKind::TokenCount;
    return CodexPayloadKind::Unknown;
}

std::optional<UnifiedMessage> CodexParser::translate(const json& event) const {
    const std::string type = fields::string_or(event, "type");
    switch (classify_codex_event(type)) {
        case CodexEventKind::ItemCompleted:
            return from_item(event);
        case CodexEventKind::ResponseItem:
            return from_response_item(event);
        case CodexEventKind::EventMsg:
            return from_event_msg(event);
        case CodexEventKind::SessionMeta:
        case CodexEventKind::TurnContext:
        case CodexEventKind::ThreadStarted:
        case CodexEventKind::TurnStarted:
        case CodexEventKind::TurnCompleted:
        case CodexEventKind::TurnFailed:
        case CodexEventKind::ItemStarted:
        case CodexEventKind::ItemUpdated:
        case CodexEventKind::Error:
            return std::nullopt;
        case CodexEventKind::Unknown:
            LOG_DEBUG("codex parser: ignoring record type '" + type + "'");
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<UnifiedMessage> CodexParser::from_item(const json& event) const {
    const json& item = fields::child_or_null(event, "item");
    if (!item.is_object()) {
        return std::nullopt;
    }

    const std::string item_id = fields::string_or(item, "id");
    const std::string item_type = fields::string_or(item, "type");
    // The stream carries no timestamps.
    const std::int64_t now = core::time::now_unix_ms();
    std::vector<ContentBlock> blocks;

    switch (classify_codex_item(item_type)) {
        case CodexItemKind::Reasoning:
            blocks.emplace_back(protocol::ThinkingBlock{fields::string_or(item, "text")});
            break;
        case CodexItemKind::AgentMessage:
            blocks.emplace_back(protocol::TextBlock{fields::string_or(item, "text")});
            break;
        case CodexItemKind::CommandExecution: {
            protocol::ToolUseBlock use;
            use.id = item_id;
            use.name = "Bash";
            use.input = json{{"command", fields::string_or(item, "command")}};
            blocks.emplace_back(std::move(use));

            protocol::ToolResultBlock result;
            result.tool_use_id = item_id;
            result.content = fields::string_or(item, "aggregated_output");
            if (const auto exit_code = fields::optional_int(item, "exit_code")) {
                result.is_error = exit_code.value() != 0;
            } else {
                // Without exit_code a literal "exit_code != 0" would flag every
                // such item as failed; the reported status decides instead.
                result.is_error = fields::string_or(item, "status") != "completed";
            }
            blocks.emplace_back(std::move(result));
            break;
        }
        case CodexItemKind::FileChange: {
            const json& changes = fields::child_or_null(item, "changes");
            if (!changes.is_array()) {
                break;
            }
            for (const auto& change : changes) {
                const std::string path = fields::string_or(change, "path");
                const std::string change_kind = fields::string_or(change, "kind");
                const std::string hash = core::config::simple_hash(path);
                protocol::ToolUseBlock use;
                if (change_kind == "add") {
                    use.id = item_id + "_add_" + hash;
                    use.name = "Write";
                    use.input = json{{"file_path", path}};
                } else if (change_kind == "modify") {
                    use.id = item_id + "_edit_" + hash;
                    use.name = "Edit";
                    use.input = json{{"file_path", path}};
                } else if (change_kind == "delete") {
                    use.id = item_id + "_delete_" + hash;
                    use.name = "Bash";
                    use.input = json{{"command", "rm " + path}};
                } else {
                    LOG_DEBUG("codex parser: skipping file change of kind '" + change_kind +
                              "'");
                    continue;
                }
                blocks.emplace_back(std::move(use));
            }
            break;
        }
        case CodexItemKind::Unknown:
            LOG_DEBUG("codex parser: ignoring item type '" + item_type + "'");
            return std::nullopt;
    }

    return make_message(item_id, Role::Assistant, std::move(blocks), now, event);
}

std::optional<UnifiedMessage> CodexParser::from_response_item(const json& event) const {
    const json& payload = fields::child_or_null(event, "payload");
    const std::string raw_timestamp = fields::string_or(event, "timestamp");
    const std::int64_t timestamp = fields::timestamp_or_now(event, "timestamp");
    const std::string payload_type = fields::string_or(payload, "type");

    switch (classify_codex_payload(payload_type)) {
        case CodexPayloadKind::Message: {
            std::vector<ContentBlock> blocks;
            const json& content = fields::child_or_null(payload, "content");
            if (content.is_array()) {
                for (const auto& entry : content) {
                    blocks.emplace_back(protocol::TextBlock{fields::string_or(entry, "text")});
                }
            }
            const auto role = protocol::parse_role(fields::string_or(payload, "role"));
            return make_message(persisted_id(raw_timestamp), role.value_or(Role::Assistant),
                                std::move(blocks), timestamp, event);
        }
        case CodexPayloadKind::Reasoning: {
            std::string thinking;
            const json& summary = fields::child_or_null(payload, "summary");
            if (summary.is_array()) {
                bool first = true;
                for (const auto& entry : summary) {
                    if (!first) {
                        thinking += "\n";
                    }
                    thinking += fields::string_or(entry, "text");
                    first = false;
                }
            }
            return make_message(persisted_id(raw_timestamp), Role::Assistant,
                                {protocol::ThinkingBlock{thinking}}, timestamp, event);
        }
        case CodexPayloadKind::FunctionCall: {
            const std::string name = fields::string_or(payload, "name");
            const std::string call_id = fields::string_or(payload, "call_id");
            const std::string raw_arguments = fields::string_or(payload, "arguments");

            json arguments = json::parse(raw_arguments, nullptr, false);
            if (arguments.is_discarded() || !arguments.is_object()) {
                arguments = json{{"raw", raw_arguments}};
            }

            protocol::ToolUseBlock use;
            use.id = call_id;
            use.name = map_tool_name(name);
            use.input = map_tool_input(name, arguments);
            return make_message(call_id, Role::Assistant, {std::move(use)}, timestamp, event);
        }
        case CodexPayloadKind::FunctionCallOutput: {
            const json& output = fields::child_or_null(payload, "output");
            json content = output;
            std::int64_t exit_code = 0;

            // Usually a JSON string: {"output": "...", "metadata": {"exit_code": N}}
            if (output.is_string()) {
                const std::string raw = output.get<std::string>();
                const json wrapped = json::parse(raw, nullptr, false);
                if (!wrapped.is_discarded() && wrapped.is_object()) {
                    const auto inner = fields::optional_string(wrapped, "output");
                    content = inner.has_value() && !inner->empty() ? inner.value() : raw;
                    exit_code = fields::optional_int(fields::child_or_null(wrapped, "metadata"),
                                                     "exit_code")
                                    .value_or(0);
                }
            }

            protocol::ToolResultBlock result;
            result.tool_use_id = fields::string_or(payload, "call_id");
            result.content = std::move(content);
            result.is_error = exit_code != 0;
            return make_message(persisted_id(raw_timestamp), Role::Assistant,
                                {std::move(result)}, timestamp, event);
        }
        case CodexPayloadKind::AgentMessage:
        case CodexPayloadKind::AgentReasoning:
        case CodexPayloadKind::UserMessage:
        case CodexPayloadKind::TokenCount:
        case CodexPayloadKind::Unknown:
            LOG_DEBUG("codex parser: ignoring response_item payload '" + payload_type + "'");
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<UnifiedMessage> CodexParser::from_event_msg(const json& event) const {
    const json& payload = fields::child_or_null(event, "payload");
    const std::string raw_timestamp = fields::string_or(event, "timestamp");
    const std::int64_t timestamp = fields::timestamp_or_now(event, "timestamp");
    const std::string payload_type = fields::string_or(payload, "type");

    switch (classify_codex_payload(payload_type)) {
        case CodexPayloadKind::AgentMessage:
            return make_message(persisted_id(raw_timestamp), Role::Assistant,
                                {protocol::TextBlock{fields::string_or(payload, "message")}},
                                timestamp, event);
        case CodexPayloadKind::AgentReasoning:
            return make_message(persisted_id(raw_timestamp), Role::Assistant,
                                {protocol::ThinkingBlock{fields::string_or(payload, "text")}},
                                timestamp, event);
        case CodexPayloadKind::UserMessage:
            return make_message(persisted_id(raw_timestamp), Role::User,
                                {protocol::TextBlock{fields::string_or(payload, "message")}},
                                timestamp, event);
        case CodexPayloadKind::TokenCount:
            return std::nullopt;
        case CodexPayloadKind::Message:
        case CodexPayloadKind::Reasoning:
        case CodexPayloadKind::FunctionCall:
        case CodexPayloadKind::FunctionCallOutput:
        case CodexPayloadKind::Unknown:
            LOG_DEBUG("codex parser: ignoring event_msg payload '" + payload_type + "'");
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace agentcli::parsers
