#include "parsers/gemini_parser.hpp"

#include <cctype>
#include <vector>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace agentcli::parsers {

using nlohmann::json;
using protocol::ContentBlock;
using protocol::Role;
using protocol::UnifiedMessage;

namespace {

bool is_blank(const std::string& text) {
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

bool is_present(const json& value) {
    if (value.is_null()) {
        return false;
    }
    if (value.is_string()) {
        return !value.get_ref<const json::string_t&>().empty();
    }
    return true;
}

// Reshapes arguments into the input Claude's tool of the same purpose takes.
json map_tool_input(const std::string& name, const json& args) {
    if (!args.is_object()) {
        return json::object();
    }
    auto copy = [&args](json& out, const char* from, const char* to) {
        const auto it = args.find(from);
        if (it != args.end()) {
            out[to] = *it;
        }
    };

    json out = json::object();
    if (name == "read_file") {
        if (args.contains("absolute_path")) {
            copy(out, "absolute_path", "file_path");
        } else {
            copy(out, "file_path", "file_path");
        }
        return out;
    }
    if (name == "write_file") {
        copy(out, "file_path", "file_path");
        copy(out, "content", "content");
        return out;
    }
    if (name == "replace") {
        copy(out, "file_path", "file_path");
        copy(out, "old_string", "old_string");
        copy(out, "new_string", "new_string");
        return out;
    }
    if (name == "list_directory") {
        out["pattern"] = "*";
        copy(out, "path", "path");
        return out;
    }
    if (name == "run_shell_command") {
        copy(out, "command", "command");
        copy(out, "description", "description");
        return out;
    }
    return args;
}

std::string record_text(const json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    // Newer CLIs store content as a parts array.
    std::string out;
    if (content.is_array()) {
        for (const auto& part : content) {
            out += fields::string_or(part, "text");
        }
    }
    return out;
}

void append_tool_call(const json& call, std::vector<ContentBlock>& blocks) {
    const std::string id = fields::string_or(call, "id");
    const std::string name = fields::string_or(call, "name");

    protocol::ToolUseBlock use;
    use.id = id;
    use.name = map_gemini_tool_name(name);
    use.input = map_tool_input(name, fields::child_or_null(call, "args"));
    blocks.emplace_back(std::move(use));

    const json& results = fields::child_or_null(call, "result");
    if (!results.is_array() || results.empty()) {
        return;
    }
    const json& response = fields::child_or_null(
        fields::child_or_null(results.front(), "functionResponse"), "response");
    const json& output = fields::child_or_null(response, "output");
    const json& error = fields::child_or_null(response, "error");

    protocol::ToolResultBlock result;
    result.tool_use_id = id;
    if (is_present(output)) {
        result.content = output;
    } else if (is_present(error)) {
        result.content = error;
    } else {
        result.content = "";
    }
    result.is_error = fields::string_or(call, "status") == "error" || is_present(error);
    blocks.emplace_back(std::move(result));
}

}  // namespace

GeminiEventKind classify_gemini_event(const json& event) {
    const std::string type = fields::string_or(event, "type");
    const bool stored_shape = fields::optional_string(event, "id").has_value() &&
                              event.contains("timestamp");
    if (stored_shape &&
        (type == "user" || type == "gemini" || type == "info" || type == "error")) {
        return GeminiEventKind::StoredRecord;
    }
    if (type == "init") return GeminiEventKind::Init;
    if (type == "message") return GeminiEventKind::Message;
    if (type == "tool_use") return GeminiEventKind::ToolUse;
    if (type == "tool_result") return GeminiEventKind::ToolResult;
    if (type == "error") return GeminiEventKind::Error;
    if (type == "result") return GeminiEventKind::Result;
    return GeminiEventKind::Unknown;
}

std::string map_gemini_tool_name(const std::string& name) {
    if (name == "read_file") return "Read";
    if (name == "write_file") return "Write";
    if (name == "replace") return "Edit";
    if (name == "list_directory") return "Glob";
    if (name == "run_shell_command") return "Bash";
    if (name == "google_web_search") return "WebSearch";
    return name;
}

std::optional<UnifiedMessage> GeminiParser::parse_record(const json& record) const noexcept {
    if (!record.is_object()) {
        return std::nullopt;
    }
    try {
        return from_record(record);
    } catch (const json::exception& e) {
        LOG_DEBUG(std::string("gemini parser: skipping malformed message: ") + e.what());
    } catch (const std::exception& e) {
        LOG_DEBUG(std::string("gemini parser: skipping message: ") + e.what());
    }
    return std::nullopt;
}

std::optional<UnifiedMessage> GeminiParser::translate(const json& event) const {
    const GeminiEventKind kind = classify_gemini_event(event);
    switch (kind) {
        case GeminiEventKind::StoredRecord:
            return from_record(event);
        case GeminiEventKind::Message:
        case GeminiEventKind::ToolUse:
        case GeminiEventKind::ToolResult:
            return from_stream_event(kind, event);
        case GeminiEventKind::Init:
        case GeminiEventKind::Error:
        case GeminiEventKind::Result:
            return std::nullopt;
        case GeminiEventKind::Unknown:
            LOG_DEBUG("gemini parser: ignoring record type '" +
                      fields::string_or(event, "type") + "'");
            return std::nullopt;
    }
    return std::nullopt;
}

UnifiedMessage GeminiParser::from_record(const json& record) const {
    std::vector<ContentBlock> blocks;

    const json& thoughts = fields::child_or_null(record, "thoughts");
    if (thoughts.is_array()) {
        for (const auto& thought : thoughts) {
            blocks.emplace_back(protocol::ThinkingBlock{fields::string_or(thought, "subject") +
                                                        ": " +
                                                        fields::string_or(thought, "description")});
        }
    }

    const json& tool_calls = fields::child_or_null(record, "toolCalls");
    if (tool_calls.is_array()) {
        for (const auto& call : tool_calls) {
            append_tool_call(call, blocks);
        }
    }

    const std::string text = record_text(fields::child_or_null(record, "content"));
    if (!is_blank(text)) {
        blocks.emplace_back(protocol::TextBlock{text});
    }

    UnifiedMessage out;
    out.id = fields::string_or(record, "id");
    out.role = fields::string_or(record, "type") == "user" ? Role::User : Role::Assistant;
    if (blocks.empty()) {
        out.content = text;
    } else {
        out.content = std::move(blocks);
    }
    out.timestamp = fields::timestamp_or_now(record, "timestamp");
    out.tool = protocol::ToolId::Gemini;
    out.model = fields::optional_string(record, "model");

    const json& tokens = fields::child_or_null(record, "tokens");
    if (tokens.is_object()) {
        protocol::TokenUsage usage;
        usage.input_tokens = fields::optional_int(tokens, "input").value_or(0);
        usage.output_tokens = fields::optional_int(tokens, "output").value_or(0);
        usage.total_tokens = fields::optional_int(tokens, "total")
                                 .value_or(usage.input_tokens + usage.output_tokens);
        usage.cache_read_tokens = fields::optional_int(tokens, "cached");
        out.usage = usage;
    }
    out.original = record;
    return out;
}

std::optional<UnifiedMessage> GeminiParser::from_stream_event(const GeminiEventKind kind,
                                                              const json& event) const {
    UnifiedMessage out;
    out.id = core::config::generate_id("msg_");
    out.role = Role::Assistant;
    out.timestamp = fields::timestamp_or_now(event, "timestamp");
    out.tool = protocol::ToolId::Gemini;
    out.original = event;

    switch (kind) {
        case GeminiEventKind::Message: {
            const auto role = protocol::parse_role(fields::string_or(event, "role"));
            out.role = role.value_or(Role::Assistant);
            out.content = std::vector<ContentBlock>{
                protocol::TextBlock{record_text(fields::child_or_null(event, "content"))}};
            return out;
        }
        case GeminiEventKind::ToolUse: {
            const std::string name = fields::string_or(event, "tool_name");
            protocol::ToolUseBlock use;
            use.id = fields::string_or(event, "tool_id");
            use.name = map_gemini_tool_name(name);
            use.input = map_tool_input(name, fields::child_or_null(event, "parameters"));
            out.content = std::vector<ContentBlock>{std::move(use)};
            return out;
        }
        case GeminiEventKind::ToolResult: {
            protocol::ToolResultBlock result;
            result.tool_use_id = fields::string_or(event, "tool_id");
            const json& output = fields::child_or_null(event, "output");
            const json& error = fields::child_or_null(event, "error");
            if (is_present(output)) {
                result.content = output;
            } else if (is_present(error)) {
                result.content = error.is_object()
                                     ? json(fields::string_or(error, "message", error.dump()))
                                     : error;
            } else {
                result.content = "";
            }
            result.is_error = fields::string_or(event, "status") == "error";
            out.content = std::vector<ContentBlock>{std::move(result)};
            return out;
        }
        case GeminiEventKind::StoredRecord:
        case GeminiEventKind::Init:
        case GeminiEventKind::Error:
        case GeminiEventKind::Result:
        case GeminiEventKind::Unknown:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace agentcli::parsers
