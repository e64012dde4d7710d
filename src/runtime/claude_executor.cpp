#include "runtime/claude_executor.hpp"

#include <utility>
#include "core/config/engine_config.hpp"

namespace agentcli::runtime {

using nlohmann::json;
using protocol::ExecuteOptions;

ClaudeExecutor::ClaudeExecutor()
    : ClaudeExecutor(locator::locator_config_for(protocol::ToolId::Claude)) {}

ClaudeExecutor::ClaudeExecutor(locator::LocatorConfig locator_config)
    : CliExecutor(std::move(locator_config)) {}

std::vector<std::string> ClaudeExecutor::build_args(const ExecuteOptions& options) const {
    std::vector<std::string> args{"-p"};

    if (options.model.has_value()) {
        args.push_back("--model");
        args.push_back(options.model.value());
    }

    // Session flags are mutually exclusive.
    if (options.session_id.has_value() && options.resume) {
        args.push_back("--resume");
        args.push_back(options.session_id.value());
    } else if (options.session_id.has_value()) {
        args.push_back("--session-id");
        args.push_back(options.session_id.value());
    } else if (options.continue_session) {
        args.push_back("--continue");
    }

    if (options.permission_mode.has_value()) {
        args.push_back("--permission-mode");
        args.push_back(protocol::to_string(options.permission_mode.value()));
    } else if (options.dangerously_skip_permissions) {
        args.push_back("--permission-mode");
        args.push_back(protocol::to_string(protocol::PermissionMode::BypassPermissions));
    }

    // stream-json only works together with --verbose
    if (options.streaming) {
        args.push_back("--output-format");
        args.push_back("stream-json");
        args.push_back("--verbose");
    } else if (options.verbose) {
        args.push_back("--verbose");
    }

    if (!options.allowed_tools.empty()) {
        args.push_back("--allowed-tools");
        args.push_back(join(options.allowed_tools, ","));
    }
    if (!options.disallowed_tools.empty()) {
        args.push_back("--disallowed-tools");
        args.push_back(join(options.disallowed_tools, ","));
    }

    for (const auto& image : options.images) {
        args.push_back("-i");
        args.push_back(image.string());
    }

    args.push_back(options.prompt);
    return args;
}

std::optional<std::uint32_t> ClaudeExecutor::default_timeout_ms() const {
    return core::config::kClaudeDefaultTimeoutMs;
}

std::optional<std::string> ClaudeExecutor::session_id_from(const std::vector<json>& events) const {
    for (const auto& event : events) {
        if (parsers::fields::string_or(event, "type") == "system" &&
            parsers::fields::string_or(event, "subtype") == "init") {
            auto id = parsers::fields::optional_string(event, "session_id");
            if (id.has_value() && !id->empty()) {
                return id;
            }
        }
    }
    return std::nullopt;
}

std::optional<protocol::TokenUsage> ClaudeExecutor::usage_from(
    const std::vector<json>& events) const {
    const json* result = find_event(events, "result");
    if (result == nullptr) {
        return std::nullopt;
    }
    const json& usage = parsers::fields::child_or_null(*result, "usage");
    if (!usage.is_object()) {
        return std::nullopt;
    }
    auto out = protocol::make_usage(
        parsers::fields::optional_int(usage, "input_tokens").value_or(0),
        parsers::fields::optional_int(usage, "output_tokens").value_or(0));
    out.cache_creation_tokens =
        parsers::fields::optional_int(usage, "cache_creation_input_tokens");
    out.cache_read_tokens = parsers::fields::optional_int(usage, "cache_read_input_tokens");
    return out;
}

std::optional<std::string> ClaudeExecutor::structured_source(
    const std::vector<json>& events) const {
    const json* result = find_event(events, "result");
    if (result == nullptr) {
        return std::nullopt;
    }
    auto text = parsers::fields::optional_string(*result, "result");
    if (!text.has_value() || text->empty()) {
        return std::nullopt;
    }
    return text;
}

}  // namespace agentcli::runtime
