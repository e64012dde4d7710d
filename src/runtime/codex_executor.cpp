#include "runtime/codex_executor.hpp"

#include <utility>

namespace agentcli::runtime {

using nlohmann::json;
using protocol::ExecuteOptions;
using protocol::PermissionMode;

namespace {

std::vector<std::string> permission_flags(const PermissionMode mode) {
    switch (mode) {
        case PermissionMode::BypassPermissions:
            return {"--dangerously-bypass-approvals-and-sandbox"};
        case PermissionMode::AcceptEdits:
            return {"--full-auto"};
        case PermissionMode::Plan:
            return {"-s", "read-only"};
        case PermissionMode::Default:
            return {"-s", "workspace-write"};
    }
    return {"-s", "workspace-write"};
}

}  // namespace

CodexExecutor::CodexExecutor()
    : CodexExecutor(locator::locator_config_for(protocol::ToolId::Codex)) {}

CodexExecutor::CodexExecutor(locator::LocatorConfig locator_config)
    : CliExecutor(std::move(locator_config)) {}

std::vector<std::string> CodexExecutor::build_args(const ExecuteOptions& options) const {
    std::vector<std::string> args{"exec", "--json"};

    if (options.model.has_value()) {
        args.push_back("-m");
        args.push_back(options.model.value());
    }

    if (options.working_dir.has_value()) {
        args.push_back("-C");
        args.push_back(options.working_dir->string());
        args.push_back("--skip-git-repo-check");
    }

    for (const auto& image : options.images) {
        args.push_back("-i");
        args.push_back(image.string());
    }

    const PermissionMode mode = options.dangerously_skip_permissions
                                    ? PermissionMode::BypassPermissions
                                    : options.permission_mode.value_or(PermissionMode::Default);
    for (auto& flag : permission_flags(mode)) {
        args.push_back(std::move(flag));
    }

    if (options.session_id.has_value()) {
        args.push_back("resume");
        args.push_back(options.session_id.value());
    } else if (options.continue_session) {
        args.push_back("resume");
        args.push_back("--last");
    }

    args.push_back(options.prompt);
    return args;
}

std::optional<std::string> CodexExecutor::session_id_from(const std::vector<json>& events) const {
    const json* started = find_event(events, "thread.started");
    if (started == nullptr) {
        return std::nullopt;
    }
    auto id = parsers::fields::optional_string(*started, "thread_id");
    if (!id.has_value() || id->empty()) {
        return std::nullopt;
    }
    return id;
}

// Summed over every turn.completed in the run.
std::optional<protocol::TokenUsage> CodexExecutor::usage_from(
    const std::vector<json>& events) const {
    std::optional<protocol::TokenUsage> total;
    for (const auto& event : events) {
        if (parsers::fields::string_or(event, "type") != "turn.completed") {
            continue;
        }
        const json& usage = parsers::fields::child_or_null(event, "usage");
        if (!usage.is_object()) {
            continue;
        }
        if (!total.has_value()) {
            total = protocol::TokenUsage{};
        }
        const auto input = parsers::fields::optional_int(usage, "input_tokens").value_or(0);
        const auto output = parsers::fields::optional_int(usage, "output_tokens").value_or(0);
        total->input_tokens = protocol::saturating_add(total->input_tokens, input);
        total->output_tokens = protocol::saturating_add(total->output_tokens, output);
        total->total_tokens = protocol::saturating_add(total->total_tokens,
                                                       protocol::saturating_add(input, output));
        if (const auto cached = parsers::fields::optional_int(usage, "cached_input_tokens")) {
            total->cache_read_tokens =
                protocol::saturating_add(total->cache_read_tokens.value_or(0), cached.value());
        }
    }
    return total;
}

}  // namespace agentcli::runtime
