#include "runtime/gemini_executor.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace agentcli::runtime {

using nlohmann::json;
using protocol::ExecuteOptions;
using protocol::PermissionMode;

namespace {

std::optional<std::string> approval_mode(const ExecuteOptions& options) {
    if (options.dangerously_skip_permissions) {
        return std::string("yolo");
    }
    if (!options.permission_mode.has_value()) {
        return std::nullopt;
    }
    switch (options.permission_mode.value()) {
        case PermissionMode::Plan:
            return std::string("plan");
        case PermissionMode::AcceptEdits:
            return std::string("auto_edit");
        case PermissionMode::BypassPermissions:
            return std::string("yolo");
        case PermissionMode::Default:
            return std::nullopt;
    }
    return std::nullopt;
}

bool is_delta(const protocol::UnifiedMessage& message) {
    const json& delta = parsers::fields::child_or_null(message.original, "delta");
    return delta.is_boolean() && delta.get<bool>();
}

}  // namespace

GeminiExecutor::GeminiExecutor()
    : GeminiExecutor(locator::locator_config_for(protocol::ToolId::Gemini)) {}

GeminiExecutor::GeminiExecutor(locator::LocatorConfig locator_config)
    : CliExecutor(std::move(locator_config)) {}

std::vector<std::string> GeminiExecutor::build_args(const ExecuteOptions& options) const {
    std::vector<std::string> args{"--output-format", "stream-json"};

    if (options.model.has_value()) {
        args.push_back("-m");
        args.push_back(options.model.value());
    }

    if (const auto mode = approval_mode(options)) {
        args.push_back("--approval-mode");
        args.push_back(mode.value());
    }

    if (options.session_id.has_value()) {
        args.push_back("--resume");
        args.push_back(options.session_id.value());
    } else if (options.continue_session) {
        args.push_back("--resume");
        args.push_back("latest");
    }

    if (!options.allowed_tools.empty()) {
        args.push_back("--allowed-tools");
        args.push_back(join(options.allowed_tools, ","));
    }

    if (!options.images.empty()) {
        LOG_WARN("gemini: image attachments are not supported on the command line; ignoring " +
                 std::to_string(options.images.size()) + " image(s)");
    }

    args.push_back("-p");
    args.push_back(options.prompt);
    return args;
}

std::optional<std::string> GeminiExecutor::session_id_from(
    const std::vector<json>& events) const {
    const json* init = find_event(events, "init");
    if (init == nullptr) {
        return std::nullopt;
    }
    auto id = parsers::fields::optional_string(*init, "session_id");
    if (!id.has_value() || id->empty()) {
        return std::nullopt;
    }
    return id;
}

std::optional<protocol::TokenUsage> GeminiExecutor::usage_from(
    const std::vector<json>& events) const {
    const json* result = find_event(events, "result");
    if (result == nullptr) {
        return std::nullopt;
    }
    const json& stats = parsers::fields::child_or_null(*result, "stats");
    if (!stats.is_object()) {
        return std::nullopt;
    }
    auto usage = protocol::make_usage(
        parsers::fields::optional_int(stats, "input_tokens").value_or(0),
        parsers::fields::optional_int(stats, "output_tokens").value_or(0));
    if (const auto total = parsers::fields::optional_int(stats, "total_tokens")) {
        usage.total_tokens = total.value();
    }
    if (const auto cached = parsers::fields::optional_int(stats, "cached")) {
        usage.cache_read_tokens = cached;
    }
    return usage;
}

std::string GeminiExecutor::assemble_text(
    const std::vector<protocol::UnifiedMessage>& messages) const {
    std::vector<std::string> pieces;
    bool previous_was_delta = false;
    for (const auto& message : messages) {
        if (message.role != protocol::Role::Assistant) {
            previous_was_delta = false;
            continue;
        }
        const bool delta = is_delta(message);
        std::string text = protocol::extract_text_content(message);
        if (delta && previous_was_delta && !pieces.empty()) {
            pieces.back() += text;
        } else if (!text.empty()) {
            pieces.push_back(std::move(text));
        }
        previous_was_delta = delta && !pieces.empty();
    }
    return join(pieces, "\n");
}

}  // namespace agentcli::runtime
