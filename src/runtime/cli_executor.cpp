#include "runtime/cli_executor.hpp"

#include <cctype>
#include <chrono>
#include <utility>
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/process_launcher.hpp"
#include "stream/line_buffer.hpp"
#include "stream/result_extractor.hpp"

namespace agentcli::runtime {

using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ExecuteOptions;
using protocol::ExecuteResult;
using protocol::UnifiedMessage;

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

}  // namespace

CliExecutor::CliExecutor(locator::LocatorConfig locator_config)
    : locator_config_(std::move(locator_config)) {}

std::filesystem::path CliExecutor::resolve_binary() const {
    const locator::CliLocator locator;
    auto path = locator.locate(locator_config_);
    if (!path.has_value()) {
        throw core::errors::SetupError(
            protocol::to_string(tool()) + " CLI not found. Set " + locator_config_.env_var +
            " or install `" + locator_config_.command_name + "`.");
    }
    return path.value();
}

ExecuteResult CliExecutor::execute(const ExecuteOptions& options) const {
    const std::string name = protocol::to_string(tool());
    const auto binary = resolve_binary();
    const auto args = build_args(options);

    ExecuteResult result;
    std::string raw_output;
    std::string stderr_text;
    const auto& callbacks = options.callbacks;

    stream::LineBuffer lines([&](const std::string& line) {
        const json event = json::parse(line, nullptr, false);
        if (event.is_discarded()) {
            LOG_DEBUG(name + ": skipping non-JSON stdout line");
            return;
        }
        result.events.push_back(event);
        const std::optional<UnifiedMessage> message = parser().parse_event(result.events.back());
        if (message.has_value()) {
            result.messages.push_back(message.value());
        }
        if (callbacks.on_event) {
            callbacks.on_event(protocol::EventData{line, result.events.back(), message});
        }
    });

    process::SpawnRequest request;
    request.executable = binary;
    request.args = args;
    request.working_directory = options.working_dir;
    request.environment = options.environment;
    request.timeout_ms = options.timeout_ms.value_or(default_timeout_ms().value_or(0));
    request.cancel_token = options.cancel_token;
    request.on_stdout = [&](const std::string& chunk) {
        raw_output += chunk;
        lines.add(chunk);
        if (callbacks.on_stdout) {
            callbacks.on_stdout(protocol::StdoutData{raw_output, result.events, result.messages});
        }
    };
    request.on_stderr = [&](const std::string& chunk) {
        stderr_text += chunk;
        if (callbacks.on_stderr) {
            callbacks.on_stderr(chunk);
        }
    };

    LOG_INFO("Starting " + name + " (" + binary.string() + ") with " +
             std::to_string(args.size()) + " argument(s)");
    const auto started = std::chrono::steady_clock::now();
    const process::ProcessLauncher launcher;
    const auto spawned = launcher.run(request);
    lines.flush();

    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        LOG_WARN(name + " run failed [" + err.code + "]: " + err.message);
        result.success = false;
        result.exit_code = -1;
        result.timed_out = err.category == ErrorCategory::Timeout;
        result.cancelled = err.category == ErrorCategory::Cancelled;
        result.error = stderr_text.empty() ? err.message : stderr_text;
        result.duration_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        if (callbacks.on_error) {
            callbacks.on_error(err.message);
        }
    } else {
        const auto& capture = core::errors::get_value(spawned);
        result.exit_code = capture.exit_code;
        result.success = capture.exit_code == 0;
        result.duration_ms = capture.duration_ms;
        if (!result.success) {
            result.error = stderr_text.empty() ? std::string("Command failed") : stderr_text;
            LOG_WARN(name + " exited with code " + std::to_string(capture.exit_code));
        }
    }
    if (callbacks.on_close) {
        callbacks.on_close(result.exit_code);
    }

    if (auto session_id = session_id_from(result.events)) {
        result.session_id = session_id.value();
    } else if (options.session_id.has_value()) {
        result.session_id = options.session_id.value();
    }

    result.text = assemble_text(result.messages);
    if (result.events.empty() && !raw_output.empty()) {
        // Non-streaming runs print plain text.
        result.text = trim(raw_output);
    }

    result.data = result.text;
    if (options.json) {
        const std::string source = structured_source(result.events).value_or(result.text);
        if (!source.empty()) {
            if (auto extracted = stream::extract_structured(source)) {
                result.data = std::move(extracted.value());
            } else {
                LOG_DEBUG(name + ": no JSON found in reply; returning text");
            }
        }
    }

    result.usage = usage_from(result.events);
    if (!result.usage.has_value()) {
        result.usage = sum_message_usage(result.messages);
    }

    LOG_INFO(name + " finished: exit=" + std::to_string(result.exit_code) + " messages=" +
             std::to_string(result.messages.size()) + " session=" + result.session_id);
    return result;
}

std::optional<protocol::TokenUsage> CliExecutor::usage_from(
    const std::vector<json>& /*events*/) const {
    return std::nullopt;
}

std::optional<std::string> CliExecutor::structured_source(
    const std::vector<json>& /*events*/) const {
    return std::nullopt;
}

std::string CliExecutor::assemble_text(const std::vector<UnifiedMessage>& messages) const {
    std::vector<std::string> pieces;
    for (const auto& message : messages) {
        if (message.role != protocol::Role::Assistant) {
            continue;
        }
        std::string text = protocol::extract_text_content(message);
        if (!text.empty()) {
            pieces.push_back(std::move(text));
        }
    }
    return join(pieces, "\n");
}

const json* find_event(const std::vector<json>& events, const std::string& type) {
    for (const auto& event : events) {
        if (event.is_object() && parsers::fields::string_or(event, "type") == type) {
            return &event;
        }
    }
    return nullptr;
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += items[i];
    }
    return out;
}

std::optional<protocol::TokenUsage> sum_message_usage(const std::vector<UnifiedMessage>& messages) {
    std::optional<protocol::TokenUsage> total;
    for (const auto& message : messages) {
        if (!message.usage.has_value()) {
            continue;
        }
        if (!total.has_value()) {
            total = protocol::TokenUsage{};
        }
        const auto& usage = message.usage.value();
        total->input_tokens = protocol::saturating_add(total->input_tokens, usage.input_tokens);
        total->output_tokens = protocol::saturating_add(total->output_tokens, usage.output_tokens);
        total->total_tokens = protocol::saturating_add(total->total_tokens, usage.total_tokens);
        if (usage.cache_creation_tokens.has_value()) {
            total->cache_creation_tokens =
                protocol::saturating_add(total->cache_creation_tokens.value_or(0),
                                         usage.cache_creation_tokens.value());
        }
        if (usage.cache_read_tokens.has_value()) {
            total->cache_read_tokens =
                protocol::saturating_add(total->cache_read_tokens.value_or(0),
                                         usage.cache_read_tokens.value());
        }
    }
    return total;
}

}  // namespace agentcli::runtime
