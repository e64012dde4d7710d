#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "providers/provider_registry.hpp"

namespace {

std::atomic_bool* g_cancel_flag = nullptr;

void handle_interrupt(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

int run_command(const agentcli::providers::Provider& provider,
                agentcli::protocol::ExecuteOptions options) {
    options.cancel_token = std::make_shared<std::atomic_bool>(false);
    g_cancel_flag = options.cancel_token.get();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    options.callbacks.on_error = [](const std::string& message) {
        LOG_DEBUG("Provider reported: " + message);
    };

    const auto result = provider.execute(options);
    g_cancel_flag = nullptr;

    std::cout << agentcli::protocol::to_json(result).dump(2) << std::endl;
    if (!result.success) {
        LOG_ERROR("Execution failed: " + result.error.value_or("unknown error"));
        return 1;
    }
    return 0;
}

int session_command(const agentcli::providers::Provider& provider,
                    const agentcli::app::cli::CliCommand& command) {
    const auto messages = provider.load_session(command.session_id, command.project_path);
    std::cout << agentcli::protocol::to_json(messages).dump(2) << std::endl;
    return 0;
}

int detect_command(const agentcli::providers::ProviderRegistry& registry,
                   const agentcli::app::cli::CliCommand& command) {
    nlohmann::json out = nlohmann::json::object();
    if (command.tool.has_value()) {
        const auto tool = command.tool.value();
        out[agentcli::protocol::to_string(tool)] =
            agentcli::providers::to_json(agentcli::providers::get_capabilities(tool));
    } else {
        for (const auto* provider : registry.list()) {
            out[agentcli::protocol::to_string(provider->id())] =
                agentcli::providers::to_json(provider->capabilities());
        }
    }
    std::cout << out.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace agentcli;

    // 1. Logging level from the environment, before anything logs
    core::config::load_log_level_from_env();

    // 2. Parse CLI input and return normalized input errors
    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& command = core::errors::get_value(parsed);
    if (command.options.verbose) {
        core::logging::Logger::get().set_level(core::logging::LogLevel::DEBUG);
    }

    // 3. Dispatch to the provider
    const auto registry = providers::ProviderRegistry::with_defaults();
    if (command.kind == app::cli::CommandKind::Detect) {
        return detect_command(registry, command);
    }

    const auto tool = command.tool.value();
    core::logging::Logger::get().set_context(protocol::to_string(tool));
    const providers::Provider* provider = registry.get(tool);
    if (provider == nullptr) {
        LOG_ERROR("No provider is available for '" + protocol::to_string(tool) + "'.");
        return 3;
    }

    try {
        switch (command.kind) {
            case app::cli::CommandKind::Run:
                return run_command(*provider, command.options);
            case app::cli::CommandKind::Session:
                return session_command(*provider, command);
            case app::cli::CommandKind::Detect:
                break;
        }
    } catch (const core::errors::SetupError& e) {
        LOG_ERROR(std::string("Setup error: ") + e.what());
        return 3;
    }
    return 0;
}
