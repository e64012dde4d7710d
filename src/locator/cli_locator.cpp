#include "locator/cli_locator.hpp"

#include <cctype>
#include <sstream>
#include <system_error>
#include "core/config/environment.hpp"
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/process_launcher.hpp"

namespace agentcli::locator {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kCommandLookupTimeoutMs = 5000;

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

bool path_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

std::vector<fs::path> standard_paths(const std::string& command) {
    const fs::path home = core::config::home_directory();
    return {
        home / ".local" / "bin" / command,
        home / ".npm-global" / "bin" / command,
        fs::path("/usr/local/bin") / command,
        fs::path("/opt/homebrew/bin") / command,
        fs::path("/usr/bin") / command,
    };
}

}  // namespace

LocatorConfig locator_config_for(const protocol::ToolId tool) {
    LocatorConfig config;
    switch (tool) {
        case protocol::ToolId::Claude:
            config.env_var = "CLAUDE_CLI_PATH";
            config.command_name = "claude";
            config.common_paths.push_back(core::config::home_directory() / ".claude" /
                                          "local" / "claude");
            break;
        case protocol::ToolId::Codex:
            config.env_var = "CODEX_CLI_PATH";
            config.command_name = "codex";
            break;
        case protocol::ToolId::Gemini:
            config.env_var = "GEMINI_CLI_PATH";
            config.command_name = "gemini";
            break;
        case protocol::ToolId::Cursor:
            config.env_var = "CURSOR_CLI_PATH";
            config.command_name = "cursor-agent";
            break;
    }

    for (auto& path : standard_paths(config.command_name)) {
        config.common_paths.push_back(std::move(path));
    }
    return config;
}

std::optional<fs::path> CliLocator::locate(const LocatorConfig& config) const {
    if (auto path = from_environment(config)) {
        LOG_DEBUG("Located " + config.command_name + " via " + config.env_var + ": " +
                  path->string());
        return path;
    }
    if (auto path = from_command_lookup(config)) {
        LOG_DEBUG("Located " + config.command_name + " on PATH: " + path->string());
        return path;
    }
    if (auto path = from_common_paths(config)) {
        LOG_DEBUG("Located " + config.command_name + " at " + path->string());
        return path;
    }

    LOG_DEBUG("Could not locate " + config.command_name);
    return std::nullopt;
}

std::optional<fs::path> CliLocator::from_environment(const LocatorConfig& config) const {
    if (config.env_var.empty()) {
        return std::nullopt;
    }
    const auto value = core::config::get_env(config.env_var);
    if (!value.has_value()) {
        return std::nullopt;
    }
    if (!path_exists(value.value())) {
        LOG_DEBUG(config.env_var + " points at a missing file: " + value.value());
        return std::nullopt;
    }
    return fs::path(value.value());
}

std::optional<fs::path> CliLocator::from_command_lookup(const LocatorConfig& config) const {
    if (config.command_name.empty()) {
        return std::nullopt;
    }

    process::SpawnRequest request;
    request.executable = "which";
    request.args = {config.command_name};
    request.timeout_ms = kCommandLookupTimeoutMs;
    request.kill_grace_ms = 500;

    const process::ProcessLauncher launcher;
    const auto result = launcher.run(request);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        LOG_DEBUG("`which " + config.command_name + "` failed [" + err.code + "]: " +
                  err.message);
        return std::nullopt;
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.exit_code != 0) {
        return std::nullopt;
    }

    std::istringstream lines(capture.stdout_text);
    std::string line;
    while (std::getline(lines, line)) {
        std::string candidate = trim(line);
        if (candidate.empty()) {
            continue;
        }
        // zsh-style "name: aliased to /path"
        const auto alias = candidate.find("aliased to ");
        if (alias != std::string::npos) {
            candidate = trim(candidate.substr(alias + 11));
        }
        if (path_exists(candidate)) {
            return fs::path(candidate);
        }
        LOG_DEBUG("`which` reported a missing file: " + candidate);
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<fs::path> CliLocator::from_common_paths(const LocatorConfig& config) const {
    for (const auto& candidate : config.common_paths) {
        if (path_exists(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace agentcli::locator
