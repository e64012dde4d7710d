#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace agentcli::core::config {

// Returns the variable's value, or nullopt when unset or empty.
std::optional<std::string> get_env(const std::string& name);

std::filesystem::path home_directory();

// ~/.claude unless CLAUDE_CONFIG_DIR is set
std::filesystem::path claude_home();

// ~/.codex unless CODEX_HOME is set
std::filesystem::path codex_home();

// ~/.gemini unless GEMINI_DIR is set
std::filesystem::path gemini_home();

}  // namespace agentcli::core::config
