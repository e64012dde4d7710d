#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "protocol/tool_id.hpp"

namespace agentcli::locator {

struct LocatorConfig {
    std::string env_var;                              // e.g. CLAUDE_CLI_PATH
    std::string command_name;                         // looked up with `which`
    std::vector<std::filesystem::path> common_paths;  // checked in order
};

// Default lookup table for a provider. Home-relative entries are expanded
// against the current HOME.
LocatorConfig locator_config_for(protocol::ToolId tool);

// Finds a provider binary: env override, then `which`, then well-known
// install locations. Every call looks again; nothing is cached.
class CliLocator {
public:
    std::optional<std::filesystem::path> locate(const LocatorConfig& config) const;

private:
    std::optional<std::filesystem::path> from_environment(const LocatorConfig& config) const;
    std::optional<std::filesystem::path> from_command_lookup(const LocatorConfig& config) const;
    std::optional<std::filesystem::path> from_common_paths(const LocatorConfig& config) const;
};

}  // namespace agentcli::locator
