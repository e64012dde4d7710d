#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_id.hpp"

namespace agentcli::providers {

struct ModelInfo {
    std::string id;
    std::string name;
};

struct AgentCapabilities {
    bool supports_slash_commands = false;
    bool supports_models = false;
    std::vector<ModelInfo> models;
    bool installed = false;
    std::optional<std::filesystem::path> cli_path;
};

// Fixed per-tool feature table; installed/cli_path are left unset.
AgentCapabilities static_capabilities(protocol::ToolId tool);

// static_capabilities plus a fresh locator lookup. Cursor is never detected.
AgentCapabilities get_capabilities(protocol::ToolId tool);

nlohmann::json to_json(const AgentCapabilities& capabilities);

}  // namespace agentcli::providers
