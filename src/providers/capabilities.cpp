#include "providers/capabilities.hpp"

#include <utility>
#include "locator/cli_locator.hpp"

namespace agentcli::providers {

using protocol::ToolId;

AgentCapabilities static_capabilities(const ToolId tool) {
    AgentCapabilities caps;
    switch (tool) {
        case ToolId::Claude:
            caps.supports_slash_commands = true;
            caps.supports_models = true;
            caps.models = {{"claude-sonnet-4-5-20250929", "Sonnet 4.5"},
                           {"claude-opus-4-5-20251124", "Opus 4.5"},
                           {"haiku", "Haiku 4.5"}};
            break;
        case ToolId::Codex:
            caps.supports_models = true;
            caps.models = {{"gpt-5-codex", "GPT-5 Codex"}, {"gpt-5", "GPT-5"}};
            break;
        case ToolId::Gemini:
            caps.supports_models = true;
            caps.models = {{"gemini-2.5-pro", "Gemini 2.5 Pro"},
                           {"gemini-2.5-flash", "Gemini 2.5 Flash"}};
            break;
        case ToolId::Cursor:
            break;
    }
    return caps;
}

AgentCapabilities get_capabilities(const ToolId tool) {
    AgentCapabilities caps = static_capabilities(tool);
    if (tool == ToolId::Cursor) {
        return caps;
    }

    const locator::CliLocator locator;
    caps.cli_path = locator.locate(locator::locator_config_for(tool));
    caps.installed = caps.cli_path.has_value();
    return caps;
}

nlohmann::json to_json(const AgentCapabilities& capabilities) {
    nlohmann::json models = nlohmann::json::array();
    for (const auto& model : capabilities.models) {
        models.push_back({{"id", model.id}, {"name", model.name}});
    }

    nlohmann::json out;
    out["supportsSlashCommands"] = capabilities.supports_slash_commands;
    out["supportsModels"] = capabilities.supports_models;
    out["models"] = std::move(models);
    out["installed"] = capabilities.installed;
    if (capabilities.cli_path.has_value()) {
        out["cliPath"] = capabilities.cli_path->string();
    }
    return out;
}

}  // namespace agentcli::providers
