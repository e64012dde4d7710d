#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "providers/provider.hpp"

namespace agentcli::providers {

class ProviderRegistry {
public:
    // Claude, Codex and Gemini. Cursor has no implementation.
    static ProviderRegistry with_defaults();

    // Replaces any provider already registered under the same id.
    void register_provider(std::unique_ptr<Provider> provider);

    // nullptr when nothing is registered for the tool.
    const Provider* get(protocol::ToolId tool) const;

    std::vector<const Provider*> list() const;

private:
    std::map<protocol::ToolId, std::unique_ptr<Provider>> providers_;
};

// Entry points over the default registry. Both throw core::errors::SetupError
// for a tool without a provider.
protocol::ExecuteResult execute(protocol::ToolId tool, const protocol::ExecuteOptions& options);

std::vector<protocol::UnifiedMessage> load_messages(
    protocol::ToolId tool, const std::string& session_id,
    const std::optional<std::filesystem::path>& project_path = std::nullopt);

}  // namespace agentcli::providers
