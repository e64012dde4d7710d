#include "providers/provider_registry.hpp"

#include <utility>
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"

namespace agentcli::providers {

namespace {

const Provider& require_provider(const ProviderRegistry& registry, const protocol::ToolId tool) {
    const Provider* provider = registry.get(tool);
    if (provider == nullptr) {
        throw core::errors::SetupError("No provider is available for '" +
                                       protocol::to_string(tool) + "'.");
    }
    return *provider;
}

}  // namespace

ProviderRegistry ProviderRegistry::with_defaults() {
    ProviderRegistry registry;
    registry.register_provider(make_claude_provider());
    registry.register_provider(make_codex_provider());
    registry.register_provider(make_gemini_provider());
    return registry;
}

void ProviderRegistry::register_provider(std::unique_ptr<Provider> provider) {
    if (!provider) {
        return;
    }
    const protocol::ToolId tool = provider->id();
    if (providers_.count(tool) > 0) {
        LOG_DEBUG("Replacing provider for " + protocol::to_string(tool));
    }
    providers_[tool] = std::move(provider);
}

const Provider* ProviderRegistry::get(const protocol::ToolId tool) const {
    const auto it = providers_.find(tool);
    if (it == providers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<const Provider*> ProviderRegistry::list() const {
    std::vector<const Provider*> out;
    out.reserve(providers_.size());
    for (const auto& [tool, provider] : providers_) {
        static_cast<void>(tool);
        out.push_back(provider.get());
    }
    return out;
}

protocol::ExecuteResult execute(const protocol::ToolId tool,
                                const protocol::ExecuteOptions& options) {
    const auto registry = ProviderRegistry::with_defaults();
    return require_provider(registry, tool).execute(options);
}

std::vector<protocol::UnifiedMessage> load_messages(
    const protocol::ToolId tool, const std::string& session_id,
    const std::optional<std::filesystem::path>& project_path) {
    const auto registry = ProviderRegistry::with_defaults();
    return require_provider(registry, tool).load_session(session_id, project_path);
}

}  // namespace agentcli::providers
