#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "parsers/event_parser.hpp"
#include "protocol/execute_contract.hpp"
#include "providers/capabilities.hpp"
#include "runtime/cli_executor.hpp"
#include "session/session_loader.hpp"

namespace agentcli::providers {

// Everything the engine can do with one AI CLI.
class Provider {
public:
    virtual ~Provider() = default;

    virtual protocol::ToolId id() const = 0;

    virtual std::optional<std::filesystem::path> resolve() const = 0;

    // Throws core::errors::SetupError when the CLI is not installed.
    virtual protocol::ExecuteResult execute(const protocol::ExecuteOptions& options) const = 0;

    virtual std::optional<protocol::UnifiedMessage> parse(const std::string& raw_line) const = 0;

    virtual std::vector<protocol::UnifiedMessage> load_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const = 0;

    virtual AgentCapabilities capabilities() const = 0;
};

// A provider assembled from its executor, parser and session loader.
class CliProvider : public Provider {
public:
    CliProvider(std::unique_ptr<runtime::CliExecutor> executor,
                std::unique_ptr<parsers::EventParser> parser,
                std::unique_ptr<session::SessionLoader> loader);

    protocol::ToolId id() const override;
    std::optional<std::filesystem::path> resolve() const override;
    protocol::ExecuteResult execute(const protocol::ExecuteOptions& options) const override;
    std::optional<protocol::UnifiedMessage> parse(const std::string& raw_line) const override;
    std::vector<protocol::UnifiedMessage> load_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const override;
    AgentCapabilities capabilities() const override;

private:
    std::unique_ptr<runtime::CliExecutor> executor_;
    std::unique_ptr<parsers::EventParser> parser_;
    std::unique_ptr<session::SessionLoader> loader_;
};

std::unique_ptr<Provider> make_claude_provider();
std::unique_ptr<Provider> make_codex_provider();
std::unique_ptr<Provider> make_gemini_provider();

}  // namespace agentcli::providers
