#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "locator/cli_locator.hpp"
#include "parsers/event_parser.hpp"
#include "protocol/execute_contract.hpp"

namespace agentcli::runtime {

// Runs one provider CLI invocation end to end: locate, build argv, spawn,
// stream stdout through the line buffer and the provider parser, then fold
// everything into an ExecuteResult. Subclasses supply the provider-specific
// pieces.
class CliExecutor {
public:
    explicit CliExecutor(locator::LocatorConfig locator_config);
    virtual ~CliExecutor() = default;

    virtual protocol::ToolId tool() const = 0;

    virtual std::vector<std::string> build_args(
        const protocol::ExecuteOptions& options) const = 0;

    // Throws core::errors::SetupError when the binary cannot be found. Every
    // other failure is reported through the result.
    protocol::ExecuteResult execute(const protocol::ExecuteOptions& options) const;

    std::filesystem::path resolve_binary() const;

    const locator::LocatorConfig& locator_config() const { return locator_config_; }

protected:
    virtual const parsers::EventParser& parser() const = 0;

    virtual std::optional<std::uint32_t> default_timeout_ms() const { return std::nullopt; }

    virtual std::optional<std::string> session_id_from(
        const std::vector<nlohmann::json>& events) const = 0;

    // Provider-reported totals; nullopt falls back to summing message usage.
    virtual std::optional<protocol::TokenUsage> usage_from(
        const std::vector<nlohmann::json>& events) const;

    // Text the structured extractor should look at before the assembled text.
    virtual std::optional<std::string> structured_source(
        const std::vector<nlohmann::json>& events) const;

    // Newline-joined text of the non-empty assistant messages.
    virtual std::string assemble_text(
        const std::vector<protocol::UnifiedMessage>& messages) const;

private:
    locator::LocatorConfig locator_config_;
};

// Helpers shared by the provider executors.
const nlohmann::json* find_event(const std::vector<nlohmann::json>& events,
                                 const std::string& type);

std::string join(const std::vector<std::string>& items, const std::string& separator);

std::optional<protocol::TokenUsage> sum_message_usage(
    const std::vector<protocol::UnifiedMessage>& messages);

}  // namespace agentcli::runtime
