#pragma once

#include "parsers/codex_parser.hpp"
#include "runtime/cli_executor.hpp"

namespace agentcli::runtime {

class CodexExecutor : public CliExecutor {
public:
    CodexExecutor();
    explicit CodexExecutor(locator::LocatorConfig locator_config);

    protocol::ToolId tool() const override { return protocol::ToolId::Codex; }

    // Flags must precede the `resume` subcommand; the prompt goes last.
    std::vector<std::string> build_args(const protocol::ExecuteOptions& options) const override;

protected:
    const parsers::EventParser& parser() const override { return parser_; }
    std::optional<std::string> session_id_from(
        const std::vector<nlohmann::json>& events) const override;
    std::optional<protocol::TokenUsage> usage_from(
        const std::vector<nlohmann::json>& events) const override;

private:
    parsers::CodexParser parser_;
};

}  // namespace agentcli::runtime
