#pragma once

#include "parsers/claude_parser.hpp"
#include "runtime/cli_executor.hpp"

namespace agentcli::runtime {

class ClaudeExecutor : public CliExecutor {
public:
    ClaudeExecutor();
    explicit ClaudeExecutor(locator::LocatorConfig locator_config);

    protocol::ToolId tool() const override { return protocol::ToolId::Claude; }

    // claude -p [--model M] [--resume ID | --session-id ID | --continue]
    //        [--permission-mode MODE] [--output-format stream-json --verbose]
    //        [--allowed-tools a,b] [--disallowed-tools a,b] [-i IMAGE]... PROMPT
    std::vector<std::string> build_args(const protocol::ExecuteOptions& options) const override;

protected:
    const parsers::EventParser& parser() const override { return parser_; }
    std::optional<std::uint32_t> default_timeout_ms() const override;
    std::optional<std::string> session_id_from(
        const std::vector<nlohmann::json>& events) const override;
    std::optional<protocol::TokenUsage> usage_from(
        const std::vector<nlohmann::json>& events) const override;
    std::optional<std::string> structured_source(
        const std::vector<nlohmann::json>& events) const override;

private:
    parsers::ClaudeParser parser_;
};

}  // namespace agentcli::runtime
