#pragma once

#include "parsers/gemini_parser.hpp"
#include "runtime/cli_executor.hpp"

namespace agentcli::runtime {

class GeminiExecutor : public CliExecutor {
public:
    GeminiExecutor();
    explicit GeminiExecutor(locator::LocatorConfig locator_config);

    protocol::ToolId tool() const override { return protocol::ToolId::Gemini; }

    std::vector<std::string> build_args(const protocol::ExecuteOptions& options) const override;

protected:
    const parsers::EventParser& parser() const override { return parser_; }
    std::optional<std::string> session_id_from(
        const std::vector<nlohmann::json>& events) const override;
    std::optional<protocol::TokenUsage> usage_from(
        const std::vector<nlohmann::json>& events) const override;

    // Streamed replies arrive as delta fragments of one message; consecutive
    // fragments are glued back together before the newline join.
    std::string assemble_text(
        const std::vector<protocol::UnifiedMessage>& messages) const override;

private:
    parsers::GeminiParser parser_;
};

}  // namespace agentcli::runtime
