#include "providers/provider.hpp"

#include <utility>
#include "parsers/claude_parser.hpp"
#include "parsers/codex_parser.hpp"
#include "parsers/gemini_parser.hpp"
#include "runtime/claude_executor.hpp"
#include "runtime/codex_executor.hpp"
#include "runtime/gemini_executor.hpp"
#include "session/claude_session_loader.hpp"
#include "session/codex_session_loader.hpp"
#include "session/gemini_session_loader.hpp"

namespace agentcli::providers {

CliProvider::CliProvider(std::unique_ptr<runtime::CliExecutor> executor,
                         std::unique_ptr<parsers::EventParser> parser,
                         std::unique_ptr<session::SessionLoader> loader)
    : executor_(std::move(executor)), parser_(std::move(parser)), loader_(std::move(loader)) {}

protocol::ToolId CliProvider::id() const { return executor_->tool(); }

std::optional<std::filesystem::path> CliProvider::resolve() const {
    const locator::CliLocator locator;
    return locator.locate(executor_->locator_config());
}

protocol::ExecuteResult CliProvider::execute(const protocol::ExecuteOptions& options) const {
    return executor_->execute(options);
}

std::optional<protocol::UnifiedMessage> CliProvider::parse(const std::string& raw_line) const {
    return parser_->parse(raw_line);
}

std::vector<protocol::UnifiedMessage> CliProvider::load_session(
    const std::string& session_id,
    const std::optional<std::filesystem::path>& project_path) const {
    return loader_->load(session_id, project_path);
}

AgentCapabilities CliProvider::capabilities() const {
    AgentCapabilities caps = static_capabilities(id());
    caps.cli_path = resolve();
    caps.installed = caps.cli_path.has_value();
    return caps;
}

std::unique_ptr<Provider> make_claude_provider() {
    return std::make_unique<CliProvider>(std::make_unique<runtime::ClaudeExecutor>(),
                                         std::make_unique<parsers::ClaudeParser>(),
                                         std::make_unique<session::ClaudeSessionLoader>());
}

std::unique_ptr<Provider> make_codex_provider() {
    return std::make_unique<CliProvider>(std::make_unique<runtime::CodexExecutor>(),
                                         std::make_unique<parsers::CodexParser>(),
                                         std::make_unique<session::CodexSessionLoader>());
}

std::unique_ptr<Provider> make_gemini_provider() {
    return std::make_unique<CliProvider>(std::make_unique<runtime::GeminiExecutor>(),
                                         std::make_unique<parsers::GeminiParser>(),
                                         std::make_unique<session::GeminiSessionLoader>());
}

}  // namespace agentcli::providers
