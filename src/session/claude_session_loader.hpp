#pragma once

#include "parsers/claude_parser.hpp"
#include "session/session_loader.hpp"

namespace agentcli::session {

// <claude home>/projects/<encoded project path>/<session id>.jsonl
class ClaudeSessionLoader : public SessionLoader {
public:
    // Without a root, CLAUDE_CONFIG_DIR or ~/.claude is used at load time.
    explicit ClaudeSessionLoader(std::optional<std::filesystem::path> claude_root = std::nullopt);

    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Claude; }

    std::filesystem::path session_file(const std::string& session_id,
                                       const std::optional<std::filesystem::path>& project_path) const;

protected:
    std::vector<protocol::UnifiedMessage> read_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const override;

private:
    std::optional<std::filesystem::path> claude_root_;
    parsers::ClaudeParser parser_;
};

// "/home/me/my.app" -> "-home-me-my-app"
std::string encode_project_path(const std::filesystem::path& absolute_path);

}  // namespace agentcli::session
