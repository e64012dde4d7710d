#pragma once

#include "parsers/codex_parser.hpp"
#include "session/session_loader.hpp"

namespace agentcli::session {

// Codex keeps one global, date-partitioned archive:
// <codex home>/sessions/YYYY/MM/DD/rollout-<timestamp>-<session id>.jsonl
// The project path plays no part in the lookup.
class CodexSessionLoader : public SessionLoader {
public:
    explicit CodexSessionLoader(std::optional<std::filesystem::path> codex_root = std::nullopt);

    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Codex; }

    std::optional<std::filesystem::path> find_session_file(const std::string& session_id) const;

protected:
    std::vector<protocol::UnifiedMessage> read_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const override;

private:
    std::optional<std::filesystem::path> codex_root_;
    parsers::CodexParser parser_;
};

}  // namespace agentcli::session
