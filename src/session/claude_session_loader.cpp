#include "session/claude_session_loader.hpp"

#include <cctype>
#include <system_error>
#include <utility>
#include "core/config/environment.hpp"
#include "core/logging/logger.hpp"

namespace agentcli::session {

namespace fs = std::filesystem;

ClaudeSessionLoader::ClaudeSessionLoader(std::optional<fs::path> claude_root)
    : claude_root_(std::move(claude_root)) {}

std::string encode_project_path(const fs::path& absolute_path) {
    std::string encoded = absolute_path.string();
    for (char& c : encoded) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0) {
            c = '-';
        }
    }
    return encoded;
}

fs::path ClaudeSessionLoader::session_file(const std::string& session_id,
                                           const std::optional<fs::path>& project_path) const {
    const fs::path root = claude_root_.value_or(core::config::claude_home());
    return root / "projects" / encode_project_path(resolve_project_path(project_path)) /
           (session_id + ".jsonl");
}

std::vector<protocol::UnifiedMessage> ClaudeSessionLoader::read_session(
    const std::string& session_id, const std::optional<fs::path>& project_path) const {
    if (session_id.empty()) {
        return {};
    }

    const fs::path file = session_file(session_id, project_path);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec) || ec) {
        LOG_INFO("No claude transcript at " + file.string());
        return {};
    }
    return read_jsonl_transcript(file, parser_);
}

}  // namespace agentcli::session
