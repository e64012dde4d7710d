#include "session/codex_session_loader.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include "core/config/environment.hpp"
#include "core/logging/logger.hpp"

namespace agentcli::session {

namespace fs = std::filesystem;

CodexSessionLoader::CodexSessionLoader(std::optional<fs::path> codex_root)
    : codex_root_(std::move(codex_root)) {}

std::optional<fs::path> CodexSessionLoader::find_session_file(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return std::nullopt;
    }

    const fs::path sessions = codex_root_.value_or(core::config::codex_home()) / "sessions";
    std::error_code ec;
    if (!fs::is_directory(sessions, ec) || ec) {
        LOG_INFO("No codex sessions directory at " + sessions.string());
        return std::nullopt;
    }

    const std::string suffix = "-" + session_id + ".jsonl";
    std::vector<fs::path> matches;
    const auto options = fs::directory_options::skip_permission_denied;
    for (fs::recursive_directory_iterator it(sessions, options, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file(ec) || ec) {
            ec.clear();
            continue;
        }
        const std::string filename = it->path().filename().string();
        if (filename.size() >= suffix.size() &&
            filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0) {
            matches.push_back(it->path());
        }
    }
    if (ec) {
        LOG_WARN("Error while scanning " + sessions.string() + ": " + ec.message());
    }
    if (matches.empty()) {
        return std::nullopt;
    }

    // Ids are unique; sorting only keeps the choice deterministic.
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

std::vector<protocol::UnifiedMessage> CodexSessionLoader::read_session(
    const std::string& session_id, const std::optional<fs::path>& /*project_path*/) const {
    const auto file = find_session_file(session_id);
    if (!file.has_value()) {
        LOG_INFO("No codex transcript for session '" + session_id + "'");
        return {};
    }
    LOG_DEBUG("Found codex transcript " + file->string());
    return read_jsonl_transcript(file.value(), parser_);
}

}  // namespace agentcli::session
