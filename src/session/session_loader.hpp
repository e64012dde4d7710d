#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "parsers/event_parser.hpp"
#include "protocol/unified_message.hpp"

namespace agentcli::session {

// Rebuilds a persisted conversation from a provider's on-disk transcript.
// Every call reads the disk again.
class SessionLoader {
public:
    virtual ~SessionLoader() = default;

    virtual protocol::ToolId tool() const noexcept = 0;

    // Oldest message first. Missing sessions, unreadable files and I/O
    // errors all come back as an empty list.
    std::vector<protocol::UnifiedMessage> load(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path = std::nullopt) const noexcept;

protected:
    virtual std::vector<protocol::UnifiedMessage> read_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const = 0;
};

// Parses every line of a JSONL transcript, dropping the ones that are not messages.
std::vector<protocol::UnifiedMessage> read_jsonl_transcript(
    const std::filesystem::path& file, const parsers::EventParser& parser);

// Stable ascending sort on timestamp.
void sort_by_timestamp(std::vector<protocol::UnifiedMessage>& messages);

// Absolute, normalized, without a trailing separator. Defaults to the cwd.
std::filesystem::path resolve_project_path(
    const std::optional<std::filesystem::path>& project_path);

}  // namespace agentcli::session
