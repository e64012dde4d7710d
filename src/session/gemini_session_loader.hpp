#pragma once

#include "parsers/gemini_parser.hpp"
#include "session/session_loader.hpp"

namespace agentcli::session {

// Gemini saves whole JSON documents, one per chat:
// <gemini home>/tmp/<sha256 of the absolute project path>/chats/*.json
// An empty session id selects the most recently updated chat.
class GeminiSessionLoader : public SessionLoader {
public:
    explicit GeminiSessionLoader(std::optional<std::filesystem::path> gemini_root = std::nullopt);

    protocol::ToolId tool() const noexcept override { return protocol::ToolId::Gemini; }

    std::filesystem::path chats_directory(
        const std::optional<std::filesystem::path>& project_path) const;

protected:
    std::vector<protocol::UnifiedMessage> read_session(
        const std::string& session_id,
        const std::optional<std::filesystem::path>& project_path) const override;

private:
    std::optional<std::filesystem::path> gemini_root_;
    parsers::GeminiParser parser_;
};

// Lowercase hex SHA-256 of the text.
std::string sha256_hex(const std::string& text);

}  // namespace agentcli::session
