#include "session/session_loader.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "stream/line_buffer.hpp"

namespace agentcli::session {

namespace fs = std::filesystem;

std::vector<protocol::UnifiedMessage> SessionLoader::load(
    const std::string& session_id,
    const std::optional<fs::path>& project_path) const noexcept {
    const std::string name = protocol::to_string(tool());
    try {
        auto messages = read_session(session_id, project_path);
        sort_by_timestamp(messages);
        LOG_INFO("Loaded " + std::to_string(messages.size()) + " " + name +
                 " message(s) for session '" + session_id + "'");
        return messages;
    } catch (const fs::filesystem_error& e) {
        LOG_WARN(name + " session '" + session_id + "' could not be read: " + e.what());
    } catch (const std::exception& e) {
        LOG_WARN(name + " session '" + session_id + "' failed to load: " + e.what());
    }
    return {};
}

std::vector<protocol::UnifiedMessage> read_jsonl_transcript(const fs::path& file,
                                                            const parsers::EventParser& parser) {
    std::vector<protocol::UnifiedMessage> messages;
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Failed to open transcript: " + file.string());
        return messages;
    }

    std::size_t total_lines = 0;
    stream::LineBuffer lines([&](const std::string& line) {
        ++total_lines;
        if (auto message = parser.parse(line)) {
            messages.push_back(std::move(message.value()));
        }
    });

    char buffer[8192];
    while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
        lines.add(std::string(buffer, static_cast<std::size_t>(in.gcount())));
    }
    lines.flush();

    LOG_DEBUG("Transcript " + file.string() + ": " + std::to_string(total_lines) +
              " line(s), " + std::to_string(messages.size()) + " message(s)");
    return messages;
}

void sort_by_timestamp(std::vector<protocol::UnifiedMessage>& messages) {
    std::stable_sort(messages.begin(), messages.end(),
                     [](const protocol::UnifiedMessage& a, const protocol::UnifiedMessage& b) {
                         return a.timestamp < b.timestamp;
                     });
}

fs::path resolve_project_path(const std::optional<fs::path>& project_path) {
    std::error_code ec;
    fs::path base = project_path.value_or(fs::current_path(ec));
    fs::path absolute = fs::absolute(base, ec);
    if (ec) {
        absolute = base;
    }
    absolute = absolute.lexically_normal();

    std::string text = absolute.string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return fs::path(text);
}

}  // namespace agentcli::session
