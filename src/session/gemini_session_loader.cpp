#include "session/gemini_session_loader.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/config/environment.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamp.hpp"

namespace agentcli::session {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::optional<json> read_document(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::nullopt;
    }
    return document;
}

std::vector<fs::path> chat_files(const fs::path& directory) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(directory, ec) || ec) {
        return files;
    }
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".json" && it->is_regular_file(ec) && !ec) {
            files.push_back(it->path());
        }
        ec.clear();
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace

std::string sha256_hex(const std::string& text) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (const unsigned char c : digest) {
        stream << std::setw(2) << static_cast<int>(c);
    }
    return stream.str();
}

GeminiSessionLoader::GeminiSessionLoader(std::optional<fs::path> gemini_root)
    : gemini_root_(std::move(gemini_root)) {}

fs::path GeminiSessionLoader::chats_directory(const std::optional<fs::path>& project_path) const {
    const fs::path root = gemini_root_.value_or(core::config::gemini_home());
    return root / "tmp" / sha256_hex(resolve_project_path(project_path).string()) / "chats";
}

std::vector<protocol::UnifiedMessage> GeminiSessionLoader::read_session(
    const std::string& session_id, const std::optional<fs::path>& project_path) const {
    const fs::path directory = chats_directory(project_path);
    const auto files = chat_files(directory);
    if (files.empty()) {
        LOG_INFO("No gemini chats under " + directory.string());
        return {};
    }

    std::optional<json> chosen;
    std::int64_t newest = -1;
    for (const auto& file : files) {
        auto document = read_document(file);
        if (!document.has_value()) {
            LOG_DEBUG("Skipping unreadable gemini chat " + file.string());
            continue;
        }
        if (!session_id.empty()) {
            if (parsers::fields::string_or(document.value(), "sessionId") == session_id) {
                chosen = std::move(document);
                break;
            }
            continue;
        }
        const auto updated = core::time::parse_iso8601_ms(
            parsers::fields::string_or(document.value(), "lastUpdated"));
        if (updated.has_value() && updated.value() > newest) {
            newest = updated.value();
            chosen = std::move(document);
        }
    }

    if (!chosen.has_value()) {
        LOG_INFO("No gemini chat matches session '" + session_id + "'");
        return {};
    }

    const json& records = parsers::fields::child_or_null(chosen.value(), "messages");
    if (!records.is_array()) {
        LOG_WARN("Gemini chat for session '" + session_id + "' has no messages array");
        return {};
    }

    std::vector<protocol::UnifiedMessage> messages;
    messages.reserve(records.size());
    for (const auto& record : records) {
        if (auto message = parser_.parse_record(record)) {
            messages.push_back(std::move(message.value()));
        }
    }
    return messages;
}

}  // namespace agentcli::session
