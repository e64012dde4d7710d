#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/permission_mode.hpp"
#include "protocol/unified_message.hpp"

namespace agentcli::protocol {

    // Delivered once per complete stdout line that parsed as JSON
    struct EventData {
        const std::string& raw;
        const nlohmann::json& event;
        const std::optional<UnifiedMessage>& message;   // nullopt: not a message
    };

    // Delivered once per stdout chunk, with everything accumulated so far
    struct StdoutData {
        const std::string& raw;
        const std::vector<nlohmann::json>& events;
        const std::vector<UnifiedMessage>& messages;
    };

    struct ExecuteCallbacks {
        std::function<void(const EventData&)> on_event;
        std::function<void(const StdoutData&)> on_stdout;
        std::function<void(const std::string&)> on_stderr;
        std::function<void(const std::string&)> on_error;
        std::function<void(int)> on_close;
    };

    // Everything the caller may ask of one provider invocation.
    struct ExecuteOptions {
        std::string prompt;
        std::optional<std::filesystem::path> working_dir;
        std::optional<std::uint32_t> timeout_ms;
        bool verbose = false;
        bool json = false;                  // run the reply through the structured extractor

        // Session handling. With resume the id names the session to resume;
        // without it the id is assigned to a new session (Claude only).
        std::optional<std::string> session_id;
        bool resume = false;
        bool continue_session = false;

        std::optional<std::string> model;
        std::optional<PermissionMode> permission_mode;
        bool dangerously_skip_permissions = false;
        bool streaming = true;

        std::vector<std::string> allowed_tools;
        std::vector<std::string> disallowed_tools;
        std::vector<std::filesystem::path> images;

        // Merged over the inherited environment of the subprocess
        std::map<std::string, std::string> environment;

        std::shared_ptr<std::atomic_bool> cancel_token;
        ExecuteCallbacks callbacks;
    };

    struct ExecuteResult {
        bool success = false;
        int exit_code = -1;
        std::string session_id = "unknown";
        double duration_ms = 0.0;
        std::vector<UnifiedMessage> messages;
        std::vector<nlohmann::json> events;

        // Assembled assistant text, or the extracted structure in JSON mode
        nlohmann::json data;
        std::string text;

        std::optional<TokenUsage> usage;
        std::optional<std::string> error;
        bool timed_out = false;
        bool cancelled = false;
    };

    nlohmann::json to_json(const ExecuteResult& result);

} // namespace agentcli::protocol
