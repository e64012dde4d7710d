#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/tool_id.hpp"
#include "protocol/unified_message.hpp"

namespace agentcli::parsers {

// Maps one provider record onto a UnifiedMessage. Records that are not
// messages, or that are malformed, come back as nullopt; nothing throws.
class EventParser {
public:
    virtual ~EventParser() = default;

    virtual protocol::ToolId tool() const noexcept = 0;

    // One raw stdout / JSONL line.
    std::optional<protocol::UnifiedMessage> parse(const std::string& raw_line) const noexcept;

    // A record that has already been decoded.
    std::optional<protocol::UnifiedMessage> parse_event(const nlohmann::json& event) const noexcept;

protected:
    // May throw nlohmann::json exceptions on unexpected field types;
    // parse_event turns those into a skip.
    virtual std::optional<protocol::UnifiedMessage> translate(
        const nlohmann::json& event) const = 0;
};

namespace fields {

// Lenient field readers. Absent keys and wrong types read as the fallback.
std::string string_or(const nlohmann::json& object, const std::string& key,
                      const std::string& fallback = "");

std::optional<std::string> optional_string(const nlohmann::json& object,
                                           const std::string& key);

std::optional<std::int64_t> optional_int(const nlohmann::json& object,
                                         const std::string& key);

const nlohmann::json& child_or_null(const nlohmann::json& object, const std::string& key);

// ISO-8601 string under key, else the current time.
std::int64_t timestamp_or_now(const nlohmann::json& object, const std::string& key);

}  // namespace fields

}  // namespace agentcli::parsers
