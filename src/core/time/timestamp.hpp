#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace agentcli::core::time {

std::int64_t now_unix_ms();

// Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]" (date-only accepted)
// into epoch milliseconds. Missing zone means UTC.
std::optional<std::int64_t> parse_iso8601_ms(const std::string& text);

}  // namespace agentcli::core::time
