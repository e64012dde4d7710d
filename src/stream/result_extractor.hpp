#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentcli::stream {

// Best-effort recovery of a JSON value from free-form model output. Tries,
// in order: the whole trimmed text, the inside of the first fenced code
// block, then the first balanced {...} or [...] that parses.
std::optional<nlohmann::json> extract_structured(const std::string& text);

}  // namespace agentcli::stream
