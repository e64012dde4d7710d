#include "parsers/event_parser.hpp"

#include <cmath>
#include <limits>
#include "core/logging/logger.hpp"
#include "core/time/timestamp.hpp"

namespace agentcli::parsers {

using nlohmann::json;

std::optional<protocol::UnifiedMessage> EventParser::parse(
    const std::string& raw_line) const noexcept {
    const json event = json::parse(raw_line, nullptr, false);
    if (event.is_discarded()) {
        LOG_DEBUG(protocol::to_string(tool()) + " parser: skipping non-JSON line");
        return std::nullopt;
    }
    return parse_event(event);
}

std::optional<protocol::UnifiedMessage> EventParser::parse_event(
    const json& event) const noexcept {
    if (!event.is_object()) {
        return std::nullopt;
    }
    try {
        return translate(event);
    } catch (const json::exception& e) {
        LOG_DEBUG(protocol::to_string(tool()) + " parser: skipping malformed record: " +
                  e.what());
    } catch (const std::exception& e) {
        LOG_DEBUG(protocol::to_string(tool()) + " parser: skipping record: " + e.what());
    }
    return std::nullopt;
}

namespace fields {

std::string string_or(const json& object, const std::string& key,
                      const std::string& fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::int64_t> optional_int(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::nullopt;
    }
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (std::isnan(value)) {
            return std::nullopt;
        }
        // 2^63 is exactly representable; anything at or past it saturates.
        if (value >= 9223372036854775808.0) {
            return kMax;
        }
        if (value <= static_cast<double>(kMin)) {
            return kMin;
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(kMax)) {
            return kMax;
        }
        return static_cast<std::int64_t>(value);
    }
    return it->get<std::int64_t>();
}

const json& child_or_null(const json& object, const std::string& key) {
    static const json kNull;
    if (!object.is_object()) {
        return kNull;
    }
    const auto it = object.find(key);
    return it == object.end() ? kNull : *it;
}

std::int64_t timestamp_or_now(const json& object, const std::string& key) {
    if (const auto raw = optional_string(object, key)) {
        if (const auto parsed = core::time::parse_iso8601_ms(raw.value())) {
            return parsed.value();
        }
    }
    if (const auto numeric = optional_int(object, key)) {
        return numeric.value();
    }
    return core::time::now_unix_ms();
}

}  // namespace fields

}  // namespace agentcli::parsers
