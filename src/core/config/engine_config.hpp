#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include "core/config/environment.hpp"
#include "core/logging/logger.hpp"

namespace agentcli::core::config {

    // Grace period between SIGTERM and SIGKILL
    constexpr std::uint32_t kDefaultKillGraceMs = 5000;

    // Claude runs get a deadline even when the caller sets none
    constexpr std::uint32_t kClaudeDefaultTimeoutMs = 300000;

    inline logging::LogLevel parse_log_level(std::string value,
                                             const logging::LogLevel fallback) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        if (value == "debug") return logging::LogLevel::DEBUG;
        if (value == "info") return logging::LogLevel::INFO;
        if (value == "warn" || value == "warning") return logging::LogLevel::WARN;
        if (value == "error") return logging::LogLevel::ERROR;
        return fallback;
    }

    // Applies AGENTCLI_LOG_LEVEL to the global logger, if set.
    inline void load_log_level_from_env() {
        const auto raw = get_env("AGENTCLI_LOG_LEVEL");
        if (!raw.has_value()) {
            return;
        }
        auto& logger = logging::Logger::get();
        logger.set_level(parse_log_level(raw.value(), logger.level()));
    }

} // namespace agentcli::core::config
