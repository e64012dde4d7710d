#include "core/config/environment.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace agentcli::core::config {

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path home_directory() {
    if (auto home = get_env("HOME")) {
        return std::filesystem::path(*home);
    }

    const passwd* entry = getpwuid(getuid());
    if (entry != nullptr && entry->pw_dir != nullptr) {
        return std::filesystem::path(entry->pw_dir);
    }
    return std::filesystem::path("/");
}

std::filesystem::path claude_home() {
    if (auto dir = get_env("CLAUDE_CONFIG_DIR")) {
        return std::filesystem::path(*dir);
    }
    return home_directory() / ".claude";
}

std::filesystem::path codex_home() {
    if (auto dir = get_env("CODEX_HOME")) {
        return std::filesystem::path(*dir);
    }
    return home_directory() / ".codex";
}

std::filesystem::path gemini_home() {
    if (auto dir = get_env("GEMINI_DIR")) {
        return std::filesystem::path(*dir);
    }
    return home_directory() / ".gemini";
}

}  // namespace agentcli::core::config
