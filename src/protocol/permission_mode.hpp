#pragma once
#include <optional>
#include <string>

namespace agentcli::protocol {

    // Provider-agnostic approval level. Each executor maps it onto its own
    // flag vocabulary; none of them verify what the provider does with it.
    enum class PermissionMode {
        Default,
        Plan,               // provider is told to stay read-only
        AcceptEdits,
        BypassPermissions
    };

    inline std::string to_string(const PermissionMode mode) {
        switch (mode) {
            case PermissionMode::Default:
                return "default";
            case PermissionMode::Plan:
                return "plan";
            case PermissionMode::AcceptEdits:
                return "acceptEdits";
            case PermissionMode::BypassPermissions:
                return "bypassPermissions";
        }
        return "default";
    }

    inline std::optional<PermissionMode> parse_permission_mode(const std::string& value) {
        if (value == "default") return PermissionMode::Default;
        if (value == "plan") return PermissionMode::Plan;
        if (value == "acceptEdits") return PermissionMode::AcceptEdits;
        if (value == "bypassPermissions") return PermissionMode::BypassPermissions;
        return std::nullopt;
    }

} // namespace agentcli::protocol
