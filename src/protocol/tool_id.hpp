#pragma once
#include <optional>
#include <string>

namespace agentcli::protocol {

    // The AI CLI that produced (or will produce) a message
    enum class ToolId {
        Claude,
        Codex,
        Gemini,
        Cursor
    };

    inline std::string to_string(const ToolId tool) {
        switch (tool) {
            case ToolId::Claude:
                return "claude";
            case ToolId::Codex:
                return "codex";
            case ToolId::Gemini:
                return "gemini";
            case ToolId::Cursor:
                return "cursor";
        }
        return "unknown";
    }

    inline std::optional<ToolId> parse_tool_id(const std::string& value) {
        if (value == "claude") return ToolId::Claude;
        if (value == "codex") return ToolId::Codex;
        if (value == "gemini") return ToolId::Gemini;
        if (value == "cursor") return ToolId::Cursor;
        return std::nullopt;
    }

} // namespace agentcli::protocol
