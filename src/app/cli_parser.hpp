#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/engine_errors.hpp"
#include "protocol/execute_contract.hpp"
#include "protocol/tool_id.hpp"

namespace agentcli::app::cli {

    enum class CommandKind {
        Run,
        Session,
        Detect
    };

    // A validated command line. Only the fields of the chosen command are set.
    struct CliCommand {
        CommandKind kind = CommandKind::Run;
        std::optional<agentcli::protocol::ToolId> tool;   // detect: nullopt means every tool

        // run
        agentcli::protocol::ExecuteOptions options;

        // session
        std::string session_id;
        std::optional<std::filesystem::path> project_path;
    };

    agentcli::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);

} // namespace agentcli::app::cli
