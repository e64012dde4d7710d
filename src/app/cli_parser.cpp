#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

namespace agentcli::app::cli {

    using namespace agentcli::core::errors;
    using agentcli::protocol::ToolId;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> tool;
        std::optional<std::string> prompt;
        std::optional<std::string> cwd;
        std::optional<std::string> model;
        std::optional<std::string> permission_mode;
        std::optional<std::string> session_id;
        std::optional<std::string> project;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> allowed_tools;
        std::optional<std::string> disallowed_tools;
        std::vector<std::string> images;
        bool resume = false;
        bool continue_session = false;
        bool json = false;
        bool dangerously_skip_permissions = false;
        bool verbose = false;
    };

    const char* kUsage =
        "Usage: agentcli run --tool <claude|codex|gemini> --prompt \"...\" | "
        "agentcli session --tool <t> --session-id <id> | agentcli detect [--tool <t>]";

    std::vector<std::string> split_list(const std::string& value) {
        std::vector<std::string> items;
        std::stringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return items;
    }

    bool flag_allowed(const CommandKind kind, const std::string& flag) {
        switch (kind) {
            case CommandKind::Run:
                return flag != "--project";
            case CommandKind::Session:
                return flag == "--tool" || flag == "--session-id" || flag == "--project" ||
                       flag == "--verbose";
            case CommandKind::Detect:
                return flag == "--tool" || flag == "--verbose";
        }
        return false;
    }

    Result<ToolId> validate_tool(const std::string& value) {
        const auto tool = agentcli::protocol::parse_tool_id(value);
        if (!tool.has_value()) {
            return EngineError{ErrorCategory::Input, "Unknown tool: " + value, "invalid_tool",
                               "Use one of: claude, codex, gemini."};
        }
        return tool.value();
    }

    Result<std::filesystem::path> validate_directory(const std::string& value) {
        std::filesystem::path p(value);
        std::error_code path_ec;
        const bool exists = std::filesystem::exists(p, path_ec);
        if (path_ec || !exists) {
            return EngineError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
        }

        const bool is_dir = std::filesystem::is_directory(p, path_ec);
        if (path_ec || !is_dir) {
            return EngineError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
        }

        std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
        if (path_ec) {
            return EngineError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
        }
        return canonical_path;
    }

    } // namespace

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return EngineError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliCommand command;
        const std::string name = argv[1];
        if (name == "run") {
            command.kind = CommandKind::Run;
        } else if (name == "session") {
            command.kind = CommandKind::Session;
        } else if (name == "detect") {
            command.kind = CommandKind::Detect;
        } else {
            return EngineError{ErrorCategory::Input, "Unknown command: " + name, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            if (!flag_allowed(command.kind, flag)) {
                return EngineError{ErrorCategory::Input, "Unknown argument for '" + name + "': " + flag, "unknown_argument"};
            }

            std::optional<std::string>* slot = nullptr;
            if (flag == "--tool") slot = &raw.tool;
            else if (flag == "--prompt") slot = &raw.prompt;
            else if (flag == "--cwd") slot = &raw.cwd;
            else if (flag == "--model") slot = &raw.model;
            else if (flag == "--permission-mode") slot = &raw.permission_mode;
            else if (flag == "--session-id") slot = &raw.session_id;
            else if (flag == "--project") slot = &raw.project;
            else if (flag == "--timeout-ms") slot = &raw.timeout_ms;
            else if (flag == "--allowed-tools") slot = &raw.allowed_tools;
            else if (flag == "--disallowed-tools") slot = &raw.disallowed_tools;

            if (slot != nullptr) {
                if (i + 1 >= args.size()) {
                    return EngineError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
            } else if (flag == "--image") {
                if (i + 1 >= args.size()) {
                    return EngineError{ErrorCategory::Input, "Missing value for --image", "missing_value"};
                }
                raw.images.push_back(args[++i]);
            } else if (flag == "--resume") {
                raw.resume = true;
            } else if (flag == "--continue") {
                raw.continue_session = true;
            } else if (flag == "--json") {
                raw.json = true;
            } else if (flag == "--dangerously-skip-permissions") {
                raw.dangerously_skip_permissions = true;
            } else if (flag == "--verbose") {
                raw.verbose = true;
            } else {
                return EngineError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        command.options.verbose = raw.verbose;
        if (raw.tool) {
            auto tool = validate_tool(raw.tool.value());
            if (is_error(tool)) {
                return get_error(tool);
            }
            command.tool = get_value(tool);
        } else if (command.kind != CommandKind::Detect) {
            return EngineError{ErrorCategory::Input, "Must provide --tool", "missing_required_flag", kUsage};
        }

        if (command.kind == CommandKind::Detect) {
            return command;
        }

        if (command.kind == CommandKind::Session) {
            if (!raw.session_id || raw.session_id->empty()) {
                return EngineError{ErrorCategory::Input, "Must provide --session-id", "missing_required_flag"};
            }
            command.session_id = raw.session_id.value();
            if (raw.project) {
                command.project_path = std::filesystem::path(raw.project.value());
            }
            return command;
        }

        auto& options = command.options;
        if (!raw.prompt || raw.prompt->empty()) {
            return EngineError{ErrorCategory::Input, "Must provide --prompt", "missing_required_flag", kUsage};
        }
        options.prompt = raw.prompt.value();

        if (raw.resume && raw.continue_session) {
            return EngineError{ErrorCategory::Input, "Cannot provide both --resume and --continue", "conflicting_flags"};
        }
        if (raw.resume && !raw.session_id) {
            return EngineError{ErrorCategory::Input, "--resume requires --session-id", "missing_required_flag"};
        }
        options.session_id = raw.session_id;
        options.resume = raw.resume;
        options.continue_session = raw.continue_session;

        if (raw.permission_mode) {
            const auto mode = agentcli::protocol::parse_permission_mode(raw.permission_mode.value());
            if (!mode.has_value()) {
                return EngineError{ErrorCategory::Input, "Unknown permission mode: " + raw.permission_mode.value(),
                                   "invalid_permission_mode", "Use default, plan, acceptEdits or bypassPermissions."};
            }
            options.permission_mode = mode;
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            std::uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return EngineError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout == 0) {
                return EngineError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be greater than zero."};
            }
            options.timeout_ms = timeout;
        }

        // Path validation
        if (raw.cwd) {
            auto dir = validate_directory(raw.cwd.value());
            if (is_error(dir)) {
                return get_error(dir);
            }
            options.working_dir = get_value(dir);
        }

        if (raw.allowed_tools) options.allowed_tools = split_list(raw.allowed_tools.value());
        if (raw.disallowed_tools) options.disallowed_tools = split_list(raw.disallowed_tools.value());
        for (const auto& image : raw.images) {
            options.images.emplace_back(image);
        }

        options.model = raw.model;
        options.json = raw.json;
        options.dangerously_skip_permissions = raw.dangerously_skip_permissions;
        return command;
    }

} // namespace agentcli::app::cli
