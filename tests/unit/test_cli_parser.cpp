#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/engine_errors.hpp"

namespace {

using agentcli::app::cli::CliCommand;
using agentcli::app::cli::CommandKind;
using agentcli::app::cli::parse_and_validate;
using agentcli::core::errors::ErrorCategory;
using agentcli::core::errors::get_error;
using agentcli::core::errors::get_value;
using agentcli::core::errors::is_error;
using agentcli::protocol::PermissionMode;
using agentcli::protocol::ToolId;

agentcli::core::errors::Result<CliCommand> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("agentcli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenToolMissingOrUnknown) {
    auto missing = parse_tokens({"run", "--prompt", "hi"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto unknown = parse_tokens({"run", "--tool", "copilot", "--prompt", "hi"});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "invalid_tool");
}

TEST(CliParserTest, FailsWhenPromptMissing) {
    auto result = parse_tokens({"run", "--tool", "claude"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--tool", "claude", "--prompt"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"run", "--tool", "codex", "--prompt", "x", "--timeout-ms", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");

    auto zero = parse_tokens({"run", "--tool", "codex", "--prompt", "x", "--timeout-ms", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenPermissionModeUnknown) {
    auto result = parse_tokens({"run", "--tool", "claude", "--prompt", "x", "--permission-mode", "yolo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_permission_mode");
}

TEST(CliParserTest, FailsWhenResumeAndContinueConflict) {
    auto result = parse_tokens({"run", "--tool", "claude", "--prompt", "x", "--session-id", "s",
                                "--resume", "--continue"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");

    auto no_id = parse_tokens({"run", "--tool", "claude", "--prompt", "x", "--resume"});
    ASSERT_TRUE(is_error(no_id));
    EXPECT_EQ(get_error(no_id).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenCwdInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens(
        {"run", "--tool", "gemini", "--prompt", "x", "--cwd", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesFullRunRequest) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"run", "--tool", "claude", "--prompt", "2+2", "--cwd", cwd.string(),
                                "--model", "sonnet", "--permission-mode", "plan",
                                "--session-id", "s-1", "--resume", "--json",
                                "--timeout-ms", "60000", "--allowed-tools", "Read,Grep",
                                "--disallowed-tools", "Bash", "--image", "a.png",
                                "--image", "b.png", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& command = get_value(result);
    EXPECT_EQ(command.kind, CommandKind::Run);
    EXPECT_EQ(command.tool, ToolId::Claude);

    const auto& options = command.options;
    EXPECT_EQ(options.prompt, "2+2");
    EXPECT_EQ(options.working_dir, std::filesystem::canonical(cwd));
    EXPECT_EQ(options.model, "sonnet");
    EXPECT_EQ(options.permission_mode, PermissionMode::Plan);
    EXPECT_EQ(options.session_id, "s-1");
    EXPECT_TRUE(options.resume);
    EXPECT_TRUE(options.json);
    EXPECT_EQ(options.timeout_ms, 60000u);
    EXPECT_EQ(options.allowed_tools, (std::vector<std::string>{"Read", "Grep"}));
    EXPECT_EQ(options.disallowed_tools, (std::vector<std::string>{"Bash"}));
    ASSERT_EQ(options.images.size(), 2u);
    EXPECT_EQ(options.images[1], std::filesystem::path("b.png"));
    EXPECT_TRUE(options.verbose);
}

TEST(CliParserTest, ParsesSessionCommand) {
    auto result = parse_tokens({"session", "--tool", "codex", "--session-id", "abc",
                                "--project", "/srv/app"});
    ASSERT_FALSE(is_error(result));
    const auto& command = get_value(result);
    EXPECT_EQ(command.kind, CommandKind::Session);
    EXPECT_EQ(command.tool, ToolId::Codex);
    EXPECT_EQ(command.session_id, "abc");
    EXPECT_EQ(command.project_path, std::filesystem::path("/srv/app"));

    auto missing = parse_tokens({"session", "--tool", "codex"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");
}

TEST(CliParserTest, RejectsRunFlagsOnOtherCommands) {
    auto result = parse_tokens({"session", "--tool", "codex", "--session-id", "abc", "--prompt", "x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, DetectToolIsOptional) {
    auto all = parse_tokens({"detect"});
    ASSERT_FALSE(is_error(all));
    EXPECT_EQ(get_value(all).kind, CommandKind::Detect);
    EXPECT_FALSE(get_value(all).tool.has_value());

    auto one = parse_tokens({"detect", "--tool", "gemini"});
    ASSERT_FALSE(is_error(one));
    EXPECT_EQ(get_value(one).tool, ToolId::Gemini);
}

}  // namespace
