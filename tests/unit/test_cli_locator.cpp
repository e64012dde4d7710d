#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "locator/cli_locator.hpp"

namespace {

namespace fs = std::filesystem;
using agentcli::locator::CliLocator;
using agentcli::locator::LocatorConfig;
using agentcli::locator::locator_config_for;
using agentcli::protocol::ToolId;

class CliLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::current_path() / (std::string("__cli_locator_test__") +
                                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        unsetenv(kEnvVar);
        fs::remove_all(root_);
    }

    fs::path touch(const std::string& name) {
        const fs::path path = root_ / name;
        std::ofstream(path) << "#!/bin/sh\n";
        return path;
    }

    LocatorConfig config(const std::string& command) const {
        LocatorConfig cfg;
        cfg.env_var = kEnvVar;
        cfg.command_name = command;
        return cfg;
    }

    static constexpr const char* kEnvVar = "AGENTCLI_LOCATOR_TEST_PATH";
    fs::path root_;
};

TEST_F(CliLocatorTest, EnvironmentOverrideWins) {
    const auto binary = touch("from-env");
    const auto fallback = touch("from-common");
    setenv(kEnvVar, binary.c_str(), 1);

    auto cfg = config("agentcli-no-such-command");
    cfg.common_paths = {fallback};

    const auto found = CliLocator().locate(cfg);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found.value(), binary);
}

TEST_F(CliLocatorTest, MissingOverrideFallsThroughToCommonPaths) {
    const auto fallback = touch("from-common");
    setenv(kEnvVar, (root_ / "missing").c_str(), 1);

    auto cfg = config("agentcli-no-such-command");
    cfg.common_paths = {root_ / "also-missing", fallback};

    const auto found = CliLocator().locate(cfg);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found.value(), fallback);
}

TEST_F(CliLocatorTest, FindsCommandOnPath) {
    const auto found = CliLocator().locate(config("sh"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "sh");
    EXPECT_TRUE(fs::exists(found.value()));
}

TEST_F(CliLocatorTest, ReturnsNulloptWhenNothingMatches) {
    auto cfg = config("agentcli-no-such-command");
    cfg.common_paths = {root_ / "missing"};
    EXPECT_FALSE(CliLocator().locate(cfg).has_value());
}

TEST(LocatorConfigTest, ProviderDefaults) {
    const auto claude = locator_config_for(ToolId::Claude);
    EXPECT_EQ(claude.env_var, "CLAUDE_CLI_PATH");
    EXPECT_EQ(claude.command_name, "claude");
    ASSERT_FALSE(claude.common_paths.empty());
    EXPECT_EQ(claude.common_paths.front().filename(), "claude");
    EXPECT_EQ(claude.common_paths.front().parent_path().filename(), "local");

    const auto codex = locator_config_for(ToolId::Codex);
    EXPECT_EQ(codex.env_var, "CODEX_CLI_PATH");
    EXPECT_EQ(codex.common_paths.back(), fs::path("/usr/bin/codex"));

    EXPECT_EQ(locator_config_for(ToolId::Gemini).command_name, "gemini");
    EXPECT_EQ(locator_config_for(ToolId::Cursor).command_name, "cursor-agent");
}

}  // namespace
