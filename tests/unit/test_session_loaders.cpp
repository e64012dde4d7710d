#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "session/claude_session_loader.hpp"
#include "session/codex_session_loader.hpp"
#include "session/gemini_session_loader.hpp"

namespace {

namespace fs = std::filesystem;
using namespace agentcli::session;
using agentcli::protocol::Role;
using agentcli::protocol::ToolId;
using agentcli::protocol::extract_text_content;

class SessionLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::current_path() / (std::string("__session_loader_test__") +
                                        ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
        project_ = root_ / "work" / "my.app";
        fs::create_directories(project_);
    }

    void TearDown() override { fs::remove_all(root_); }

    static void write(const fs::path& file, const std::string& content) {
        fs::create_directories(file.parent_path());
        std::ofstream(file) << content;
    }

    fs::path root_;
    fs::path project_;
};

TEST(SessionPathTest, EncodesProjectPathForClaude) {
    EXPECT_EQ(encode_project_path("/home/me/my.app"), "-home-me-my-app");
    EXPECT_EQ(encode_project_path("/a_b/c d"), "-a-b-c-d");
}

TEST(SessionPathTest, ResolvesProjectPathWithoutTrailingSlash) {
    EXPECT_EQ(resolve_project_path(fs::path("/tmp/x/../y/")), fs::path("/tmp/y"));
    EXPECT_EQ(resolve_project_path(fs::path("/")), fs::path("/"));
}

TEST(SessionPathTest, Sha256MatchesKnownDigest) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(SessionLoaderTest, ClaudeTranscriptIsSortedByTimestamp) {
    const fs::path claude_root = root_ / "claude";
    ClaudeSessionLoader loader(claude_root);
    const auto file = loader.session_file("sess-1", project_);
    EXPECT_EQ(file.parent_path().filename(), encode_project_path(resolve_project_path(project_)));

    write(file,
          R"({"type":"assistant","uuid":"b","timestamp":"2024-01-01T00:00:02.000Z","message":{"role":"assistant","content":[{"type":"text","text":"second"}]}})"
          "\n"
          R"({"type":"summary","summary":"ignored"})"
          "\n"
          "not json at all\n"
          R"({"type":"user","uuid":"a","timestamp":"2024-01-01T00:00:01.000Z","message":{"role":"user","content":"first"}})"
          "\n");

    const auto messages = loader.load("sess-1", project_);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id, "a");
    EXPECT_EQ(messages[0].role, Role::User);
    EXPECT_EQ(messages[1].id, "b");
    EXPECT_EQ(extract_text_content(messages[1]), "second");
}

TEST_F(SessionLoaderTest, ClaudeMissingSessionIsEmpty) {
    ClaudeSessionLoader loader(root_ / "claude");
    EXPECT_TRUE(loader.load("does-not-exist", project_).empty());
    EXPECT_TRUE(loader.load("", project_).empty());
}

TEST_F(SessionLoaderTest, CodexFindsRolloutAcrossDatePartitions) {
    const fs::path codex_root = root_ / "codex";
    write(codex_root / "sessions" / "2024" / "01" / "02" /
              "rollout-2024-01-02T10-00-00-0199abcd-0000-7000-8000-000000000001.jsonl",
          R"({"timestamp":"2024-01-02T10:00:00.000Z","type":"session_meta","payload":{"id":"x"}})"
          "\n"
          R"({"timestamp":"2024-01-02T10:00:03.000Z","type":"response_item","payload":{"type":"function_call_output","call_id":"call_1","output":"{\"output\":\"ok\",\"metadata\":{\"exit_code\":0}}"}})"
          "\n"
          R"({"timestamp":"2024-01-02T10:00:02.000Z","type":"response_item","payload":{"type":"function_call","name":"shell","call_id":"call_1","arguments":"{\"command\":[\"bash\",\"-lc\",\"ls\"]}"}})"
          "\n"
          R"({"timestamp":"2024-01-02T10:00:01.000Z","type":"event_msg","payload":{"type":"user_message","message":"list files"}})"
          "\n");
    write(codex_root / "sessions" / "2024" / "01" / "03" / "rollout-other-session.jsonl", "{}\n");

    CodexSessionLoader loader(codex_root);
    const auto found = loader.find_session_file("0199abcd-0000-7000-8000-000000000001");
    ASSERT_TRUE(found.has_value());

    const auto messages = loader.load("0199abcd-0000-7000-8000-000000000001");
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].role, Role::User);
    EXPECT_EQ(messages[1].tool, ToolId::Codex);
    EXPECT_EQ(messages[1].id, "call_1");
    EXPECT_LT(messages[1].timestamp, messages[2].timestamp);
}

TEST_F(SessionLoaderTest, CodexMissingSessionIsEmpty) {
    CodexSessionLoader loader(root_ / "codex");
    EXPECT_TRUE(loader.load("nope").empty());
    EXPECT_FALSE(loader.find_session_file("").has_value());
}

TEST_F(SessionLoaderTest, GeminiSelectsChatBySessionId) {
    const fs::path gemini_root = root_ / "gemini";
    GeminiSessionLoader loader(gemini_root);
    const fs::path chats = loader.chats_directory(project_);
    EXPECT_EQ(chats.parent_path().filename().string().size(), 64u);

    write(chats / "session-a.json", R"({
        "sessionId": "gem-a", "lastUpdated": "2024-01-01T00:00:10.000Z",
        "messages": [
            {"id": "2", "type": "gemini", "timestamp": "2024-01-01T00:00:02.000Z", "content": "4"},
            {"id": "1", "type": "user", "timestamp": "2024-01-01T00:00:01.000Z", "content": "2+2?"}
        ]})");
    write(chats / "session-b.json", R"({
        "sessionId": "gem-b", "lastUpdated": "2024-01-02T00:00:00.000Z",
        "messages": [{"id": "x", "type": "user", "timestamp": "2024-01-02T00:00:00.000Z", "content": "later"}]})");
    write(chats / "broken.json", "{ not json");

    const auto messages = loader.load("gem-a", project_);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].id, "1");
    EXPECT_EQ(messages[0].role, Role::User);
    EXPECT_EQ(messages[1].role, Role::Assistant);
    EXPECT_EQ(extract_text_content(messages[1]), "4");

    const auto latest = loader.load("", project_);
    ASSERT_EQ(latest.size(), 1u);
    EXPECT_EQ(latest[0].id, "x");
}

TEST_F(SessionLoaderTest, GeminiMissingSessionIsEmpty) {
    GeminiSessionLoader loader(root_ / "gemini");
    EXPECT_TRUE(loader.load("gem-a", project_).empty());
}

}  // namespace
