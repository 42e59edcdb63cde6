/**
 * @file test_handoff.cpp
 * @brief Unit tests for handoff artifact rendering.
 */

#include "escalation/handoff.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace agent_orchestrator;

namespace {

HandoffInput make_input() {
    return HandoffInput{
        .task_id = "core",
        .branch = "task/core",
        .workspace = "/wt/core",
        .previous_runner = "codex",
        .next_runner = "claude-handoff",
        .attempt = 2,
        .reason = "stuck episode",
        .commits = {"Add parser", "Scaffold module"},
        .log_tail = {"error: cannot resolve symbol"},
        .diff_stat = " 3 files changed, 40 insertions(+)",
    };
}

}  // namespace

TEST(HandoffTest, PathUnderLogsDir) {
    EXPECT_EQ(handoff_path("/logs", "core"), std::filesystem::path{"/logs/handoff/core.md"});
}

TEST(HandoffTest, RenderIncludesAllSections) {
    auto md = render_handoff(make_input(), std::chrono::system_clock::from_time_t(0));
    EXPECT_NE(md.find("# Handoff: core"), std::string::npos);
    EXPECT_NE(md.find("- Branch: `task/core`"), std::string::npos);
    EXPECT_NE(md.find("- Next worker: claude-handoff"), std::string::npos);
    EXPECT_NE(md.find("- Add parser"), std::string::npos);
    EXPECT_NE(md.find("error: cannot resolve symbol"), std::string::npos);
    EXPECT_NE(md.find("3 files changed"), std::string::npos);
    EXPECT_NE(md.find("1970-01-01T00:00:00.000Z"), std::string::npos);
}

TEST(HandoffTest, RenderEmptyState) {
    HandoffInput input;
    input.task_id = "x";
    auto md = render_handoff(input, std::chrono::system_clock::now());
    EXPECT_NE(md.find("No commits on the task branch yet"), std::string::npos);
    EXPECT_NE(md.find("The worker produced no output"), std::string::npos);
}

TEST(HandoffTest, WriteReplacesEarlierHandoff) {
    auto dir = std::filesystem::temp_directory_path() / "ao_test_handoff";
    std::filesystem::remove_all(dir);

    auto input = make_input();
    ASSERT_TRUE(write_handoff(dir, input).has_value());
    input.reason = "second reassignment";
    auto path = write_handoff(dir, input);
    ASSERT_TRUE(path.has_value()) << path.error().message;

    std::ifstream in(*path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    EXPECT_NE(buffer.str().find("second reassignment"), std::string::npos);
    EXPECT_EQ(buffer.str().find("- Reason: stuck episode"), std::string::npos);
    std::filesystem::remove_all(dir);
}
