/**
 * @file test_graph_builder.cpp
 * @brief Unit tests for TaskGraphBuilder validation and expansion.
 */

#include "graph/graph_builder.hpp"

#include <gtest/gtest.h>

using namespace agent_orchestrator;

namespace {

TaskSpec make_spec(const std::string& id, std::vector<TaskId> deps = {},
                   Phase phase = Phase::Main) {
    TaskSpec spec;
    spec.id = id;
    spec.phase = phase;
    spec.workspace_path = "../wt/" + id;
    spec.prompt = "prompts/" + id + ".md";
    spec.runner = "codex";
    spec.depends_on = std::move(deps);
    return spec;
}

BuildOptions make_options() {
    BuildOptions options;
    options.run_id = "run42";
    options.project_root = "/proj";
    options.logs_dir = "/proj/logs";
    options.runners["codex"] = RunnerConfig{.name = "codex", .command = "codex {prompt}"};
    return options;
}

}  // namespace

TEST(GraphBuilderTest, BuildsAndExpands) {
    auto spec = make_spec("core");
    spec.branch = "task/{task}-{run_id}";
    spec.workspace_path = "../wt/{phase}/{task}";

    auto graph = TaskGraphBuilder::build({spec}, make_options());
    ASSERT_TRUE(graph.has_value()) << graph.error().message;

    const auto* task = graph->get_task("core");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->branch, "task/core-run42");
    EXPECT_EQ(task->workspace_path, "/wt/main/core");
    EXPECT_EQ(task->prompt, "/proj/prompts/core.md");
    EXPECT_EQ(task->runner, "codex");
    EXPECT_EQ(task->command, "codex {prompt}");
    EXPECT_EQ(task->log_path, "/proj/logs/core.log");
    EXPECT_EQ(task->status, TaskStatus::Pending);
}

TEST(GraphBuilderTest, InlineCommandOverridesRunner) {
    auto spec = make_spec("docs");
    spec.command = "make docs {workspace}";
    auto graph = TaskGraphBuilder::build({spec}, make_options());
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->get_task("docs")->runner, "inline");
    EXPECT_EQ(graph->get_task("docs")->command, "make docs {workspace}");
}

TEST(GraphBuilderTest, SingleRunnerIsDefault) {
    auto spec = make_spec("a");
    spec.runner.clear();
    auto graph = TaskGraphBuilder::build({spec}, make_options());
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->get_task("a")->runner, "codex");
}

TEST(GraphBuilderTest, DuplicateId) {
    auto graph = TaskGraphBuilder::build({make_spec("a"), make_spec("a")}, make_options());
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::Config);
    EXPECT_NE(graph.error().message.find("Duplicate"), std::string::npos);
}

TEST(GraphBuilderTest, UnknownDependency) {
    auto graph = TaskGraphBuilder::build({make_spec("a", {"ghost"})}, make_options());
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::Config);
    EXPECT_NE(graph.error().message.find("ghost"), std::string::npos);
}

TEST(GraphBuilderTest, MissingRequiredFields) {
    auto no_workspace = make_spec("a");
    no_workspace.workspace_path.clear();
    EXPECT_FALSE(TaskGraphBuilder::build({no_workspace}, make_options()).has_value());

    auto no_prompt = make_spec("a");
    no_prompt.prompt.clear();
    EXPECT_FALSE(TaskGraphBuilder::build({no_prompt}, make_options()).has_value());

    auto bad_runner = make_spec("a");
    bad_runner.runner = "gemini";
    EXPECT_FALSE(TaskGraphBuilder::build({bad_runner}, make_options()).has_value());
}

TEST(GraphBuilderTest, UnknownCommandPlaceholder) {
    auto spec = make_spec("a");
    spec.command = "run {model}";
    auto graph = TaskGraphBuilder::build({spec}, make_options());
    ASSERT_FALSE(graph.has_value());
    EXPECT_NE(graph.error().message.find("model"), std::string::npos);
}

TEST(GraphBuilderTest, CycleIsRejected) {
    auto graph = TaskGraphBuilder::build(
        {make_spec("a", {"c"}), make_spec("b", {"a"}), make_spec("c", {"b"})}, make_options());
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::DependencyCycle);
    EXPECT_NE(graph.error().message.find(" -> "), std::string::npos);
}

TEST(GraphBuilderTest, CycleInOtherPhaseStillRejected) {
    auto options = make_options();
    options.phases = {Phase::Main};
    auto graph = TaskGraphBuilder::build(
        {make_spec("m"), make_spec("x", {"y"}, Phase::Post), make_spec("y", {"x"}, Phase::Post)},
        options);
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().kind, ErrorKind::DependencyCycle);
}

TEST(GraphBuilderTest, PhaseSelection) {
    auto options = make_options();
    options.phases = {Phase::Discovery};
    auto graph = TaskGraphBuilder::build(
        {make_spec("d", {}, Phase::Discovery), make_spec("m")}, options);
    ASSERT_TRUE(graph.has_value());
    EXPECT_TRUE(graph->contains("d"));
    EXPECT_FALSE(graph->contains("m"));
}

TEST(GraphBuilderTest, DependencyOnExcludedPhase) {
    auto options = make_options();
    options.phases = {Phase::Main};
    auto graph = TaskGraphBuilder::build(
        {make_spec("d", {}, Phase::Discovery), make_spec("m", {"d"})}, options);
    ASSERT_FALSE(graph.has_value());
    EXPECT_NE(graph.error().message.find("excluded"), std::string::npos);
}

TEST(GraphBuilderTest, DependencyOnManualTask) {
    auto manual = make_spec("gate");
    manual.manual = true;
    auto dependent = make_spec("after", {"gate"});

    EXPECT_FALSE(TaskGraphBuilder::build({manual, dependent}, make_options()).has_value());

    auto options = make_options();
    options.include_manual = true;
    auto graph = TaskGraphBuilder::build({manual, dependent}, options);
    ASSERT_TRUE(graph.has_value());
    EXPECT_EQ(graph->dependencies("after"), std::vector<TaskId>{"gate"});
}

TEST(GraphBuilderTest, PartitionByPhase) {
    auto graph = TaskGraphBuilder::build(
        {make_spec("d", {}, Phase::Discovery), make_spec("m1"), make_spec("m2", {"m1"})},
        make_options());
    ASSERT_TRUE(graph.has_value());
    auto partition = TaskGraphBuilder::partition_by_phase(*graph);
    EXPECT_EQ(partition[Phase::Discovery], std::vector<TaskId>{"d"});
    EXPECT_EQ(partition[Phase::Main], (std::vector<TaskId>{"m1", "m2"}));
}
