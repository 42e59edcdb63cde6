/**
 * @file test_task_graph.cpp
 * @brief Unit tests for TaskGraph.
 * @author Dimitris Kafetzis
 */

#include "graph/task_graph.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace agent_orchestrator;

// ─── Helper ──────────────────────────────────

static Task make_task(const std::string& id, bool manual = false) {
    Task task;
    task.id = id;
    task.branch = "task/" + id;
    task.workspace_path = "/tmp/wt/" + id;
    task.manual = manual;
    return task;
}

static size_t position(const std::vector<TaskId>& order, const TaskId& id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

// ─── Construction ────────────────────────────

TEST(TaskGraphTest, AddTasks) {
    TaskGraph graph;
    EXPECT_EQ(graph.add_task(make_task("a")), "a");
    graph.add_task(make_task("b"));
    EXPECT_EQ(graph.task_count(), 2u);
    EXPECT_TRUE(graph.contains("a"));
    EXPECT_EQ(graph.get_task("missing"), nullptr);
}

TEST(TaskGraphTest, DependencyRecordedOnTask) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_dependency("a", "b");
    graph.add_dependency("a", "b");

    ASSERT_EQ(graph.dependencies("b").size(), 1u);
    EXPECT_EQ(graph.dependents("a"), std::vector<TaskId>{"b"});
    EXPECT_EQ(graph.get_task("b")->depends_on, std::vector<TaskId>{"a"});
}

// ─── Ordering ────────────────────────────────

TEST(TaskGraphTest, TopologicalOrderRespectsEdges) {
    TaskGraph graph;
    for (const auto* id : {"d", "c", "b", "a"}) graph.add_task(make_task(id));
    graph.add_dependency("a", "b");
    graph.add_dependency("a", "c");
    graph.add_dependency("b", "d");
    graph.add_dependency("c", "d");

    auto order = graph.topological_order();
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(position(order, "a"), position(order, "b"));
    EXPECT_LT(position(order, "a"), position(order, "c"));
    EXPECT_LT(position(order, "b"), position(order, "d"));
    EXPECT_LT(position(order, "c"), position(order, "d"));
}

TEST(TaskGraphTest, IndependentTasksKeepDeclarationOrder) {
    TaskGraph graph;
    graph.add_task(make_task("z"));
    graph.add_task(make_task("y"));
    graph.add_task(make_task("x"));
    EXPECT_EQ(graph.topological_order(), (std::vector<TaskId>{"z", "y", "x"}));
}

TEST(TaskGraphTest, FindCycleReportsPath) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_task(make_task("c"));
    graph.add_dependency("a", "b");
    graph.add_dependency("b", "c");
    graph.add_dependency("c", "a");

    auto cycle = graph.find_cycle();
    ASSERT_TRUE(cycle.has_value());
    EXPECT_EQ(cycle->size(), 4u);
    EXPECT_EQ(cycle->front(), cycle->back());
    EXPECT_TRUE(graph.has_cycle());
    EXPECT_LT(graph.topological_order().size(), 3u);
}

TEST(TaskGraphTest, SelfLoopIsCycle) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_dependency("a", "a");
    EXPECT_TRUE(graph.has_cycle());
}

// ─── Ready Set ───────────────────────────────

TEST(TaskGraphTest, ReadyTasksFollowSuccess) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_dependency("a", "b");

    EXPECT_EQ(graph.ready_tasks(false), std::vector<TaskId>{"a"});

    graph.mark_running("a");
    EXPECT_TRUE(graph.ready_tasks(false).empty());

    graph.mark_succeeded("a");
    EXPECT_EQ(graph.ready_tasks(false), std::vector<TaskId>{"b"});
}

TEST(TaskGraphTest, ManualTasksNeedOptIn) {
    TaskGraph graph;
    graph.add_task(make_task("auto"));
    graph.add_task(make_task("manual", true));

    EXPECT_EQ(graph.ready_tasks(false), std::vector<TaskId>{"auto"});
    EXPECT_EQ(graph.ready_tasks(true).size(), 2u);
    EXPECT_EQ(graph.schedulable(false), std::vector<TaskId>{"auto"});
}

TEST(TaskGraphTest, QuiescentIgnoresExcludedManual) {
    TaskGraph graph;
    graph.add_task(make_task("auto"));
    graph.add_task(make_task("manual", true));
    EXPECT_FALSE(graph.is_quiescent(false));

    graph.mark_succeeded("auto");
    EXPECT_TRUE(graph.is_quiescent(false));
    EXPECT_FALSE(graph.is_quiescent(true));
}

// ─── Failure Propagation ─────────────────────

TEST(TaskGraphTest, BlockDependentsTransitively) {
    TaskGraph graph;
    for (const auto* id : {"a", "b", "c", "d"}) graph.add_task(make_task(id));
    graph.add_dependency("a", "b");
    graph.add_dependency("b", "c");

    graph.mark_failed("a", "exit 1");
    auto blocked = graph.block_dependents("a");

    EXPECT_EQ(blocked, (std::vector<TaskId>{"b", "c"}));
    EXPECT_EQ(graph.get_task("b")->status, TaskStatus::Blocked);
    EXPECT_EQ(graph.get_task("c")->reason, "dependency 'b' did not succeed");
    EXPECT_EQ(graph.get_task("d")->status, TaskStatus::Pending);
    EXPECT_EQ(graph.count(TaskStatus::Blocked), 2u);
}

TEST(TaskGraphTest, BlockLeavesTerminalTasksAlone) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_task(make_task("c"));
    graph.add_dependency("a", "c");
    graph.add_dependency("b", "c");

    graph.mark_succeeded("c");
    graph.mark_failed("a", "boom");
    EXPECT_TRUE(graph.block_dependents("a").empty());
    EXPECT_EQ(graph.get_task("c")->status, TaskStatus::Succeeded);
}

TEST(TaskGraphTest, SetPrompt) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.set_prompt("a", "/prompts/small.md");
    EXPECT_EQ(graph.get_task("a")->prompt, "/prompts/small.md");
}
