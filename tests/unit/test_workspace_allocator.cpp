/**
 * @file test_workspace_allocator.cpp
 * @brief Unit tests for WorkspaceAllocator over MockVcs.
 */

#include "workspace/workspace_allocator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

class WorkspaceAllocatorTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    MockVcs vcs_;
    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<WorkspaceAllocator> allocator_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "ao_test_allocator";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_ / "repo");
        allocator_ = std::make_unique<WorkspaceAllocator>(vcs_, root_ / "repo", logger_);
    }

    void TearDown() override {
        allocator_.reset();
        std::filesystem::remove_all(root_);
    }

    Task make_task(const std::string& id, const std::string& dir) {
        Task task;
        task.id = id;
        task.branch = "task/" + id;
        task.workspace_path = root_ / "wt" / dir;
        return task;
    }
};

TEST_F(WorkspaceAllocatorTest, AllocateCreatesWorktree) {
    auto allocation = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(allocation.has_value()) << allocation.error().message;

    EXPECT_TRUE(std::filesystem::is_directory(allocation->path));
    EXPECT_EQ(allocation->branch, "task/a");
    EXPECT_EQ(allocation->task_id, "a");
    EXPECT_EQ(allocation->base_commit, "mock-base");
    EXPECT_TRUE(allocation->live());
    EXPECT_TRUE(vcs_.has_branch("task/a"));
    EXPECT_TRUE(allocator_->is_live(root_ / "wt" / "a"));
    EXPECT_EQ(allocator_->owner_of(root_ / "wt" / "a"), "a");
}

TEST_F(WorkspaceAllocatorTest, SecondTaskOnSamePathConflicts) {
    ASSERT_TRUE(allocator_->allocate(make_task("a", "shared")).has_value());
    auto second = allocator_->allocate(make_task("b", "shared"));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::WorkspaceConflict);
    EXPECT_EQ(allocator_->live_count(), 1u);
}

TEST_F(WorkspaceAllocatorTest, SameOwnerGetsExistingAllocation) {
    auto first = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(first.has_value());
    auto again = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->generation, first->generation);
    EXPECT_EQ(vcs_.add_count(), 1u);
}

TEST_F(WorkspaceAllocatorTest, EquivalentPathsShareKey) {
    ASSERT_TRUE(allocator_->allocate(make_task("a", "x")).has_value());
    auto task = make_task("b", "x");
    task.workspace_path = root_ / "wt" / "y" / ".." / "x";
    auto second = allocator_->allocate(task);
    EXPECT_FALSE(second.has_value());
}

TEST_F(WorkspaceAllocatorTest, ReleaseRemovesDirectoryKeepsBranch) {
    auto allocation = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(allocation.has_value());
    auto path = allocation->path;

    auto released = allocator_->release(*allocation, ReleaseOutcome::Succeeded);
    ASSERT_TRUE(released.has_value());
    EXPECT_FALSE(allocation->live());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(vcs_.has_branch("task/a"));
    EXPECT_EQ(allocator_->live_count(), 0u);

    // Idempotent
    EXPECT_TRUE(allocator_->release(*allocation, ReleaseOutcome::Succeeded).has_value());
}

TEST_F(WorkspaceAllocatorTest, PathReusableAfterRelease) {
    auto first = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(allocator_->release(*first, ReleaseOutcome::Restart).has_value());

    auto second = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(second.has_value());
    EXPECT_GT(second->generation, first->generation);
}

TEST_F(WorkspaceAllocatorTest, StaleReleaseDoesNotTouchNewerAllocation) {
    auto first = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(first.has_value());
    auto stale = *first;
    ASSERT_TRUE(allocator_->release(*first, ReleaseOutcome::Restart).has_value());
    auto second = allocator_->allocate(make_task("a", "a"));
    ASSERT_TRUE(second.has_value());

    stale.released_at.reset();
    EXPECT_TRUE(allocator_->release(stale, ReleaseOutcome::Failed).has_value());
    EXPECT_TRUE(allocator_->is_live(second->path));
    EXPECT_TRUE(std::filesystem::exists(second->path));
}

TEST_F(WorkspaceAllocatorTest, ExistingNonWorktreeDirectoryConflicts) {
    std::filesystem::create_directories(root_ / "wt" / "dirty");
    std::ofstream(root_ / "wt" / "dirty" / "file.txt") << "user data";

    auto allocation = allocator_->allocate(make_task("a", "dirty"));
    ASSERT_FALSE(allocation.has_value());
    EXPECT_EQ(allocation.error().kind, ErrorKind::WorkspaceConflict);
    EXPECT_TRUE(std::filesystem::exists(root_ / "wt" / "dirty" / "file.txt"));
    EXPECT_EQ(allocator_->live_count(), 0u);
}

TEST_F(WorkspaceAllocatorTest, VcsFailureDropsReservation) {
    vcs_.fail_next_add("branch is checked out elsewhere");
    auto failed = allocator_->allocate(make_task("a", "a"));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind, ErrorKind::WorkspaceConflict);
    EXPECT_NE(failed.error().message.find("checked out"), std::string::npos);
    EXPECT_EQ(allocator_->live_count(), 0u);

    EXPECT_TRUE(allocator_->allocate(make_task("a", "a")).has_value());
}

TEST_F(WorkspaceAllocatorTest, ConcurrentAllocationOfOnePathHasOneWinner) {
    constexpr int kThreads = 8;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            if (allocator_->allocate(make_task("t" + std::to_string(i), "contested"))) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(allocator_->live_count(), 1u);
    EXPECT_EQ(vcs_.worktree_count(), 1u);
}

TEST_F(WorkspaceAllocatorTest, DistinctPathsAllocateInParallel) {
    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&, i] {
            auto id = "t" + std::to_string(i);
            if (allocator_->allocate(make_task(id, id))) ok.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(ok.load(), 6);
    EXPECT_EQ(allocator_->live_allocations().size(), 6u);
}
