/**
 * @file test_phase_lock.cpp
 * @brief Unit tests for phase lock files.
 */

#include "telemetry/phase_lock.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace agent_orchestrator;

class PhaseLockTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ao_test_phase_lock";
        std::filesystem::remove_all(dir_);
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }
};

TEST_F(PhaseLockTest, LockPaths) {
    EXPECT_EQ(lock_path("/logs", Phase::Main), std::filesystem::path{"/logs/framework-run.lock"});
    EXPECT_EQ(lock_path("/logs", Phase::Discovery),
              std::filesystem::path{"/logs/framework-run-discovery.lock"});
}

TEST_F(PhaseLockTest, AcquireWritesHolder) {
    auto lock = PhaseLock::acquire(dir_, Phase::Main, "run1");
    ASSERT_TRUE(lock.has_value()) << lock.error().message;
    EXPECT_TRUE(lock->held());
    EXPECT_TRUE(std::filesystem::exists(lock_path(dir_, Phase::Main)));

    auto info = PhaseLock::inspect(dir_, Phase::Main);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->holder_run_id, "run1");
    EXPECT_EQ(info->phase, Phase::Main);
}

TEST_F(PhaseLockTest, SecondAcquireFails) {
    auto first = PhaseLock::acquire(dir_, Phase::Main, "run1");
    ASSERT_TRUE(first.has_value());

    auto second = PhaseLock::acquire(dir_, Phase::Main, "run2");
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, ErrorKind::PhaseLockHeld);
    EXPECT_NE(second.error().message.find("run1"), std::string::npos);

    // A different phase is independent
    EXPECT_TRUE(PhaseLock::acquire(dir_, Phase::Discovery, "run2").has_value());
}

TEST_F(PhaseLockTest, ReleaseIsIdempotentAndFreesPhase) {
    auto lock = PhaseLock::acquire(dir_, Phase::Main, "run1");
    ASSERT_TRUE(lock.has_value());
    ASSERT_TRUE(lock->release().has_value());
    EXPECT_FALSE(lock->held());
    EXPECT_TRUE(lock->release().has_value());
    EXPECT_FALSE(std::filesystem::exists(lock_path(dir_, Phase::Main)));
    EXPECT_TRUE(PhaseLock::acquire(dir_, Phase::Main, "run2").has_value());
}

TEST_F(PhaseLockTest, DestructorReleases) {
    {
        auto lock = PhaseLock::acquire(dir_, Phase::Post, "run1");
        ASSERT_TRUE(lock.has_value());
    }
    EXPECT_FALSE(std::filesystem::exists(lock_path(dir_, Phase::Post)));
}

TEST_F(PhaseLockTest, MoveTransfersOwnership) {
    auto acquired = PhaseLock::acquire(dir_, Phase::Main, "run1");
    ASSERT_TRUE(acquired.has_value());
    std::vector<PhaseLock> locks;
    locks.push_back(std::move(*acquired));
    EXPECT_FALSE(acquired->held());
    EXPECT_TRUE(locks.back().held());
    EXPECT_TRUE(std::filesystem::exists(lock_path(dir_, Phase::Main)));
    locks.clear();
    EXPECT_FALSE(std::filesystem::exists(lock_path(dir_, Phase::Main)));
}

TEST_F(PhaseLockTest, EnsureClear) {
    EXPECT_TRUE(PhaseLock::ensure_clear(dir_, Phase::Main).has_value());
    auto lock = PhaseLock::acquire(dir_, Phase::Main, "run1");
    ASSERT_TRUE(lock.has_value());
    auto check = PhaseLock::ensure_clear(dir_, Phase::Main);
    ASSERT_FALSE(check.has_value());
    EXPECT_EQ(check.error().kind, ErrorKind::PhaseLockHeld);
    EXPECT_FALSE(std::filesystem::exists(lock_path(dir_, Phase::Discovery)));
}

TEST_F(PhaseLockTest, ConcurrentAcquireHasOneWinner) {
    std::atomic<int> winners{0};
    std::vector<PhaseLock> held(8);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            auto lock = PhaseLock::acquire(dir_, Phase::Main, "run" + std::to_string(i));
            if (lock) {
                winners.fetch_add(1);
                held[static_cast<size_t>(i)] = std::move(*lock);
            }
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(PhaseLockTest, InspectMissing) {
    EXPECT_FALSE(PhaseLock::inspect(dir_, Phase::Legacy).has_value());
}
