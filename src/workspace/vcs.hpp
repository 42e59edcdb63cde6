/**
 * @file vcs.hpp
 * @brief Version-control backend interface: worktrees, branches, commits.
 * @author Dimitris Kafetzis
 *
 * Provides GitVcs (shells out to git) and MockVcs (in-memory branches over
 * real directories, for testing).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// IVcsBackend (Virtual, runtime-configurable)
// ─────────────────────────────────────────────

class IVcsBackend {
public:
    virtual ~IVcsBackend() = default;

    [[nodiscard]] virtual bool available() const = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Commit the repository currently has checked out.
    virtual Result<std::string> head_commit(const std::filesystem::path& repo_root) = 0;

    /// Create `branch` from HEAD (or reuse it if it exists) checked out at `worktree`.
    virtual Result<void> add_worktree(const std::filesystem::path& repo_root,
                                      const std::filesystem::path& worktree,
                                      const std::string& branch) = 0;

    /// Remove the working directory; the branch is kept.
    virtual Result<void> remove_worktree(const std::filesystem::path& repo_root,
                                         const std::filesystem::path& worktree) = 0;

    [[nodiscard]] virtual bool is_worktree(const std::filesystem::path& repo_root,
                                           const std::filesystem::path& path) = 0;

    /// Time of the newest commit on `branch`.
    virtual std::optional<Timestamp> last_commit_time(const std::filesystem::path& repo_root,
                                                      const std::string& branch) = 0;

    /// Subjects of commits on `branch` that are not reachable from `base`, newest first.
    virtual std::vector<std::string> commit_subjects(const std::filesystem::path& repo_root,
                                                     const std::string& branch,
                                                     const std::string& base) = 0;

    /// Diffstat of the working directory against `base`.
    virtual std::string diff_stat(const std::filesystem::path& worktree,
                                  const std::string& base) = 0;
};

// ─────────────────────────────────────────────
// GitVcs
// ─────────────────────────────────────────────

class GitVcs : public IVcsBackend {
public:
    explicit GitVcs(std::string git_binary = "git");

    [[nodiscard]] bool available() const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "git"; }

    Result<std::string> head_commit(const std::filesystem::path& repo_root) override;
    Result<void> add_worktree(const std::filesystem::path& repo_root,
                              const std::filesystem::path& worktree,
                              const std::string& branch) override;
    Result<void> remove_worktree(const std::filesystem::path& repo_root,
                                 const std::filesystem::path& worktree) override;
    bool is_worktree(const std::filesystem::path& repo_root,
                     const std::filesystem::path& path) override;
    std::optional<Timestamp> last_commit_time(const std::filesystem::path& repo_root,
                                              const std::string& branch) override;
    std::vector<std::string> commit_subjects(const std::filesystem::path& repo_root,
                                             const std::string& branch,
                                             const std::string& base) override;
    std::string diff_stat(const std::filesystem::path& worktree, const std::string& base) override;

private:
    std::vector<std::string> git(const std::filesystem::path& dir,
                                 std::initializer_list<std::string> args) const;

    std::string git_binary_;
};

// ─────────────────────────────────────────────
// MockVcs
// ─────────────────────────────────────────────

/**
 * @brief In-memory version control for tests.
 *
 * Worktrees are real directories (so workers and the filesystem indicator
 * see them); branches and commits live in memory and are set by the test.
 */
class MockVcs : public IVcsBackend {
public:
    struct Commit {
        std::string subject;
        Timestamp at;
    };

    MockVcs() = default;

    [[nodiscard]] bool available() const override { return available_; }
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    Result<std::string> head_commit(const std::filesystem::path& repo_root) override;
    Result<void> add_worktree(const std::filesystem::path& repo_root,
                              const std::filesystem::path& worktree,
                              const std::string& branch) override;
    Result<void> remove_worktree(const std::filesystem::path& repo_root,
                                 const std::filesystem::path& worktree) override;
    bool is_worktree(const std::filesystem::path& repo_root,
                     const std::filesystem::path& path) override;
    std::optional<Timestamp> last_commit_time(const std::filesystem::path& repo_root,
                                              const std::string& branch) override;
    std::vector<std::string> commit_subjects(const std::filesystem::path& repo_root,
                                             const std::string& branch,
                                             const std::string& base) override;
    std::string diff_stat(const std::filesystem::path& worktree, const std::string& base) override;

    // Test helpers
    void set_available(bool available) { available_ = available; }
    void add_commit(const std::string& branch, std::string subject, Timestamp at);
    void fail_next_add(std::string message);
    [[nodiscard]] bool has_branch(const std::string& branch) const;
    [[nodiscard]] size_t worktree_count() const;
    [[nodiscard]] size_t add_count() const;

private:
    bool available_ = true;
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Commit>> branches_;
    std::map<std::filesystem::path, std::string> worktrees_;  // path -> branch
    std::optional<std::string> next_add_failure_;
    size_t add_count_ = 0;
};

}  // namespace agent_orchestrator
