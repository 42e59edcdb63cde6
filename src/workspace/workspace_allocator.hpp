/**
 * @file workspace_allocator.hpp
 * @brief Exclusive branch + working directory per task.
 * @author Dimitris Kafetzis
 *
 * The allocator never merges. Branches outlive their working directories so a
 * separate, human-gated step can merge successes and inspect failures.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"
#include "workspace/vcs.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct WorkspaceAllocation {
    std::filesystem::path path;
    std::string branch;
    TaskId task_id;
    std::string base_commit;                        ///< HEAD when the branch was created
    Timestamp created_at{};
    std::optional<Timestamp> released_at;
    uint64_t generation = 0;                        ///< Distinguishes re-allocations of a path

    [[nodiscard]] bool live() const noexcept { return !released_at.has_value(); }
};

enum class ReleaseOutcome : uint8_t {
    Succeeded,   ///< Branch awaits an explicit merge
    Failed,      ///< Branch kept for post-mortem inspection
    Restart,     ///< Same task re-allocates right after
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ReleaseOutcome outcome) noexcept {
    switch (outcome) {
        case ReleaseOutcome::Succeeded: return "succeeded";
        case ReleaseOutcome::Failed:    return "failed";
        case ReleaseOutcome::Restart:   return "restart";
        case ReleaseOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Allocates and releases workspaces; safe to call from pool threads.
 *
 * Invariant: at most one live allocation per path. Version-control commands
 * run outside the bookkeeping lock but are serialized among themselves.
 */
class WorkspaceAllocator {
public:
    WorkspaceAllocator(IVcsBackend& vcs, std::filesystem::path repo_root, Logger& logger);

    /**
     * @brief Create the task's branch and check it out at task.workspace_path.
     *
     * Allocating again for the owner of a live allocation returns that
     * allocation. Fails with WorkspaceConflict when another task holds the
     * path, the parent is not writable, or the path exists and is not a
     * registered worktree.
     */
    Result<WorkspaceAllocation> allocate(const Task& task);

    /**
     * @brief Remove the working directory, keep the branch.
     *
     * Marks `allocation` released even when removal fails. Releasing an
     * already released allocation is a no-op.
     */
    Result<void> release(WorkspaceAllocation& allocation, ReleaseOutcome outcome);

    [[nodiscard]] bool is_live(const std::filesystem::path& path) const;
    [[nodiscard]] std::optional<TaskId> owner_of(const std::filesystem::path& path) const;
    [[nodiscard]] size_t live_count() const;
    [[nodiscard]] std::vector<WorkspaceAllocation> live_allocations() const;

    [[nodiscard]] const std::filesystem::path& repo_root() const noexcept { return repo_root_; }
    [[nodiscard]] IVcsBackend& vcs() noexcept { return vcs_; }

    /// Canonical form used as the exclusivity key.
    [[nodiscard]] static std::filesystem::path key_of(const std::filesystem::path& path);

private:
    IVcsBackend& vcs_;
    std::filesystem::path repo_root_;
    ComponentLogger log_;

    mutable std::mutex mutex_;
    std::mutex vcs_mutex_;
    std::map<std::filesystem::path, WorkspaceAllocation> live_;
    uint64_t next_generation_ = 1;
};

}  // namespace agent_orchestrator
