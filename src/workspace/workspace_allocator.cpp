/**
 * @file workspace_allocator.cpp
 * @brief WorkspaceAllocator implementation.
 * @author Dimitris Kafetzis
 */

#include "workspace/workspace_allocator.hpp"

#include <chrono>

#include <unistd.h>

namespace agent_orchestrator {

WorkspaceAllocator::WorkspaceAllocator(IVcsBackend& vcs, std::filesystem::path repo_root,
                                       Logger& logger)
    : vcs_(vcs), repo_root_(std::move(repo_root)), log_(logger, "allocator") {}

std::filesystem::path WorkspaceAllocator::key_of(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
}

Result<WorkspaceAllocation> WorkspaceAllocator::allocate(const Task& task) {
    auto key = key_of(task.workspace_path);

    // ── Reserve the path ──────────────────────
    WorkspaceAllocation allocation;
    {
        std::lock_guard lock(mutex_);
        if (auto it = live_.find(key); it != live_.end()) {
            if (it->second.task_id == task.id && !it->second.path.empty()) {
                return it->second;
            }
            return Error{ErrorKind::WorkspaceConflict,
                         "Workspace " + key.string() + " is already allocated to task '"
                             + it->second.task_id + "'"};
        }
        allocation.path = key;
        allocation.branch = task.branch;
        allocation.task_id = task.id;
        allocation.generation = next_generation_++;
        // Reservation with an empty path marker until the worktree exists.
        auto reservation = allocation;
        reservation.path.clear();
        live_.emplace(key, std::move(reservation));
    }

    auto drop_reservation = [this, &key] {
        std::lock_guard lock(mutex_);
        live_.erase(key);
    };

    // ── Materialize ───────────────────────────
    std::error_code ec;
    auto parent = key.parent_path();
    std::filesystem::create_directories(parent, ec);
    if (ec || ::access(parent.c_str(), W_OK) != 0) {
        drop_reservation();
        return Error{ErrorKind::WorkspaceConflict,
                     "Workspace parent " + parent.string() + " is not writable"};
    }

    {
        std::lock_guard vcs_lock(vcs_mutex_);

        auto base = vcs_.head_commit(repo_root_);
        if (!base) {
            drop_reservation();
            return base.error();
        }
        allocation.base_commit = *base;

        if (std::filesystem::exists(key, ec)) {
            if (!vcs_.is_worktree(repo_root_, key)) {
                drop_reservation();
                return Error{ErrorKind::WorkspaceConflict,
                             "Workspace " + key.string() + " exists and is not a worktree"};
            }
            log_.warn("adopting existing worktree", {{"task", task.id}, {"path", key.string()}});
        } else if (auto added = vcs_.add_worktree(repo_root_, key, task.branch); !added) {
            drop_reservation();
            return Error{ErrorKind::WorkspaceConflict,
                         "Task '" + task.id + "': " + added.error().message};
        }
    }

    allocation.created_at = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        live_.insert_or_assign(key, allocation);
    }

    log_.info("workspace allocated", {{"task", task.id},
                                      {"path", key.string()},
                                      {"branch", task.branch},
                                      {"base", allocation.base_commit}});
    return allocation;
}

Result<void> WorkspaceAllocator::release(WorkspaceAllocation& allocation, ReleaseOutcome outcome) {
    if (!allocation.live()) return Result<void>{};
    allocation.released_at = std::chrono::system_clock::now();

    {
        std::lock_guard lock(mutex_);
        auto it = live_.find(allocation.path);
        if (it == live_.end() || it->second.generation != allocation.generation) {
            return Result<void>{};
        }
    }

    Result<void> removed;
    {
        std::lock_guard vcs_lock(vcs_mutex_);
        removed = vcs_.remove_worktree(repo_root_, allocation.path);
    }

    {
        std::lock_guard lock(mutex_);
        live_.erase(allocation.path);
    }

    if (!removed) {
        log_.error("workspace removal failed", {{"task", allocation.task_id},
                                                {"path", allocation.path.string()},
                                                {"error", removed.error().message}});
        return removed;
    }

    log_.info("workspace released", {{"task", allocation.task_id},
                                     {"path", allocation.path.string()},
                                     {"branch", allocation.branch},
                                     {"outcome", std::string{to_string(outcome)}}});
    return Result<void>{};
}

bool WorkspaceAllocator::is_live(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    return live_.contains(key_of(path));
}

std::optional<TaskId> WorkspaceAllocator::owner_of(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    auto it = live_.find(key_of(path));
    if (it == live_.end()) return std::nullopt;
    return it->second.task_id;
}

size_t WorkspaceAllocator::live_count() const {
    std::lock_guard lock(mutex_);
    return live_.size();
}

std::vector<WorkspaceAllocation> WorkspaceAllocator::live_allocations() const {
    std::lock_guard lock(mutex_);
    std::vector<WorkspaceAllocation> out;
    out.reserve(live_.size());
    for (const auto& [path, allocation] : live_) {
        if (!allocation.path.empty()) out.push_back(allocation);
    }
    return out;
}

}  // namespace agent_orchestrator
