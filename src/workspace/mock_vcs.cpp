/**
 * @file mock_vcs.cpp
 * @brief MockVcs implementation, configurable version control for testing.
 * @author Dimitris Kafetzis
 */

#include "workspace/vcs.hpp"

#include <algorithm>

namespace agent_orchestrator {

namespace {

std::filesystem::path key_of(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
}

}  // namespace

Result<std::string> MockVcs::head_commit(const std::filesystem::path& /*repo_root*/) {
    return std::string{"mock-base"};
}

Result<void> MockVcs::add_worktree(const std::filesystem::path& /*repo_root*/,
                                   const std::filesystem::path& worktree,
                                   const std::string& branch) {
    std::lock_guard lock(mutex_);
    ++add_count_;
    if (next_add_failure_) {
        auto message = std::move(*next_add_failure_);
        next_add_failure_.reset();
        return Error{ErrorKind::WorkspaceConflict, message};
    }

    auto key = key_of(worktree);
    if (worktrees_.contains(key)) {
        return Error{ErrorKind::WorkspaceConflict, "'" + worktree.string() + "' is already a worktree"};
    }
    for (const auto& [path, checked_out] : worktrees_) {
        if (checked_out == branch) {
            return Error{ErrorKind::WorkspaceConflict,
                         "branch '" + branch + "' is already checked out at " + path.string()};
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(worktree, ec);
    if (ec) {
        return Error{ErrorKind::WorkspaceConflict,
                     "cannot create " + worktree.string() + ": " + ec.message()};
    }
    branches_[branch];
    worktrees_.emplace(key, branch);
    return Result<void>{};
}

Result<void> MockVcs::remove_worktree(const std::filesystem::path& /*repo_root*/,
                                      const std::filesystem::path& worktree) {
    std::lock_guard lock(mutex_);
    worktrees_.erase(key_of(worktree));
    std::error_code ec;
    std::filesystem::remove_all(worktree, ec);
    if (ec) {
        return Error{ErrorKind::Io, "cannot remove " + worktree.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

bool MockVcs::is_worktree(const std::filesystem::path& /*repo_root*/,
                          const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    return worktrees_.contains(key_of(path));
}

std::optional<Timestamp> MockVcs::last_commit_time(const std::filesystem::path& /*repo_root*/,
                                                   const std::string& branch) {
    std::lock_guard lock(mutex_);
    auto it = branches_.find(branch);
    if (it == branches_.end() || it->second.empty()) return std::nullopt;
    return it->second.back().at;
}

std::vector<std::string> MockVcs::commit_subjects(const std::filesystem::path& /*repo_root*/,
                                                  const std::string& branch,
                                                  const std::string& /*base*/) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> subjects;
    if (auto it = branches_.find(branch); it != branches_.end()) {
        for (auto commit = it->second.rbegin(); commit != it->second.rend(); ++commit) {
            subjects.push_back(commit->subject);
        }
    }
    return subjects;
}

std::string MockVcs::diff_stat(const std::filesystem::path& worktree, const std::string& /*base*/) {
    std::error_code ec;
    size_t files = 0;
    for (auto it = std::filesystem::recursive_directory_iterator(worktree, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) ++files;
    }
    return std::to_string(files) + " files in workspace";
}

void MockVcs::add_commit(const std::string& branch, std::string subject, Timestamp at) {
    std::lock_guard lock(mutex_);
    branches_[branch].push_back(Commit{.subject = std::move(subject), .at = at});
}

void MockVcs::fail_next_add(std::string message) {
    std::lock_guard lock(mutex_);
    next_add_failure_ = std::move(message);
}

bool MockVcs::has_branch(const std::string& branch) const {
    std::lock_guard lock(mutex_);
    return branches_.contains(branch);
}

size_t MockVcs::worktree_count() const {
    std::lock_guard lock(mutex_);
    return worktrees_.size();
}

size_t MockVcs::add_count() const {
    std::lock_guard lock(mutex_);
    return add_count_;
}

}  // namespace agent_orchestrator
