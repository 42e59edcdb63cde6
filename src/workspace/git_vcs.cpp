/**
 * @file git_vcs.cpp
 * @brief GitVcs implementation: `git worktree` / `git log` via run_command.
 * @author Dimitris Kafetzis
 */

#include "process/subprocess.hpp"
#include "workspace/vcs.hpp"

#include <ctime>
#include <exception>
#include <sstream>

namespace agent_orchestrator {

namespace {

std::string trim(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::filesystem::path normalized(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    return ec ? path.lexically_normal() : canonical;
}

Error git_failure(const std::string& what, const Result<CommandOutput>& out) {
    if (!out) return Error{ErrorKind::WorkspaceConflict, what + ": " + out.error().message};
    auto detail = trim(out->stderr_text.empty() ? out->stdout_text : out->stderr_text);
    return Error{ErrorKind::WorkspaceConflict, what + " failed: " + detail};
}

}  // namespace

GitVcs::GitVcs(std::string git_binary) : git_binary_(std::move(git_binary)) {}

bool GitVcs::available() const {
    return find_executable(git_binary_).has_value();
}

std::vector<std::string> GitVcs::git(const std::filesystem::path& dir,
                                     std::initializer_list<std::string> args) const {
    std::vector<std::string> argv{git_binary_, "-C", dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

Result<std::string> GitVcs::head_commit(const std::filesystem::path& repo_root) {
    auto out = run_command(git(repo_root, {"rev-parse", "HEAD"}));
    if (!out || !out->ok()) return git_failure("git rev-parse HEAD", out);
    return trim(out->stdout_text);
}

Result<void> GitVcs::add_worktree(const std::filesystem::path& repo_root,
                                  const std::filesystem::path& worktree,
                                  const std::string& branch) {
    auto created = run_command(git(repo_root, {"worktree", "add", "-b", branch, worktree.string()}));
    if (created && created->ok()) return Result<void>{};

    // Branch left behind by an earlier attempt: check it out again.
    auto reused = run_command(git(repo_root, {"worktree", "add", worktree.string(), branch}));
    if (reused && reused->ok()) return Result<void>{};

    return git_failure("git worktree add " + worktree.string(), reused);
}

Result<void> GitVcs::remove_worktree(const std::filesystem::path& repo_root,
                                     const std::filesystem::path& worktree) {
    auto removed = run_command(git(repo_root, {"worktree", "remove", "--force", worktree.string()}));
    if (!removed || !removed->ok()) {
        std::error_code ec;
        std::filesystem::remove_all(worktree, ec);
        if (ec) {
            return Error{ErrorKind::Io, "cannot remove " + worktree.string() + ": " + ec.message()};
        }
    }
    auto pruned = run_command(git(repo_root, {"worktree", "prune"}));
    if (!pruned) return pruned.error();
    return Result<void>{};
}

bool GitVcs::is_worktree(const std::filesystem::path& repo_root, const std::filesystem::path& path) {
    auto out = run_command(git(repo_root, {"worktree", "list", "--porcelain"}));
    if (!out || !out->ok()) return false;

    auto wanted = normalized(path);
    for (const auto& line : split_lines(out->stdout_text)) {
        constexpr std::string_view kPrefix = "worktree ";
        if (line.rfind(kPrefix, 0) != 0) continue;
        if (normalized(line.substr(kPrefix.size())) == wanted) return true;
    }
    return false;
}

std::optional<Timestamp> GitVcs::last_commit_time(const std::filesystem::path& repo_root,
                                                  const std::string& branch) {
    auto out = run_command(git(repo_root, {"log", "-1", "--format=%ct", branch, "--"}));
    if (!out || !out->ok()) return std::nullopt;
    auto text = trim(out->stdout_text);
    if (text.empty()) return std::nullopt;
    try {
        return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(std::stoll(text)));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> GitVcs::commit_subjects(const std::filesystem::path& repo_root,
                                                 const std::string& branch,
                                                 const std::string& base) {
    auto range = base.empty() ? branch : base + ".." + branch;
    auto out = run_command(git(repo_root, {"log", "--format=%s", range, "--"}));
    if (!out || !out->ok()) return {};
    return split_lines(out->stdout_text);
}

std::string GitVcs::diff_stat(const std::filesystem::path& worktree, const std::string& base) {
    auto out = base.empty() ? run_command(git(worktree, {"diff", "--stat"}))
                            : run_command(git(worktree, {"diff", "--stat", base}));
    if (!out || !out->ok()) return {};
    return trim(out->stdout_text);
}

}  // namespace agent_orchestrator
