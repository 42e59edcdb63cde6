/**
 * @file preflight.cpp
 * @brief Pre-run environment validation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/preflight.hpp"

#include "process/subprocess.hpp"
#include "workspace/workspace_allocator.hpp"

#include <unistd.h>

#include <map>
#include <set>

namespace agent_orchestrator {

namespace {

void check_executable(const std::string& command, const std::string& owner,
                      std::set<std::string>& checked, std::vector<std::string>& problems) {
    auto word = first_word(command);
    if (is_shell_builtin(word) || word.find('{') != std::string::npos) return;
    if (!checked.insert(word).second) return;
    if (!find_executable(word)) {
        problems.push_back("Runner executable not found for " + owner + ": " + word);
    }
}

void check_unique(std::map<std::string, TaskId>& seen, const std::string& key,
                  const TaskId& id, std::string_view what, std::vector<std::string>& problems) {
    auto [it, inserted] = seen.try_emplace(key, id);
    if (!inserted) {
        problems.push_back("Tasks '" + it->second + "' and '" + id + "' share " + std::string{what}
                           + ": " + key);
    }
}

}  // namespace

std::vector<std::string> preflight_problems(const TaskGraph& graph, bool include_manual,
                                            const Config& config, IVcsBackend& vcs) {
    std::vector<std::string> problems;
    const auto& root = config.run.project_root;

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        problems.push_back("project_root does not exist: " + root.string());
        return problems;
    }
    if (!vcs.available()) {
        problems.push_back(std::string{vcs.name()} + " is not available");
        return problems;
    }
    if (auto head = vcs.head_commit(root); !head) {
        problems.push_back("project_root is not a repository: " + head.error().message);
    }

    std::filesystem::create_directories(config.run.logs_dir, ec);
    if (ec || ::access(config.run.logs_dir.c_str(), W_OK) != 0) {
        problems.push_back("Logs directory is not writable: " + config.run.logs_dir.string());
    }

    std::set<std::string> checked;
    std::map<std::string, TaskId> workspaces;
    std::map<std::string, TaskId> branches;
    std::map<std::string, TaskId> logs;

    for (const auto& id : graph.schedulable(include_manual)) {
        const auto* task = graph.get_task(id);
        if (!task) continue;

        check_executable(task->command, "task '" + id + "'", checked, problems);
        const auto& alternate = task->escalation.alternate_runner;
        if (!alternate.empty()) {
            if (auto it = config.runners.find(alternate); it != config.runners.end()) {
                check_executable(it->second.command, "runner '" + alternate + "'", checked, problems);
            }
        }

        if (!std::filesystem::is_regular_file(task->prompt, ec)) {
            problems.push_back("Prompt file not found: " + task->prompt.string());
        }
        if (!task->reduced_prompt.empty() && !std::filesystem::is_regular_file(task->reduced_prompt, ec)) {
            problems.push_back("Reduced prompt file not found: " + task->reduced_prompt.string());
        }

        check_unique(workspaces, WorkspaceAllocator::key_of(task->workspace_path).string(), id,
                     "a workspace path", problems);
        check_unique(branches, task->branch, id, "a branch", problems);
        check_unique(logs, task->log_path.lexically_normal().string(), id, "a log path", problems);

        if (std::filesystem::exists(task->workspace_path, ec)
            && !vcs.is_worktree(root, task->workspace_path)) {
            problems.push_back("Workspace path exists and is not a registered worktree: "
                               + task->workspace_path.string());
        }
    }
    return problems;
}

Result<void> run_preflight(const TaskGraph& graph, bool include_manual,
                           const Config& config, IVcsBackend& vcs) {
    auto problems = preflight_problems(graph, include_manual, config, vcs);
    if (problems.empty()) return {};

    std::string message = "Preflight failed:";
    for (const auto& problem : problems) message += "\n- " + problem;
    return Error{ErrorKind::Config, std::move(message)};
}

}  // namespace agent_orchestrator
