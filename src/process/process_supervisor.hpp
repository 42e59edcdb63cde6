/**
 * @file process_supervisor.hpp
 * @brief Launches and tracks one worker process per running task.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/template.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"
#include "process/worker_backend.hpp"
#include "workspace/workspace_allocator.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief A supervised worker. Owned by the supervisor; others get copies.
 */
struct RunningProcess {
    TaskId task_id;
    ProcessHandle handle;
    std::string runner;
    std::string command;                            ///< As launched, placeholders expanded
    Timestamp started_at{};
    std::filesystem::path log_path;
    uint32_t attempt = 1;
    std::optional<ExitStatus> exit;                 ///< Absent while running
};

/**
 * @brief What to run for one attempt of a task.
 */
struct LaunchPlan {
    std::string runner;                             ///< Backend name ("inline" = fallback)
    std::string command;                            ///< Template
    std::filesystem::path prompt;
    uint32_t attempt = 1;
    TemplateVars extra_vars;                        ///< run_id, handoff, ...
};

class ProcessSupervisor {
public:
    ProcessSupervisor(const BackendRegistry& backends, Logger& logger);

    /**
     * @brief Expand the command, append an attempt header to the task log, spawn.
     *
     * Non-blocking. Fails with ProcessLaunch (never retried here) or with
     * Config when the command references an unknown placeholder.
     */
    Result<RunningProcess> start(const Task& task, const WorkspaceAllocation& allocation,
                                 const LaunchPlan& plan);

    /// Non-blocking; the exit status once the process is gone.
    std::optional<ExitStatus> poll(const TaskId& task_id);

    Result<void> signal(const TaskId& task_id, SignalTier tier);

    /**
     * @brief Graceful signal, wait up to `grace`, then forceful kill.
     *
     * Blocks the calling thread; run it off the coordinating loop.
     */
    std::optional<ExitStatus> terminate(const TaskId& task_id, Millis grace);

    [[nodiscard]] std::optional<RunningProcess> find(const TaskId& task_id) const;
    void forget(const TaskId& task_id);
    [[nodiscard]] size_t running_count() const;

private:
    IWorkerBackend* backend_for(const RunningProcess& process) const;
    std::optional<ExitStatus> wait_for_exit(const TaskId& task_id, Millis timeout);

    const BackendRegistry& backends_;
    ComponentLogger log_;
    mutable std::mutex mutex_;
    std::unordered_map<TaskId, RunningProcess> processes_;
};

}  // namespace agent_orchestrator
