/**
 * @file run_state.hpp
 * @brief Everything one orchestration run owns, held by the coordinating loop.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"
#include "process/process_supervisor.hpp"
#include "telemetry/phase_lock.hpp"
#include "workspace/workspace_allocator.hpp"

#include <filesystem>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Outcome of a blocking job run on the worker pool.
 *
 * Launch and restart jobs allocate a workspace and start a process; release
 * jobs only tear down. Jobs never touch task status.
 */
struct JobResult {
    enum class Kind : uint8_t { Launch, Restart, Release };

    TaskId task_id;
    Kind kind = Kind::Launch;
    std::optional<Strategy> strategy;               ///< Restart only
    std::optional<WorkspaceAllocation> allocation;  ///< Live allocation after the job
    std::optional<RunningProcess> process;          ///< Set when a worker was started
    std::optional<Error> error;
};

struct PendingJob {
    JobResult::Kind kind = JobResult::Kind::Launch;
    std::future<JobResult> future;
};

/**
 * @brief What the loop knows about a task that holds a workspace.
 */
struct ActiveTask {
    std::optional<WorkspaceAllocation> allocation;
    std::optional<RunningProcess> process;
    uint32_t attempt = 0;
    std::string runner;                             ///< Current plan
    std::string command;
    std::filesystem::path prompt;
    std::filesystem::path handoff;
};

/**
 * @brief Single owner of the run's mutable state.
 *
 * Only the coordinating loop reads or writes it; pool jobs receive copies and
 * report back through their futures.
 */
struct RunState {
    RunId run_id;
    std::vector<Phase> phases;
    bool include_manual = false;
    TaskGraph graph;
    std::vector<PhaseLock> locks;
    std::map<TaskId, ActiveTask> active;
    std::map<TaskId, PendingJob> jobs;              ///< At most one per task
    std::optional<ErrorKind> first_failure;         ///< Class of the first failed task
    bool any_failed = false;
    bool cancelled = false;
    Timestamp started_at{};
    SteadyTime started_steady{};

    [[nodiscard]] bool busy(const TaskId& task_id) const { return jobs.contains(task_id); }
};

}  // namespace agent_orchestrator
