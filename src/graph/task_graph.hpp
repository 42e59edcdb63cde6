/**
 * @file task_graph.hpp
 * @brief Directed Acyclic Graph of orchestrated tasks.
 * @author Dimitris Kafetzis
 *
 * Nodes are tasks bound to a workspace and a worker command; edges are
 * "depends on" relations. Provides topological ordering, cycle detection,
 * ready-set computation, and failure propagation to dependents.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief A single task node, with its templates already expanded.
 */
struct Task {
    TaskId id;
    Phase phase = Phase::Main;
    std::string branch;
    std::filesystem::path workspace_path;
    std::filesystem::path prompt;
    std::filesystem::path reduced_prompt;           ///< Empty when not configured
    std::string runner;                             ///< Runner name; "inline" for task commands
    std::string command;                            ///< Template; {prompt}, {workspace}, {handoff}
    std::filesystem::path log_path;
    std::vector<TaskId> depends_on;
    bool manual = false;
    WatchdogPolicy watchdog;
    EscalationPolicy escalation;

    TaskStatus status = TaskStatus::Pending;
    std::string reason;                             ///< Why the task failed or was blocked
};

/**
 * @brief Directed Acyclic Graph of tasks.
 *
 * Only the coordinating loop mutates task status, so the graph carries no
 * internal locking.
 */
class TaskGraph {
public:
    TaskGraph() = default;

    // ── Construction ──────────────────────────
    TaskId add_task(Task task);
    void add_dependency(const TaskId& from, const TaskId& to);

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<TaskId> topological_order() const;
    [[nodiscard]] std::vector<TaskId> ready_tasks(bool include_manual) const;
    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;
    [[nodiscard]] bool has_cycle() const;
    [[nodiscard]] std::optional<std::vector<TaskId>> find_cycle() const;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept;
    [[nodiscard]] const Task* get_task(const TaskId& id) const;
    [[nodiscard]] const std::vector<TaskId>& task_ids() const noexcept { return order_; }

    /// Tasks the scheduler is responsible for (manual ones only when included).
    [[nodiscard]] std::vector<TaskId> schedulable(bool include_manual) const;
    [[nodiscard]] bool is_quiescent(bool include_manual) const;
    [[nodiscard]] size_t count(TaskStatus status) const;

    // ── State Updates ─────────────────────────
    void mark_ready(const TaskId& id);
    void mark_running(const TaskId& id);
    void mark_succeeded(const TaskId& id);
    void mark_failed(const TaskId& id, std::string reason);
    void mark_blocked(const TaskId& id, std::string reason);

    /// Block every not-yet-started transitive dependent of a failed task.
    std::vector<TaskId> block_dependents(const TaskId& failed_id);

    /// Swap the prompt a task runs with (simplify_scope).
    void set_prompt(const TaskId& id, std::filesystem::path prompt);

private:
    Task* find(const TaskId& id);

    std::unordered_map<TaskId, Task> tasks_;
    std::vector<TaskId> order_;                                      // insertion order
    std::unordered_map<TaskId, std::vector<TaskId>> adj_list_;       // dependency -> dependents
    std::unordered_map<TaskId, std::vector<TaskId>> reverse_adj_;    // task -> dependencies
};

}  // namespace agent_orchestrator
