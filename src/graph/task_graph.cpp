/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation: graph algorithms and status bookkeeping.
 * @author Dimitris Kafetzis
 *
 * Implements Kahn's algorithm for topological ordering and DFS-based cycle
 * detection with an explicit recursion stack. Iteration follows insertion
 * order so dry-run output and scheduling are deterministic.
 */

#include "graph/task_graph.hpp"

#include <algorithm>
#include <deque>
#include <queue>
#include <stack>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TaskId TaskGraph::add_task(Task task) {
    TaskId id = task.id;
    if (!tasks_.contains(id)) {
        order_.push_back(id);
    }
    adj_list_[id];
    reverse_adj_[id];
    tasks_.insert_or_assign(id, std::move(task));
    return id;
}

void TaskGraph::add_dependency(const TaskId& from, const TaskId& to) {
    auto& forward = adj_list_[from];
    if (std::find(forward.begin(), forward.end(), to) != forward.end()) return;
    forward.push_back(to);
    reverse_adj_[to].push_back(from);

    if (auto it = tasks_.find(to); it != tasks_.end()) {
        auto& deps = it->second.depends_on;
        if (std::find(deps.begin(), deps.end(), from) == deps.end()) {
            deps.push_back(from);
        }
    }
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::topological_order() const {
    std::unordered_map<TaskId, size_t> in_degree;
    for (const auto& id : order_) {
        in_degree[id] = reverse_adj_.at(id).size();
    }

    std::queue<TaskId> zero_in;
    for (const auto& id : order_) {
        if (in_degree[id] == 0) {
            zero_in.push(id);
        }
    }

    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        order.push_back(current);

        if (auto it = adj_list_.find(current); it != adj_list_.end()) {
            for (const auto& neighbor : it->second) {
                if (--in_degree[neighbor] == 0) {
                    zero_in.push(neighbor);
                }
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// Ready Set
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::ready_tasks(bool include_manual) const {
    std::vector<TaskId> ready;

    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (task.status != TaskStatus::Pending) continue;
        if (task.manual && !include_manual) continue;

        bool all_deps_met = true;
        for (const auto& dep_id : reverse_adj_.at(id)) {
            auto dep_it = tasks_.find(dep_id);
            if (dep_it == tasks_.end() || dep_it->second.status != TaskStatus::Succeeded) {
                all_deps_met = false;
                break;
            }
        }

        if (all_deps_met) {
            ready.push_back(id);
        }
    }

    return ready;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::dependents(const TaskId& id) const {
    auto it = adj_list_.find(id);
    if (it == adj_list_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::dependencies(const TaskId& id) const {
    auto it = reverse_adj_.find(id);
    if (it == reverse_adj_.end()) return {};
    return it->second;
}

bool TaskGraph::has_cycle() const {
    return find_cycle().has_value();
}

std::optional<std::vector<TaskId>> TaskGraph::find_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;

    for (const auto& [id, _] : adj_list_) {
        color[id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& start_id : order_) {
        if (color[start_id] != Color::White) continue;

        // The frames on this stack are exactly the recursion stack (Gray nodes).
        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();

            auto adj_it = adj_list_.find(frame.node);
            if (adj_it == adj_list_.end() || frame.neighbor_idx >= adj_it->second.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            const auto neighbor = adj_it->second[frame.neighbor_idx];
            ++frame.neighbor_idx;

            if (color[neighbor] == Color::Gray) {
                std::vector<TaskId> cycle;
                auto begin = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                          [&](const Frame& f) { return f.node == neighbor; });
                for (auto it = begin; it != dfs_stack.end(); ++it) {
                    cycle.push_back(it->node);
                }
                cycle.push_back(neighbor);
                return cycle;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push_back({neighbor, 0});
            }
        }
    }

    return std::nullopt;
}

bool TaskGraph::contains(const TaskId& id) const {
    return tasks_.contains(id);
}

size_t TaskGraph::task_count() const noexcept {
    return tasks_.size();
}

const Task* TaskGraph::get_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return nullptr;
    return &it->second;
}

std::vector<TaskId> TaskGraph::schedulable(bool include_manual) const {
    std::vector<TaskId> ids;
    for (const auto& id : order_) {
        if (!tasks_.at(id).manual || include_manual) ids.push_back(id);
    }
    return ids;
}

bool TaskGraph::is_quiescent(bool include_manual) const {
    for (const auto& id : schedulable(include_manual)) {
        if (!is_terminal(tasks_.at(id).status)) return false;
    }
    return true;
}

size_t TaskGraph::count(TaskStatus status) const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [status](const auto& entry) { return entry.second.status == status; }));
}

// ─────────────────────────────────────────────
// State Updates
// ─────────────────────────────────────────────

Task* TaskGraph::find(const TaskId& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

void TaskGraph::mark_ready(const TaskId& id) {
    if (auto* task = find(id)) task->status = TaskStatus::Ready;
}

void TaskGraph::mark_running(const TaskId& id) {
    if (auto* task = find(id)) task->status = TaskStatus::Running;
}

void TaskGraph::mark_succeeded(const TaskId& id) {
    if (auto* task = find(id)) {
        task->status = TaskStatus::Succeeded;
        task->reason.clear();
    }
}

void TaskGraph::mark_failed(const TaskId& id, std::string reason) {
    if (auto* task = find(id)) {
        task->status = TaskStatus::Failed;
        task->reason = std::move(reason);
    }
}

void TaskGraph::mark_blocked(const TaskId& id, std::string reason) {
    if (auto* task = find(id)) {
        task->status = TaskStatus::Blocked;
        task->reason = std::move(reason);
    }
}

std::vector<TaskId> TaskGraph::block_dependents(const TaskId& failed_id) {
    std::vector<TaskId> blocked;
    std::deque<std::pair<TaskId, TaskId>> frontier;  // (task, cause)
    for (const auto& dependent : dependents(failed_id)) {
        frontier.emplace_back(dependent, failed_id);
    }

    while (!frontier.empty()) {
        auto [id, cause] = frontier.front();
        frontier.pop_front();

        auto* task = find(id);
        if (!task) continue;
        if (task->status != TaskStatus::Pending && task->status != TaskStatus::Ready) continue;

        task->status = TaskStatus::Blocked;
        task->reason = "dependency '" + cause + "' did not succeed";
        blocked.push_back(id);

        for (const auto& next : dependents(id)) {
            frontier.emplace_back(next, id);
        }
    }
    return blocked;
}

void TaskGraph::set_prompt(const TaskId& id, std::filesystem::path prompt) {
    if (auto* task = find(id)) task->prompt = std::move(prompt);
}

}  // namespace agent_orchestrator
