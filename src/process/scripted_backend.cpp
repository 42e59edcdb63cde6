/**
 * @file scripted_backend.cpp
 * @brief ScriptedBackend implementation, fake workers for testing.
 * @author Dimitris Kafetzis
 */

#include "process/worker_backend.hpp"

#include <csignal>
#include <fstream>

namespace agent_orchestrator {

ScriptedBackend::ScriptedBackend(std::string name) : name_(std::move(name)) {}

Result<ProcessHandle> ScriptedBackend::start(const LaunchRequest& request) {
    std::lock_guard lock(mutex_);
    launches_.push_back(request);

    Script script = default_script_;
    if (auto it = scripts_.find(request.task_id); it != scripts_.end() && !it->second.empty()) {
        script = std::move(it->second.front());
        it->second.pop_front();
    }

    if (script.fail_launch) {
        return Error{ErrorKind::ProcessLaunch,
                     "Task '" + request.task_id + "': scripted launch failure"};
    }

    if (!script.log_output.empty() && !request.log_path.empty()) {
        std::ofstream log(request.log_path, std::ios::app);
        log << script.log_output;
    }

    pid_t pid = next_pid_++;
    FakeProcess process{.task_id = request.task_id, .script = script, .exit = std::nullopt};
    if (script.exit_immediately) {
        process.exit = ExitStatus{.code = *script.exit_immediately};
    }
    processes_.emplace(pid, std::move(process));
    return ProcessHandle{.pid = pid, .backend = name_};
}

Result<void> ScriptedBackend::signal(const ProcessHandle& handle, SignalTier tier) {
    std::lock_guard lock(mutex_);
    auto it = processes_.find(handle.pid);
    if (it == processes_.end()) {
        return Error{ErrorKind::Internal, "unknown scripted process " + std::to_string(handle.pid)};
    }
    auto& process = it->second;
    signals_.emplace_back(process.task_id, tier);
    if (process.exit) return Result<void>{};

    switch (tier) {
        case SignalTier::Cooperative:
            if (process.script.obey_cooperative) {
                process.exit = ExitStatus{.code = 128 + SIGINT, .signal = SIGINT};
            }
            break;
        case SignalTier::Graceful:
            if (process.script.obey_graceful) {
                process.exit = ExitStatus{.code = 128 + SIGTERM, .signal = SIGTERM};
            }
            break;
        case SignalTier::Forceful:
            process.exit = ExitStatus{.code = 128 + SIGKILL, .signal = SIGKILL};
            break;
    }
    return Result<void>{};
}

std::optional<ExitStatus> ScriptedBackend::poll(const ProcessHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = processes_.find(handle.pid);
    if (it == processes_.end()) return ExitStatus{};
    return it->second.exit;
}

void ScriptedBackend::push_script(const TaskId& task_id, Script script) {
    std::lock_guard lock(mutex_);
    scripts_[task_id].push_back(std::move(script));
}

void ScriptedBackend::set_default_script(Script script) {
    std::lock_guard lock(mutex_);
    default_script_ = std::move(script);
}

void ScriptedBackend::finish(const TaskId& task_id, int exit_code) {
    std::lock_guard lock(mutex_);
    for (auto& [pid, process] : processes_) {
        if (process.task_id == task_id && !process.exit) {
            process.exit = ExitStatus{.code = exit_code};
        }
    }
}

bool ScriptedBackend::is_alive(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    for (const auto& [pid, process] : processes_) {
        if (process.task_id == task_id && !process.exit) return true;
    }
    return false;
}

size_t ScriptedBackend::start_count(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& launch : launches_) {
        if (launch.task_id == task_id) ++count;
    }
    return count;
}

std::vector<LaunchRequest> ScriptedBackend::launches() const {
    std::lock_guard lock(mutex_);
    return launches_;
}

std::vector<std::pair<TaskId, SignalTier>> ScriptedBackend::signals() const {
    std::lock_guard lock(mutex_);
    return signals_;
}

}  // namespace agent_orchestrator
