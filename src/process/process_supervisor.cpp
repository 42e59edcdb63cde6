/**
 * @file process_supervisor.cpp
 * @brief ProcessSupervisor implementation.
 * @author Dimitris Kafetzis
 */

#include "process/process_supervisor.hpp"

#include <chrono>
#include <fstream>
#include <thread>

namespace agent_orchestrator {

namespace {

constexpr Millis kExitPollInterval{50};
constexpr Millis kForcefulWait{5000};

}  // namespace

ProcessSupervisor::ProcessSupervisor(const BackendRegistry& backends, Logger& logger)
    : backends_(backends), log_(logger, "supervisor") {}

Result<RunningProcess> ProcessSupervisor::start(const Task& task,
                                                const WorkspaceAllocation& allocation,
                                                const LaunchPlan& plan) {
    auto* backend = backends_.find(plan.runner);
    if (!backend) {
        return Error{ErrorKind::ProcessLaunch,
                     "Task '" + task.id + "': no backend for runner '" + plan.runner + "'"};
    }

    TemplateVars vars = plan.extra_vars;
    vars.insert_or_assign("prompt", plan.prompt.string());
    vars.insert_or_assign("task", task.id);
    vars.insert_or_assign("phase", std::string{to_string(task.phase)});
    vars.insert_or_assign("branch", allocation.branch);
    vars.insert_or_assign("workspace", allocation.path.string());
    if (!vars.contains("run_id")) vars.emplace("run_id", "");
    if (!vars.contains("handoff")) vars.emplace("handoff", "");

    auto command = expand_template(plan.command, vars);
    if (!command) {
        return Error{ErrorKind::ProcessLaunch,
                     "Task '" + task.id + "': " + command.error().message};
    }

    std::error_code ec;
    std::filesystem::create_directories(task.log_path.parent_path(), ec);
    auto started_at = std::chrono::system_clock::now();
    {
        std::ofstream log(task.log_path, std::ios::app);
        if (!log) {
            return Error{ErrorKind::ProcessLaunch,
                         "Task '" + task.id + "': cannot open log " + task.log_path.string()};
        }
        log << "\n=== " << format_timestamp(started_at) << " attempt " << plan.attempt
            << " runner=" << plan.runner << " workspace=" << allocation.path.string()
            << " ===\n$ " << *command << '\n';
    }

    LaunchRequest request{
        .task_id = task.id,
        .command = *command,
        .workdir = allocation.path,
        .log_path = task.log_path,
        .environment = {{"AGENT_ORCH_TASK", task.id},
                        {"AGENT_ORCH_RUN_ID", vars.at("run_id")},
                        {"AGENT_ORCH_ATTEMPT", std::to_string(plan.attempt)}},
    };

    auto handle = backend->start(request);
    if (!handle) {
        log_.error("launch failed", {{"task", task.id}, {"error", handle.error().message}});
        return handle.error();
    }

    RunningProcess process{
        .task_id = task.id,
        .handle = *handle,
        .runner = plan.runner,
        .command = *command,
        .started_at = started_at,
        .log_path = task.log_path,
        .attempt = plan.attempt,
        .exit = std::nullopt,
    };

    {
        std::lock_guard lock(mutex_);
        processes_.insert_or_assign(task.id, process);
    }

    log_.info("worker started", {{"task", task.id},
                                 {"pid", handle->pid},
                                 {"runner", plan.runner},
                                 {"attempt", plan.attempt}});
    return process;
}

IWorkerBackend* ProcessSupervisor::backend_for(const RunningProcess& process) const {
    return backends_.find(process.runner);
}

std::optional<ExitStatus> ProcessSupervisor::poll(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    auto it = processes_.find(task_id);
    if (it == processes_.end()) return std::nullopt;
    auto& process = it->second;
    if (process.exit) return process.exit;

    auto* backend = backend_for(process);
    if (!backend) return std::nullopt;
    process.exit = backend->poll(process.handle);
    return process.exit;
}

Result<void> ProcessSupervisor::signal(const TaskId& task_id, SignalTier tier) {
    std::optional<RunningProcess> process = find(task_id);
    if (!process) {
        return Error{ErrorKind::Internal, "No process for task '" + task_id + "'"};
    }
    if (process->exit) return Result<void>{};

    auto* backend = backend_for(*process);
    if (!backend) {
        return Error{ErrorKind::Internal, "No backend for runner '" + process->runner + "'"};
    }
    log_.debug("signal", {{"task", task_id}, {"tier", std::string{to_string(tier)}}});
    return backend->signal(process->handle, tier);
}

std::optional<ExitStatus> ProcessSupervisor::wait_for_exit(const TaskId& task_id, Millis timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (auto exit = poll(task_id)) return exit;
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(kExitPollInterval);
    }
}

std::optional<ExitStatus> ProcessSupervisor::terminate(const TaskId& task_id, Millis grace) {
    if (!find(task_id)) return std::nullopt;
    if (auto exit = poll(task_id)) return exit;

    if (auto sent = signal(task_id, SignalTier::Graceful); !sent) {
        log_.warn("graceful signal failed", {{"task", task_id}, {"error", sent.error().message}});
    }
    if (auto exit = wait_for_exit(task_id, grace)) return exit;

    log_.warn("grace period expired, killing", {{"task", task_id},
                                                {"grace_ms", grace.count()}});
    if (auto sent = signal(task_id, SignalTier::Forceful); !sent) {
        log_.error("forceful kill failed", {{"task", task_id}, {"error", sent.error().message}});
    }
    return wait_for_exit(task_id, kForcefulWait);
}

std::optional<RunningProcess> ProcessSupervisor::find(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = processes_.find(task_id);
    if (it == processes_.end()) return std::nullopt;
    return it->second;
}

void ProcessSupervisor::forget(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    processes_.erase(task_id);
}

size_t ProcessSupervisor::running_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, process] : processes_) {
        if (!process.exit) ++count;
    }
    return count;
}

}  // namespace agent_orchestrator
