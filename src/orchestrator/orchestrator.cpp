/**
 * @file orchestrator.cpp
 * @brief Orchestrator and the coordinating loop of one run.
 * @author Dimitris Kafetzis
 *
 * The loop is single-threaded and is the only writer of task status.
 * Workspace allocation, process spawn and termination run as jobs on the
 * ThreadPool; watchdog sampling runs on one thread per running task and
 * reaches the loop only through the SampleChannel.
 */

#include "orchestrator/orchestrator.hpp"

#include "escalation/escalation_engine.hpp"
#include "escalation/handoff.hpp"
#include "executor/thread_pool.hpp"
#include "graph/graph_builder.hpp"
#include "orchestrator/preflight.hpp"
#include "orchestrator/run_state.hpp"
#include "process/process_supervisor.hpp"
#include "telemetry/event_log.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/phase_lock.hpp"
#include "telemetry/run_summary.hpp"
#include "watchdog/indicators.hpp"
#include "watchdog/progress_sampler.hpp"
#include "watchdog/watchdog.hpp"
#include "workspace/workspace_allocator.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <random>
#include <thread>

namespace agent_orchestrator {

namespace {

std::string join_phases(const std::vector<Phase>& phases, std::string_view sep) {
    std::string out;
    for (auto phase : phases) {
        if (!out.empty()) out += sep;
        out += to_string(phase);
    }
    return out;
}

bool is_privileged(const Config& config, Phase phase) {
    const auto& privileged = config.run.privileged_phases;
    return std::find(privileged.begin(), privileged.end(), phase) != privileged.end();
}

nlohmann::json allocation_json(const WorkspaceAllocation& allocation) {
    return {
        {"path", allocation.path.string()},
        {"branch", allocation.branch},
        {"base", allocation.base_commit},
        {"generation", allocation.generation},
    };
}

}  // namespace

// ═══════════════════════════════════════════════
// Session: one run's components and coordinating loop
// ═══════════════════════════════════════════════

class Orchestrator::Session {
public:
    Session(Orchestrator& owner, RunState state)
        : owner_(owner)
        , config_(owner.config_)
        , log_(owner.logger_, "loop")
        , out_(*owner.console_)
        , state_(std::move(state))
        , events_(state_.run_id, std::make_unique<JsonFileSink>(owner.events_path(), 0))
        , allocator_(*owner.vcs_, config_.run.project_root, owner.logger_)
        , supervisor_(owner.backends_, owner.logger_)
        , sampler_(samples_, *owner.vcs_)
        , pool_(std::max<size_t>(1, config_.run.worker_threads)) {}

    int execute();

    [[nodiscard]] std::optional<std::filesystem::path> summary_path() const { return summary_path_; }

private:
    // ── Loop steps ───────────────────────────
    void record_run_start();
    void collect_jobs();
    void poll_exits();
    void process_samples();
    void schedule_ready();
    void cancel_run();
    void print_status(bool force);
    void block_stalled();
    int finish();

    // ── Transitions ──────────────────────────
    void launch(const TaskId& task_id);
    void on_started(const TaskId& task_id, JobResult& result);
    void on_exit(const TaskId& task_id, const ExitStatus& exit);
    void fail_task(const TaskId& task_id, const std::string& reason,
                   std::optional<ErrorKind> kind);
    void apply(const EscalationDecision& decision);
    void restart(const TaskId& task_id, Strategy strategy, const std::string& reason);
    void submit_release(const TaskId& task_id, ReleaseOutcome outcome, bool terminate);
    void watch(const TaskId& task_id, const ActiveTask& active, bool first_attempt);

    // ── Jobs (pool threads) ──────────────────
    JobResult start_attempt(const Task& task, const LaunchPlan& plan, JobResult result);
    void write_handoff_for(const Task& task, const WorkspaceAllocation& allocation,
                           const std::string& previous_runner, const std::string& next_runner,
                           uint32_t attempt, const std::string& reason);

    [[nodiscard]] LaunchPlan plan_for(const ActiveTask& active) const;
    [[nodiscard]] bool dependencies_recorded(const TaskId& task_id) const;

    Orchestrator& owner_;
    const Config& config_;
    ComponentLogger log_;
    std::ostream& out_;

    RunState state_;
    EventLog events_;
    WorkspaceAllocator allocator_;
    ProcessSupervisor supervisor_;
    SampleChannel samples_;
    ProgressSampler sampler_;
    ProgressWatchdog watchdog_;
    EscalationEngine escalation_;

    std::optional<std::filesystem::path> summary_path_;
    SteadyTime last_status_{};

    // Destroyed first: queued jobs reference the components above.
    ThreadPool pool_;
};

// ─────────────────────────────────────────────
// Loop
// ─────────────────────────────────────────────

int Orchestrator::Session::execute() {
    state_.started_at = std::chrono::system_clock::now();
    state_.started_steady = std::chrono::steady_clock::now();
    last_status_ = state_.started_steady;
    record_run_start();

    while (true) {
        collect_jobs();

        if (owner_.stop_requested() && !state_.cancelled) {
            cancel_run();
        }
        if (!state_.cancelled) {
            poll_exits();
            process_samples();
            schedule_ready();
        }
        print_status(false);

        if (state_.jobs.empty() && state_.active.empty()) {
            if (state_.graph.is_quiescent(state_.include_manual)) break;
            if (!state_.cancelled && state_.graph.ready_tasks(state_.include_manual).empty()) {
                block_stalled();
                continue;
            }
        }
        std::this_thread::sleep_for(config_.run.poll_interval);
    }
    return finish();
}

void Orchestrator::Session::record_run_start() {
    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& id : state_.graph.topological_order()) {
        const auto* task = state_.graph.get_task(id);
        tasks.push_back({
            {"id", id},
            {"phase", std::string{to_string(task->phase)}},
            {"manual", task->manual},
            {"depends_on", task->depends_on},
        });
    }
    nlohmann::json phases = nlohmann::json::array();
    for (auto phase : state_.phases) phases.push_back(std::string{to_string(phase)});

    // Preflight has already checked the project is a repository.
    auto head = owner_.vcs_->head_commit(config_.run.project_root);
    events_.append({}, events::kRunStart, {
        {"phases", phases},
        {"tasks", tasks},
        {"include_manual", state_.include_manual},
        {"project_root", config_.run.project_root.string()},
        {"config", config_.run.config_path.string()},
        {"head_commit", head ? *head : std::string{}},
    });
    for (const auto& lock : state_.locks) {
        events_.append({}, events::kPhaseLockAcquired, {
            {"phase", std::string{to_string(lock.info().phase)}},
            {"path", lock.path().string()},
            {"acquired_at", format_timestamp(lock.info().acquired_at)},
        });
    }

    for (const auto& id : state_.graph.task_ids()) {
        const auto* task = state_.graph.get_task(id);
        if (task->manual && !state_.include_manual) {
            events_.append(id, events::kTaskSkipped, {{"reason", "manual task not requested"}});
        }
    }

    log_.info("run started", {{"run_id", state_.run_id},
                              {"phases", join_phases(state_.phases, ",")},
                              {"tasks", state_.graph.schedulable(state_.include_manual).size()}});
}

void Orchestrator::Session::collect_jobs() {
    for (auto it = state_.jobs.begin(); it != state_.jobs.end();) {
        auto& pending = it->second;
        if (pending.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        JobResult result;
        try {
            result = pending.future.get();
        } catch (const std::exception& e) {
            result.task_id = it->first;
            result.kind = pending.kind;
            result.error = Error{ErrorKind::Internal, e.what()};
        }
        result.task_id = it->first;
        it = state_.jobs.erase(it);

        const auto& id = result.task_id;
        switch (result.kind) {
            case JobResult::Kind::Release:
                if (result.error) {
                    log_.warn("workspace release failed", {{"task", id},
                                                           {"error", result.error->message}});
                }
                state_.active.erase(id);
                break;

            case JobResult::Kind::Launch:
                if (result.error) {
                    state_.active.erase(id);
                    fail_task(id, result.error->describe(), result.error->kind);
                } else {
                    on_started(id, result);
                }
                break;

            case JobResult::Kind::Restart: {
                auto& active = state_.active[id];
                active.allocation = result.allocation;
                if (!result.error) {
                    on_started(id, result);
                    break;
                }
                auto now = std::chrono::system_clock::now();
                events_.append(id, events::kEscalation, {
                    {"strategy", result.strategy ? std::string{to_string(*result.strategy)} : ""},
                    {"action", "restart_failed"},
                    {"attempt", active.attempt},
                    {"reason", result.error->describe()},
                });
                log_.warn("restart failed", {{"task", id}, {"error", result.error->describe()}});
                if (state_.cancelled) {
                    fail_task(id, "run cancelled", std::nullopt);
                    submit_release(id, ReleaseOutcome::Cancelled, false);
                    break;
                }
                for (const auto& decision : escalation_.on_restart_failed(id, result.error->message, now)) {
                    apply(decision);
                    if (decision.action == EscalationAction::Restart
                        || decision.action == EscalationAction::Fail) {
                        break;
                    }
                }
                break;
            }
        }
    }
}

void Orchestrator::Session::poll_exits() {
    std::vector<std::pair<TaskId, ExitStatus>> exited;
    for (const auto& [id, active] : state_.active) {
        if (!active.process || state_.busy(id)) continue;
        if (auto exit = supervisor_.poll(id)) exited.emplace_back(id, *exit);
    }
    for (const auto& [id, exit] : exited) on_exit(id, exit);
}

void Orchestrator::Session::process_samples() {
    for (auto& sample : samples_.drain()) {
        const auto& id = sample.task_id;
        auto it = state_.active.find(id);
        if (it == state_.active.end() || !it->second.process || state_.busy(id)) continue;
        if (it->second.attempt != sample.attempt) continue;

        auto before = escalation_.state(id);
        auto verdict = watchdog_.observe(sample);

        if (verdict.new_episode) {
            events_.append(id, events::kStuckTaskDetected, {
                {"attempt", sample.attempt},
                {"idle_ms", verdict.idle.count()},
            });
            out_ << "[STUCK] " << id << " idle=" << format_elapsed(verdict.idle) << std::endl;
            log_.warn("stuck task detected", {{"task", id}, {"idle_ms", verdict.idle.count()}});
        }

        auto decisions = escalation_.on_liveness(id, verdict.liveness, verdict.new_episode, sample.at);

        if (verdict.liveness == Liveness::Active
            && (before == EscalationState::Notified || before == EscalationState::Interrupted)) {
            events_.append(id, events::kTaskRecovered, {{"after", std::string{to_string(before)}}});
            watchdog_.restart(id, sample.at);
            log_.info("task recovered", {{"task", id}, {"after", std::string{to_string(before)}}});
        }

        for (const auto& decision : decisions) {
            apply(decision);
            if (decision.action == EscalationAction::Restart
                || decision.action == EscalationAction::Fail) {
                break;
            }
        }
    }
}

bool Orchestrator::Session::dependencies_recorded(const TaskId& task_id) const {
    for (const auto& dep : state_.graph.dependencies(task_id)) {
        if (!events_.has_event(dep, events::kTaskSucceeded)) return false;
    }
    return true;
}

void Orchestrator::Session::schedule_ready() {
    for (const auto& id : state_.graph.ready_tasks(state_.include_manual)) {
        if (state_.active.contains(id) || state_.busy(id)) continue;
        if (config_.run.max_parallel > 0 && state_.active.size() >= config_.run.max_parallel) break;
        if (!dependencies_recorded(id)) continue;
        launch(id);
    }
}

void Orchestrator::Session::cancel_run() {
    state_.cancelled = true;
    out_ << "[CANCEL] stopping " << state_.active.size() << " active task(s)" << std::endl;
    log_.warn("run cancelled", {{"active", state_.active.size()}});
    sampler_.stop_all();

    std::vector<TaskId> running;
    for (const auto& [id, active] : state_.active) {
        if (active.process && !state_.busy(id)) running.push_back(id);
    }
    for (const auto& id : running) {
        fail_task(id, "run cancelled", std::nullopt);
        submit_release(id, ReleaseOutcome::Cancelled, true);
    }

    for (const auto& id : state_.graph.schedulable(state_.include_manual)) {
        const auto* task = state_.graph.get_task(id);
        if (task->status != TaskStatus::Pending) continue;
        events_.append(id, events::kTaskBlocked, {{"reason", "run cancelled"}});
        state_.graph.mark_blocked(id, "run cancelled");
        out_ << "[BLOCKED] " << id << " (run cancelled)" << std::endl;
    }
}

void Orchestrator::Session::block_stalled() {
    for (const auto& id : state_.graph.schedulable(state_.include_manual)) {
        const auto* task = state_.graph.get_task(id);
        if (is_terminal(task->status)) continue;
        events_.append(id, events::kTaskBlocked, {{"reason", "no runnable path to this task"}});
        state_.graph.mark_blocked(id, "no runnable path to this task");
        log_.error("task can never become ready", {{"task", id}});
    }
}

void Orchestrator::Session::print_status(bool force) {
    auto interval = config_.run.status_interval;
    auto now = std::chrono::steady_clock::now();
    if (!force && (interval.count() <= 0 || now - last_status_ < interval)) return;
    last_status_ = now;

    auto scheduled = state_.graph.schedulable(state_.include_manual);
    size_t done = 0;
    for (const auto& id : scheduled) {
        if (is_terminal(state_.graph.get_task(id)->status)) ++done;
    }
    out_ << "[STATUS] phase=" << join_phases(state_.phases, "+")
         << " run_id=" << state_.run_id
         << " running=" << state_.graph.count(TaskStatus::Running)
         << " done=" << done << '/' << scheduled.size()
         << " elapsed=" << format_elapsed(std::chrono::duration_cast<Millis>(now - state_.started_steady))
         << std::endl;
}

int Orchestrator::Session::finish() {
    sampler_.stop_all();
    print_status(true);

    int exit_code = kExitOk;
    if (state_.cancelled) {
        exit_code = kExitCancelled;
    } else if (state_.any_failed || state_.graph.count(TaskStatus::Blocked) > 0) {
        exit_code = state_.first_failure ? Orchestrator::exit_code_for(*state_.first_failure)
                                         : kExitTaskFailed;
    }

    nlohmann::json end{
        {"exit_code", exit_code},
        {"cancelled", state_.cancelled},
        {"succeeded", state_.graph.count(TaskStatus::Succeeded)},
        {"failed", state_.graph.count(TaskStatus::Failed)},
        {"blocked", state_.graph.count(TaskStatus::Blocked)},
        {"duration_ms", std::chrono::duration_cast<Millis>(
                            std::chrono::steady_clock::now() - state_.started_steady).count()},
    };
    if (state_.cancelled) end["error"] = "run cancelled";
    events_.append({}, events::kRunEnd, std::move(end));
    for (const auto& lock : state_.locks) {
        events_.append({}, events::kPhaseLockReleased, {{"phase", std::string{to_string(lock.info().phase)}}});
    }

    auto summary = RunSummaryGenerator::reduce(events_.snapshot());
    auto published = RunSummaryGenerator::publish(summary, config_.run.summary_dir, state_.locks);
    if (published) {
        summary_path_ = *published;
        out_ << "Summary saved to " << published->string() << std::endl;
    } else {
        out_ << "[ERROR] " << published.error().describe() << std::endl;
        log_.error("run summary not written", {{"error", published.error().message}});
    }

    log_.info("run finished", {{"run_id", state_.run_id}, {"exit_code", exit_code}});
    return exit_code;
}

// ─────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────

LaunchPlan Orchestrator::Session::plan_for(const ActiveTask& active) const {
    LaunchPlan plan;
    plan.runner = active.runner;
    plan.command = active.command;
    plan.prompt = active.prompt;
    plan.attempt = active.attempt;
    plan.extra_vars["run_id"] = state_.run_id;
    plan.extra_vars["handoff"] = active.handoff.string();
    return plan;
}

void Orchestrator::Session::launch(const TaskId& task_id) {
    const auto& task = *state_.graph.get_task(task_id);
    events_.append(task_id, events::kTaskReady, {{"depends_on", task.depends_on}});
    state_.graph.mark_ready(task_id);

    ActiveTask active;
    active.attempt = 1;
    active.runner = task.runner;
    active.command = task.command;
    active.prompt = task.prompt;
    auto plan = plan_for(active);
    state_.active[task_id] = std::move(active);

    state_.jobs[task_id] = PendingJob{
        JobResult::Kind::Launch,
        pool_.submit([this, task, plan]() {
            return start_attempt(task, plan, JobResult{.task_id = task.id});
        }),
    };
}

JobResult Orchestrator::Session::start_attempt(const Task& task, const LaunchPlan& plan,
                                               JobResult result) {
    auto allocation = allocator_.allocate(task);
    if (!allocation) {
        result.error = allocation.error();
        return result;
    }
    auto payload = allocation_json(*allocation);
    payload["attempt"] = plan.attempt;
    events_.append(task.id, events::kWorkspaceAllocated, std::move(payload));

    auto process = supervisor_.start(task, *allocation, plan);
    if (!process) {
        if (auto released = allocator_.release(*allocation, ReleaseOutcome::Failed); !released) {
            log_.warn("workspace release failed", {{"task", task.id},
                                                   {"error", released.error().message}});
        }
        events_.append(task.id, events::kWorkspaceReleased, {
            {"path", allocation->path.string()},
            {"outcome", std::string{to_string(ReleaseOutcome::Failed)}},
        });
        result.error = process.error();
        return result;
    }

    result.allocation = *allocation;
    result.process = *process;
    return result;
}

void Orchestrator::Session::on_started(const TaskId& task_id, JobResult& result) {
    auto& active = state_.active[task_id];
    active.allocation = result.allocation;
    active.process = result.process;
    const bool first_attempt = result.kind == JobResult::Kind::Launch;

    if (state_.cancelled) {
        fail_task(task_id, "run cancelled", std::nullopt);
        submit_release(task_id, ReleaseOutcome::Cancelled, true);
        return;
    }

    nlohmann::json payload{
        {"attempt", active.attempt},
        {"runner", active.runner},
        {"pid", active.process->handle.pid},
        {"command", active.process->command},
        {"workspace", active.allocation->path.string()},
        {"branch", active.allocation->branch},
        {"log", active.process->log_path.string()},
    };
    if (result.strategy) payload["strategy"] = std::string{to_string(*result.strategy)};
    events_.append(task_id, events::kTaskStart, std::move(payload));
    state_.graph.mark_running(task_id);

    if (first_attempt) {
        out_ << "[START] " << task_id << " -> " << active.process->log_path.string() << std::endl;
    } else {
        escalation_.set_last_outcome(task_id, "restarted");
        out_ << "[START] " << task_id << " attempt=" << active.attempt
             << " runner=" << active.runner << " -> " << active.process->log_path.string()
             << std::endl;
    }
    watch(task_id, active, first_attempt);
}

void Orchestrator::Session::watch(const TaskId& task_id, const ActiveTask& active,
                                  bool first_attempt) {
    const auto& task = *state_.graph.get_task(task_id);
    auto now = std::chrono::system_clock::now();

    if (first_attempt) {
        EscalationProfile profile{
            .policy = task.escalation,
            .can_switch_agent = !task.escalation.alternate_runner.empty()
                                && config_.runners.contains(task.escalation.alternate_runner),
            .can_simplify = !task.reduced_prompt.empty(),
        };
        escalation_.attach(task_id, std::move(profile));
        watchdog_.attach(task_id, task.watchdog, now);
    } else {
        watchdog_.restart(task_id, now);
    }

    if (!task.watchdog.enabled) return;
    sampler_.start(task_id, active.attempt, task.watchdog, ProbeContext{
        .workspace = active.allocation->path,
        .log_path = active.process->log_path,
        .repo_root = config_.run.project_root,
        .branch = active.allocation->branch,
        .window_start = now,
        .now = now,
    });
}

void Orchestrator::Session::on_exit(const TaskId& task_id, const ExitStatus& exit) {
    auto& active = state_.active[task_id];
    sampler_.stop(task_id);
    supervisor_.forget(task_id);
    active.process.reset();

    nlohmann::json payload{{"attempt", active.attempt}, {"exit_code", exit.code},
                           {"status", describe(exit)}};
    if (exit.signal) payload["signal"] = *exit.signal;
    events_.append(task_id, events::kProcessExited, std::move(payload));

    // A worker that gives up after an interrupt moves on down the ladder.
    if (!exit.success() && escalation_.state(task_id) == EscalationState::Interrupted) {
        auto decisions = escalation_.on_interrupt_exit(task_id, describe(exit),
                                                       std::chrono::system_clock::now());
        for (const auto& decision : decisions) {
            apply(decision);
            if (decision.action == EscalationAction::Restart
                || decision.action == EscalationAction::Fail) {
                break;
            }
        }
        if (!decisions.empty()) return;
    }

    watchdog_.detach(task_id);
    escalation_.detach(task_id);

    if (exit.success()) {
        events_.append(task_id, events::kTaskSucceeded, {{"attempt", active.attempt}});
        state_.graph.mark_succeeded(task_id);
        out_ << "[DONE] " << task_id << " exit=0" << std::endl;
        submit_release(task_id, ReleaseOutcome::Succeeded, false);
        return;
    }
    fail_task(task_id, "worker " + describe(exit), std::nullopt);
    submit_release(task_id, ReleaseOutcome::Failed, false);
}

void Orchestrator::Session::fail_task(const TaskId& task_id, const std::string& reason,
                                      std::optional<ErrorKind> kind) {
    nlohmann::json payload{{"reason", reason}};
    if (kind) payload["error"] = std::string{to_string(*kind)};
    events_.append(task_id, events::kTaskFailed, std::move(payload));
    state_.graph.mark_failed(task_id, reason);

    if (!state_.any_failed) {
        state_.any_failed = true;
        state_.first_failure = kind;
    }
    out_ << "[FAIL] " << task_id << ": " << reason << std::endl;
    log_.error("task failed", {{"task", task_id}, {"reason", reason}});

    for (const auto& blocked : state_.graph.block_dependents(task_id)) {
        const auto* task = state_.graph.get_task(blocked);
        if (task->manual && !state_.include_manual) continue;
        events_.append(blocked, events::kTaskBlocked, {{"reason", task->reason}});
        out_ << "[BLOCKED] " << blocked << " <- " << task_id << std::endl;
    }
}

void Orchestrator::Session::apply(const EscalationDecision& decision) {
    const auto& id = decision.task_id;
    std::string strategy = decision.strategy ? std::string{to_string(*decision.strategy)} : "";
    events_.append(id, events::kEscalation, {
        {"strategy", strategy},
        {"action", std::string{to_string(decision.action)}},
        {"attempt", decision.attempt},
        {"reason", decision.reason},
    });
    out_ << "[ESCALATE] " << id << ' ' << to_string(decision.action);
    if (!strategy.empty()) out_ << " strategy=" << strategy << " attempt=" << decision.attempt;
    out_ << std::endl;

    switch (decision.action) {
        case EscalationAction::Notify:
            log_.warn("task appears stuck", {{"task", id}, {"reason", decision.reason}});
            break;

        case EscalationAction::Interrupt:
            if (auto sent = supervisor_.signal(id, SignalTier::Cooperative); !sent) {
                log_.warn("interrupt failed", {{"task", id}, {"error", sent.error().message}});
            }
            break;

        case EscalationAction::Restart:
            restart(id, *decision.strategy, decision.reason);
            break;

        case EscalationAction::Fail:
            sampler_.stop(id);
            watchdog_.detach(id);
            fail_task(id, decision.reason, ErrorKind::EscalationExhausted);
            submit_release(id, ReleaseOutcome::Failed, true);
            break;
    }
}

void Orchestrator::Session::restart(const TaskId& task_id, Strategy strategy,
                                    const std::string& reason) {
    auto& active = state_.active.at(task_id);
    sampler_.stop(task_id);

    const auto& declared = *state_.graph.get_task(task_id);
    const std::string previous_runner = active.runner;

    switch (strategy) {
        case Strategy::KillAndRetry:
            active.runner = declared.runner;
            active.command = declared.command;
            active.prompt = declared.prompt;
            break;
        case Strategy::SwitchAgent: {
            const auto& alternate = config_.runners.at(declared.escalation.alternate_runner);
            active.runner = alternate.name;
            active.command = alternate.command;
            active.handoff = handoff_path(config_.run.logs_dir, task_id);
            break;
        }
        case Strategy::SimplifyScope:
            state_.graph.set_prompt(task_id, declared.reduced_prompt);
            active.prompt = declared.reduced_prompt;
            break;
        case Strategy::Notify:
        case Strategy::Interrupt:
            return;
    }

    ++active.attempt;
    active.process.reset();
    auto plan = plan_for(active);
    Task task = *state_.graph.get_task(task_id);
    auto old_allocation = active.allocation;
    auto grace = task.escalation.terminate_grace;

    state_.jobs[task_id] = PendingJob{
        JobResult::Kind::Restart,
        pool_.submit([this, task, plan, old_allocation, strategy, previous_runner, reason, grace]() {
            supervisor_.terminate(task.id, grace);
            supervisor_.forget(task.id);

            if (strategy == Strategy::SwitchAgent && old_allocation) {
                write_handoff_for(task, *old_allocation, previous_runner, plan.runner,
                                  plan.attempt, reason);
            }
            if (old_allocation && old_allocation->live()) {
                auto released = old_allocation;
                if (auto ok = allocator_.release(*released, ReleaseOutcome::Restart); !ok) {
                    log_.warn("workspace release failed", {{"task", task.id},
                                                           {"error", ok.error().message}});
                }
                events_.append(task.id, events::kWorkspaceReleased, {
                    {"path", released->path.string()},
                    {"outcome", std::string{to_string(ReleaseOutcome::Restart)}},
                });
            }
            return start_attempt(task, plan, JobResult{.task_id = task.id,
                                                       .kind = JobResult::Kind::Restart,
                                                       .strategy = strategy});
        }),
    };
}

void Orchestrator::Session::write_handoff_for(const Task& task,
                                              const WorkspaceAllocation& allocation,
                                              const std::string& previous_runner,
                                              const std::string& next_runner,
                                              uint32_t attempt, const std::string& reason) {
    auto& vcs = allocator_.vcs();
    HandoffInput input{
        .task_id = task.id,
        .branch = allocation.branch,
        .workspace = allocation.path,
        .previous_runner = previous_runner,
        .next_runner = next_runner,
        .attempt = attempt,
        .reason = reason,
        .commits = vcs.commit_subjects(config_.run.project_root, allocation.branch,
                                       allocation.base_commit),
        .log_tail = {},
        .diff_stat = vcs.diff_stat(allocation.path, allocation.base_commit),
    };
    for (auto& line : last_lines(read_log_tail(task.log_path), 20)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            input.log_tail.push_back(std::move(line));
        }
    }

    auto written = write_handoff(config_.run.logs_dir, input);
    if (!written) {
        log_.warn("handoff not written", {{"task", task.id}, {"error", written.error().message}});
        return;
    }
    events_.append(task.id, events::kHandoffWritten, {
        {"path", written->string()},
        {"next_runner", next_runner},
        {"commits", input.commits.size()},
    });
}

void Orchestrator::Session::submit_release(const TaskId& task_id, ReleaseOutcome outcome,
                                           bool terminate) {
    auto& active = state_.active[task_id];
    auto allocation = active.allocation;
    active.process.reset();
    auto grace = state_.graph.get_task(task_id)->escalation.terminate_grace;

    state_.jobs[task_id] = PendingJob{
        JobResult::Kind::Release,
        pool_.submit([this, task_id, allocation, outcome, terminate, grace]() {
            JobResult result{.task_id = task_id, .kind = JobResult::Kind::Release};
            if (terminate) {
                supervisor_.terminate(task_id, grace);
                supervisor_.forget(task_id);
            }
            if (allocation && allocation->live()) {
                auto released = allocation;
                if (auto ok = allocator_.release(*released, outcome); !ok) {
                    result.error = ok.error();
                }
                events_.append(task_id, events::kWorkspaceReleased, {
                    {"path", released->path.string()},
                    {"outcome", std::string{to_string(outcome)}},
                });
            }
            return result;
        }),
    };
}

// ═══════════════════════════════════════════════
// Orchestrator
// ═══════════════════════════════════════════════

Orchestrator::Orchestrator(Options opts, Logger& logger)
    : config_(std::move(opts.config))
    , logger_(logger)
    , log_(logger, "orchestrator")
    , console_(opts.console ? opts.console : &std::cout)
    , vcs_(opts.vcs ? std::move(opts.vcs) : std::shared_ptr<IVcsBackend>(std::make_shared<GitVcs>()))
    , backends_(opts.backends ? std::move(*opts.backends)
                              : BackendRegistry::from_config(config_.runners)) {}

Orchestrator::~Orchestrator() = default;

std::filesystem::path Orchestrator::events_path() const {
    return config_.run.logs_dir / "framework-run.jsonl";
}

RunId Orchestrator::generate_run_id() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);

    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist;
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x", dist(rd));
    return std::string{stamp} + "-" + suffix;
}

int Orchestrator::exit_code_for(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Config:
        case ErrorKind::DependencyCycle:     return kExitPreflight;
        case ErrorKind::PhaseLockHeld:       return kExitLockHeld;
        case ErrorKind::EscalationExhausted: return kExitEscalationExhausted;
        case ErrorKind::WorkspaceConflict:   return kExitWorkspaceConflict;
        case ErrorKind::ProcessLaunch:       return kExitProcessLaunch;
        case ErrorKind::Io:
        case ErrorKind::Internal:            return kExitTaskFailed;
    }
    return kExitTaskFailed;
}

RunReport Orchestrator::run(const RunRequest& request) {
    RunReport report;
    report.run_id = generate_run_id();
    auto& out = *console_;

    auto abort_with = [&](Error error) {
        out << "[ERROR] " << error.describe() << std::endl;
        log_.error("run aborted", {{"run_id", report.run_id}, {"error", error.describe()}});
        report.exit_code = exit_code_for(error.kind);
        report.error = std::move(error);
        return report;
    };

    std::vector<Phase> phases;
    for (auto phase : request.phases.empty() ? std::vector<Phase>{Phase::Main} : request.phases) {
        if (std::find(phases.begin(), phases.end(), phase) == phases.end()) phases.push_back(phase);
    }

    // ── Graph ─────────────────────────────────
    BuildOptions build{
        .phases = phases,
        .include_manual = request.include_manual,
        .run_id = report.run_id,
        .project_root = config_.run.project_root,
        .logs_dir = config_.run.logs_dir,
        .runners = config_.runners,
    };
    auto graph = TaskGraphBuilder::build(config_.tasks, build);
    if (!graph) return abort_with(graph.error());

    auto scheduled = graph->schedulable(request.include_manual);
    if (scheduled.empty()) {
        return abort_with(Error{ErrorKind::Config,
                                "No tasks selected for phase(s) " + join_phases(phases, ", ")});
    }
    for (const auto& id : graph->topological_order()) {
        if (std::find(scheduled.begin(), scheduled.end(), id) != scheduled.end()) {
            report.order.push_back(id);
        }
    }

    // ── Preflight ─────────────────────────────
    if (auto ok = run_preflight(*graph, request.include_manual, config_, *vcs_); !ok) {
        return abort_with(ok.error());
    }

    if (request.dry_run) {
        for (const auto& id : report.order) {
            const auto* task = graph->get_task(id);
            out << "[DRY-RUN] " << id << " phase=" << to_string(task->phase)
                << " branch=" << task->branch
                << " workspace=" << task->workspace_path.string()
                << " runner=" << task->runner;
            if (!task->depends_on.empty()) {
                out << " after=";
                for (size_t i = 0; i < task->depends_on.size(); ++i) {
                    out << (i ? "," : "") << task->depends_on[i];
                }
            }
            out << std::endl;
        }
        log_.info("dry run complete", {{"run_id", report.run_id}, {"tasks", report.order.size()}});
        return report;
    }

    // ── Phase locks ───────────────────────────
    RunState state;
    for (auto phase : phases) {
        if (is_privileged(config_, phase)) continue;
        if (auto clear = PhaseLock::ensure_clear(config_.run.logs_dir, Phase::Main); !clear) {
            return abort_with(clear.error());
        }
    }
    for (auto phase : phases) {
        if (!is_privileged(config_, phase)) continue;
        auto lock = PhaseLock::acquire(config_.run.logs_dir, phase, report.run_id);
        if (!lock) return abort_with(lock.error());
        state.locks.push_back(std::move(*lock));
    }

    // ── Coordinating loop ─────────────────────
    state.run_id = report.run_id;
    state.phases = phases;
    state.include_manual = request.include_manual;
    state.graph = std::move(*graph);

    report.events_path = events_path();
    Session session(*this, std::move(state));
    report.exit_code = session.execute();
    report.summary_path = session.summary_path();
    return report;
}

}  // namespace agent_orchestrator
