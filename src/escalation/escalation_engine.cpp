/**
 * @file escalation_engine.cpp
 * @brief EscalationEngine implementation.
 * @author Dimitris Kafetzis
 *
 * The strategy cursor persists across stuck episodes of a task. Each
 * strategy has an invocation budget (kill_and_retry: max_retries, others:
 * one); spent or inapplicable strategies are skipped, and running off the
 * end of the list fails the task.
 */

#include "escalation/escalation_engine.hpp"

namespace agent_orchestrator {

uint32_t EscalationEngine::budget(const EscalationPolicy& policy, Strategy strategy) {
    return strategy == Strategy::KillAndRetry ? policy.max_retries : 1;
}

void EscalationEngine::attach(const TaskId& task_id, EscalationProfile profile) {
    Track track;
    track.profile = std::move(profile);
    tracks_.insert_or_assign(task_id, std::move(track));
}

void EscalationEngine::detach(const TaskId& task_id) {
    tracks_.erase(task_id);
}

bool EscalationEngine::applicable(const Track& track, Strategy strategy, bool process_alive) const {
    switch (strategy) {
        case Strategy::Notify:
        case Strategy::Interrupt:
            return process_alive;
        case Strategy::KillAndRetry:
            return true;
        case Strategy::SwitchAgent:
            return track.profile.can_switch_agent;
        case Strategy::SimplifyScope:
            return track.profile.can_simplify;
    }
    return false;
}

void EscalationEngine::close_record(Track& track, std::string outcome) {
    if (!track.open_record) return;
    records_[*track.open_record].outcome = std::move(outcome);
    track.open_record.reset();
}

std::vector<EscalationDecision> EscalationEngine::evaluate(const TaskId& task_id, Track& track,
                                                           Timestamp now, bool process_alive,
                                                           const std::string& trigger) {
    std::vector<EscalationDecision> decisions;
    const auto& policy = track.profile.policy;
    track.deadline.reset();

    while (true) {
        if (track.cursor >= policy.strategies.size()) {
            std::string spent;
            for (auto strategy : policy.strategies) {
                if (!spent.empty()) spent += ", ";
                spent += std::string{to_string(strategy)} + " x" + std::to_string(track.used[strategy]);
            }
            track.state = EscalationState::Failed;
            decisions.push_back(EscalationDecision{
                .task_id = task_id,
                .action = EscalationAction::Fail,
                .strategy = std::nullopt,
                .attempt = 0,
                .reason = "escalation strategies exhausted after " + trigger + " (" + spent + ")",
            });
            return decisions;
        }

        auto strategy = policy.strategies[track.cursor];
        if (!applicable(track, strategy, process_alive)
            || track.used[strategy] >= budget(policy, strategy)) {
            ++track.cursor;
            continue;
        }

        auto attempt = ++track.used[strategy];
        EscalationDecision decision{
            .task_id = task_id,
            .action = EscalationAction::Notify,
            .strategy = strategy,
            .attempt = attempt,
            .reason = trigger,
        };
        EscalationRecord record{.task_id = task_id, .strategy = strategy,
                                .attempt_count = attempt, .outcome = {}, .at = now};

        switch (strategy) {
            case Strategy::Notify:
                record.outcome = "notified";
                records_.push_back(std::move(record));
                decisions.push_back(std::move(decision));
                if (policy.notify_window.count() == 0) {
                    continue;  // nothing to wait for
                }
                track.open_record = records_.size() - 1;
                track.state = EscalationState::Notified;
                track.deadline = now + policy.notify_window;
                return decisions;

            case Strategy::Interrupt:
                record.outcome = "interrupted";
                records_.push_back(std::move(record));
                track.open_record = records_.size() - 1;
                decision.action = EscalationAction::Interrupt;
                decisions.push_back(std::move(decision));
                track.state = EscalationState::Interrupted;
                track.deadline = now + policy.interrupt_grace;
                return decisions;

            case Strategy::KillAndRetry:
            case Strategy::SwitchAgent:
            case Strategy::SimplifyScope:
                record.outcome = "restarting";
                records_.push_back(std::move(record));
                track.open_record = records_.size() - 1;
                decision.action = EscalationAction::Restart;
                decisions.push_back(std::move(decision));
                track.state = strategy == Strategy::KillAndRetry ? EscalationState::Retried
                            : strategy == Strategy::SwitchAgent  ? EscalationState::Reassigned
                                                                 : EscalationState::Simplified;
                return decisions;
        }
    }
}

std::vector<EscalationDecision> EscalationEngine::on_liveness(const TaskId& task_id,
                                                              Liveness liveness,
                                                              bool new_episode, Timestamp now) {
    auto it = tracks_.find(task_id);
    if (it == tracks_.end()) return {};
    auto& track = it->second;
    if (track.state == EscalationState::Failed) return {};

    switch (liveness) {
        case Liveness::Active:
            if (track.state == EscalationState::Notified
                || track.state == EscalationState::Interrupted) {
                close_record(track, "recovered");
            }
            track.state = EscalationState::Healthy;
            track.deadline.reset();
            return {};

        case Liveness::Uncertain:
            return {};

        case Liveness::Stuck:
            if (new_episode) {
                close_record(track, "no_response");
                track.state = EscalationState::Stuck;
                return evaluate(task_id, track, now, true, "stuck episode");
            }
            if (track.deadline && now >= *track.deadline) {
                bool interrupted = track.state == EscalationState::Interrupted;
                close_record(track, "no_response");
                return evaluate(task_id, track, now, true,
                                interrupted ? "interrupt grace elapsed" : "notify window elapsed");
            }
            return {};
    }
    return {};
}

std::vector<EscalationDecision> EscalationEngine::on_restart_failed(const TaskId& task_id,
                                                                    const std::string& reason,
                                                                    Timestamp now) {
    auto it = tracks_.find(task_id);
    if (it == tracks_.end()) return {};
    auto& track = it->second;
    if (track.state == EscalationState::Failed) return {};

    close_record(track, "launch_failed");
    track.state = EscalationState::Stuck;
    return evaluate(task_id, track, now, false, "restart failure: " + reason);
}

std::vector<EscalationDecision> EscalationEngine::on_interrupt_exit(const TaskId& task_id,
                                                                    const std::string& exit_status,
                                                                    Timestamp now) {
    auto it = tracks_.find(task_id);
    if (it == tracks_.end()) return {};
    auto& track = it->second;
    if (track.state != EscalationState::Interrupted) return {};

    close_record(track, "exited");
    track.state = EscalationState::Stuck;
    return evaluate(task_id, track, now, false, "exited after interrupt (" + exit_status + ")");
}

void EscalationEngine::set_last_outcome(const TaskId& task_id, std::string outcome) {
    auto it = tracks_.find(task_id);
    if (it != tracks_.end() && it->second.open_record) {
        close_record(it->second, std::move(outcome));
        return;
    }
    for (auto rec = records_.rbegin(); rec != records_.rend(); ++rec) {
        if (rec->task_id == task_id) {
            rec->outcome = std::move(outcome);
            return;
        }
    }
}

EscalationState EscalationEngine::state(const TaskId& task_id) const {
    auto it = tracks_.find(task_id);
    return it == tracks_.end() ? EscalationState::Healthy : it->second.state;
}

uint32_t EscalationEngine::attempts(const TaskId& task_id, Strategy strategy) const {
    auto it = tracks_.find(task_id);
    if (it == tracks_.end()) return 0;
    auto used = it->second.used.find(strategy);
    return used == it->second.used.end() ? 0 : used->second;
}

std::vector<EscalationRecord> EscalationEngine::records_for(const TaskId& task_id) const {
    std::vector<EscalationRecord> out;
    for (const auto& record : records_) {
        if (record.task_id == task_id) out.push_back(record);
    }
    return out;
}

}  // namespace agent_orchestrator
