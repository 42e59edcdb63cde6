/**
 * @file watchdog.cpp
 * @brief ProgressWatchdog implementation.
 * @author Dimitris Kafetzis
 */

#include "watchdog/watchdog.hpp"

namespace agent_orchestrator {

void ProgressWatchdog::attach(const TaskId& task_id, const WatchdogPolicy& policy, Timestamp now) {
    Entry entry{.policy = policy, .state = {}};
    entry.state.task_id = task_id;
    entry.state.last_progress_at = now;
    entries_.insert_or_assign(task_id, std::move(entry));
}

void ProgressWatchdog::detach(const TaskId& task_id) {
    entries_.erase(task_id);
}

void ProgressWatchdog::restart(const TaskId& task_id, Timestamp now) {
    auto it = entries_.find(task_id);
    if (it == entries_.end()) return;
    it->second.state.last_progress_at = now;
    it->second.state.stuck_since.reset();
}

WatchdogVerdict ProgressWatchdog::observe(const IndicatorSample& sample) {
    auto it = entries_.find(sample.task_id);
    if (it == entries_.end()) return {};
    auto& [policy, state] = it->second;

    // Growth that only adds more of the same repetition is not progress.
    const auto* pattern = sample.reading(Indicator::OutputPattern);
    bool degenerate = pattern && pattern->degenerate;

    bool any = false;
    for (const auto& reading : sample.readings) {
        if (!reading.signaled || !policy.uses(reading.kind)) continue;
        if (reading.kind == Indicator::LogGrowth && degenerate) continue;
        state.last_signal[index_of(reading.kind)] = sample.at;
        any = true;
    }

    WatchdogVerdict verdict;
    if (any) {
        state.last_progress_at = sample.at;
        state.stuck_since.reset();
        verdict.liveness = Liveness::Active;
        return verdict;
    }

    verdict.idle = std::chrono::duration_cast<Millis>(sample.at - state.last_progress_at);
    if (verdict.idle < policy.stuck_threshold) {
        verdict.liveness = Liveness::Uncertain;
        return verdict;
    }

    verdict.liveness = Liveness::Stuck;
    if (!state.stuck_since) {
        state.stuck_since = sample.at;
        ++state.episodes;
        verdict.new_episode = true;
    }
    return verdict;
}

const WatchdogState* ProgressWatchdog::state(const TaskId& task_id) const {
    auto it = entries_.find(task_id);
    return it == entries_.end() ? nullptr : &it->second.state;
}

bool ProgressWatchdog::attached(const TaskId& task_id) const {
    return entries_.contains(task_id);
}

}  // namespace agent_orchestrator
