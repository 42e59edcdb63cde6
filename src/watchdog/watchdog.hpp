/**
 * @file watchdog.hpp
 * @brief Composite liveness decision over indicator samples.
 * @author Dimitris Kafetzis
 *
 * Active when any indicator signals; Uncertain until stuck_threshold has
 * elapsed since the last progress; Stuck afterwards. Time comes from the
 * samples themselves, so the decision is deterministic under test.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "watchdog/indicators.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace agent_orchestrator {

struct WatchdogState {
    TaskId task_id;
    std::array<std::optional<Timestamp>, kIndicatorCount> last_signal;
    Timestamp last_progress_at{};
    std::optional<Timestamp> stuck_since;
    uint32_t episodes = 0;
};

struct WatchdogVerdict {
    Liveness liveness = Liveness::Uncertain;
    bool new_episode = false;                       ///< First Stuck verdict of an episode
    Millis idle{0};                                 ///< Time since last progress
};

/**
 * @brief Owns every WatchdogState; mutated only by the coordinating loop.
 */
class ProgressWatchdog {
public:
    void attach(const TaskId& task_id, const WatchdogPolicy& policy, Timestamp now);
    void detach(const TaskId& task_id);

    /// Full threshold restart from `now` (after a restart or an interrupt recovery).
    void restart(const TaskId& task_id, Timestamp now);

    /// Fold one sample into the task's state. Unknown tasks yield Uncertain.
    WatchdogVerdict observe(const IndicatorSample& sample);

    [[nodiscard]] const WatchdogState* state(const TaskId& task_id) const;
    [[nodiscard]] bool attached(const TaskId& task_id) const;

private:
    struct Entry {
        WatchdogPolicy policy;
        WatchdogState state;
    };

    std::unordered_map<TaskId, Entry> entries_;
};

}  // namespace agent_orchestrator
