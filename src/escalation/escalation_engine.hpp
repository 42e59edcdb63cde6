/**
 * @file escalation_engine.hpp
 * @brief Per-task escalation state machine driven by watchdog verdicts.
 * @author Dimitris Kafetzis
 *
 * States: healthy -> stuck -> {notified | interrupted | retried | reassigned |
 * simplified} -> healthy | failed. The engine only decides; the coordinating
 * loop carries out each decision (signal, restart, fail).
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agent_orchestrator {

enum class EscalationState : uint8_t {
    Healthy,
    Stuck,
    Notified,
    Interrupted,
    Retried,
    Reassigned,
    Simplified,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(EscalationState state) noexcept {
    switch (state) {
        case EscalationState::Healthy:     return "healthy";
        case EscalationState::Stuck:       return "stuck";
        case EscalationState::Notified:    return "notified";
        case EscalationState::Interrupted: return "interrupted";
        case EscalationState::Retried:     return "retried";
        case EscalationState::Reassigned:  return "reassigned";
        case EscalationState::Simplified:  return "simplified";
        case EscalationState::Failed:      return "failed";
    }
    return "unknown";
}

enum class EscalationAction : uint8_t {
    Notify,      ///< Warn only
    Interrupt,   ///< Cooperative signal to the worker
    Restart,     ///< Terminate, re-allocate, relaunch (strategy says how)
    Fail         ///< EscalationExhausted
};

[[nodiscard]] constexpr std::string_view to_string(EscalationAction action) noexcept {
    switch (action) {
        case EscalationAction::Notify:    return "notify";
        case EscalationAction::Interrupt: return "interrupt";
        case EscalationAction::Restart:   return "restart";
        case EscalationAction::Fail:      return "fail";
    }
    return "unknown";
}

struct EscalationDecision {
    TaskId task_id;
    EscalationAction action = EscalationAction::Notify;
    std::optional<Strategy> strategy;               ///< Absent for Fail
    uint32_t attempt = 0;                           ///< Invocation count of the strategy
    std::string reason;
};

struct EscalationRecord {
    TaskId task_id;
    Strategy strategy = Strategy::Notify;
    uint32_t attempt_count = 0;
    std::string outcome;                            ///< pending, recovered, no_response, ...
    Timestamp at{};
};

/**
 * @brief What the engine needs to know about a task up front.
 */
struct EscalationProfile {
    EscalationPolicy policy;
    bool can_switch_agent = false;                  ///< An alternate runner exists
    bool can_simplify = false;                      ///< A reduced prompt exists
};

class EscalationEngine {
public:
    void attach(const TaskId& task_id, EscalationProfile profile);

    /// Stop tracking; records are kept for the summary.
    void detach(const TaskId& task_id);

    /**
     * @brief React to one watchdog verdict.
     *
     * A new stuck episode evaluates the next applicable strategy. A pending
     * notify window or interrupt grace that expires while still stuck moves
     * on to the following one. Activity returns the task to healthy.
     */
    std::vector<EscalationDecision> on_liveness(const TaskId& task_id, Liveness liveness,
                                                bool new_episode, Timestamp now);

    /**
     * @brief A restart could not relaunch the worker; counts as a new episode.
     *
     * Only strategies that do not need a live process are considered.
     */
    std::vector<EscalationDecision> on_restart_failed(const TaskId& task_id,
                                                      const std::string& reason, Timestamp now);

    /**
     * @brief The worker exited while an interrupt was pending.
     *
     * Treated as an interrupt that produced no activity: the ladder moves on
     * with no live process. Returns nothing unless the task is interrupted.
     */
    std::vector<EscalationDecision> on_interrupt_exit(const TaskId& task_id,
                                                      const std::string& exit_status, Timestamp now);

    /// Annotate the latest record of a task (e.g. "restarted", "launch_failed").
    void set_last_outcome(const TaskId& task_id, std::string outcome);

    [[nodiscard]] EscalationState state(const TaskId& task_id) const;
    [[nodiscard]] uint32_t attempts(const TaskId& task_id, Strategy strategy) const;
    [[nodiscard]] const std::vector<EscalationRecord>& records() const noexcept { return records_; }
    [[nodiscard]] std::vector<EscalationRecord> records_for(const TaskId& task_id) const;

    /// Invocations allowed for `strategy` under `policy`.
    [[nodiscard]] static uint32_t budget(const EscalationPolicy& policy, Strategy strategy);

private:
    struct Track {
        EscalationProfile profile;
        EscalationState state = EscalationState::Healthy;
        size_t cursor = 0;
        std::unordered_map<Strategy, uint32_t> used;
        std::optional<Timestamp> deadline;          ///< Notify window / interrupt grace
        std::optional<size_t> open_record;          ///< Index into records_
    };

    std::vector<EscalationDecision> evaluate(const TaskId& task_id, Track& track, Timestamp now,
                                             bool process_alive, const std::string& trigger);
    [[nodiscard]] bool applicable(const Track& track, Strategy strategy, bool process_alive) const;
    void close_record(Track& track, std::string outcome);

    std::unordered_map<TaskId, Track> tracks_;
    std::vector<EscalationRecord> records_;
};

}  // namespace agent_orchestrator
