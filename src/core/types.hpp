/**
 * @file types.hpp
 * @brief Fundamental types used throughout agent_orchestrator.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, Phase, TaskStatus, escalation strategies, and the other
 * shared vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// Identity & Time Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using RunId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Phase
// ─────────────────────────────────────────────

/**
 * @brief Mutually-exclusive class of task runs.
 */
enum class Phase : uint8_t {
    Discovery,
    Main,
    Legacy,
    Post
};

inline constexpr std::array<Phase, 4> kAllPhases = {
    Phase::Discovery, Phase::Main, Phase::Legacy, Phase::Post};

[[nodiscard]] constexpr std::string_view to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Discovery: return "discovery";
        case Phase::Main:      return "main";
        case Phase::Legacy:    return "legacy";
        case Phase::Post:      return "post";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Phase> parse_phase(std::string_view name) noexcept {
    for (auto phase : kAllPhases) {
        if (to_string(phase) == name) return phase;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Waiting for dependencies
    Ready,         ///< All dependencies succeeded, awaiting a workspace
    Running,       ///< Worker process alive
    Succeeded,     ///< Worker exited with status 0
    Failed,        ///< Non-zero exit, launch failure, or exhausted escalation
    Blocked        ///< A dependency failed; never scheduled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Ready:     return "ready";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed:    return "failed";
        case TaskStatus::Blocked:   return "blocked";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Succeeded
        || status == TaskStatus::Failed
        || status == TaskStatus::Blocked;
}

[[nodiscard]] constexpr std::optional<TaskStatus> parse_task_status(std::string_view name) noexcept {
    constexpr std::array all = {TaskStatus::Pending, TaskStatus::Ready, TaskStatus::Running,
                                TaskStatus::Succeeded, TaskStatus::Failed, TaskStatus::Blocked};
    for (auto status : all) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Escalation Strategy
// ─────────────────────────────────────────────

/**
 * @brief Recovery strategies, in increasing intrusiveness.
 */
enum class Strategy : uint8_t {
    Notify,
    Interrupt,
    KillAndRetry,
    SwitchAgent,
    SimplifyScope
};

[[nodiscard]] constexpr std::string_view to_string(Strategy strategy) noexcept {
    switch (strategy) {
        case Strategy::Notify:        return "notify";
        case Strategy::Interrupt:     return "interrupt";
        case Strategy::KillAndRetry:  return "kill_and_retry";
        case Strategy::SwitchAgent:   return "switch_agent";
        case Strategy::SimplifyScope: return "simplify_scope";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Strategy> parse_strategy(std::string_view name) noexcept {
    constexpr std::array all = {Strategy::Notify, Strategy::Interrupt, Strategy::KillAndRetry,
                                Strategy::SwitchAgent, Strategy::SimplifyScope};
    for (auto strategy : all) {
        if (to_string(strategy) == name) return strategy;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// Watchdog Indicators
// ─────────────────────────────────────────────

enum class Indicator : uint8_t {
    Filesystem,      ///< File under the workspace modified within the window
    VersionControl,  ///< New commit on the task branch within the window
    LogGrowth,       ///< Task log grew by more than the byte threshold
    OutputPattern    ///< Log tail has new, non-degenerate content
};

inline constexpr size_t kIndicatorCount = 4;

[[nodiscard]] constexpr size_t index_of(Indicator indicator) noexcept {
    return static_cast<size_t>(indicator);
}

[[nodiscard]] constexpr std::string_view to_string(Indicator indicator) noexcept {
    switch (indicator) {
        case Indicator::Filesystem:     return "filesystem";
        case Indicator::VersionControl: return "vcs";
        case Indicator::LogGrowth:      return "log_growth";
        case Indicator::OutputPattern:  return "output_pattern";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Indicator> parse_indicator(std::string_view name) noexcept {
    constexpr std::array all = {Indicator::Filesystem, Indicator::VersionControl,
                                Indicator::LogGrowth, Indicator::OutputPattern};
    for (auto indicator : all) {
        if (to_string(indicator) == name) return indicator;
    }
    return std::nullopt;
}

enum class Liveness : uint8_t {
    Active,
    Uncertain,
    Stuck
};

[[nodiscard]] constexpr std::string_view to_string(Liveness liveness) noexcept {
    switch (liveness) {
        case Liveness::Active:    return "active";
        case Liveness::Uncertain: return "uncertain";
        case Liveness::Stuck:     return "stuck";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Process Signalling
// ─────────────────────────────────────────────

/**
 * @brief How hard to ask a worker process to stop.
 *
 * Cooperative maps to the runner's configured interrupt signal, Graceful to
 * SIGTERM, Forceful to SIGKILL.
 */
enum class SignalTier : uint8_t {
    Cooperative,
    Graceful,
    Forceful
};

[[nodiscard]] constexpr std::string_view to_string(SignalTier tier) noexcept {
    switch (tier) {
        case SignalTier::Cooperative: return "cooperative";
        case SignalTier::Graceful:    return "graceful";
        case SignalTier::Forceful:    return "forceful";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// ISO 8601 (UTC, millisecond precision) rendering of a wall-clock time.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

/// Inverse of format_timestamp; nullopt on malformed input.
[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);

/// "mm:ss" or "hh:mm:ss" rendering of an elapsed duration.
[[nodiscard]] std::string format_elapsed(Millis elapsed);

}  // namespace agent_orchestrator
