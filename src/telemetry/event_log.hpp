/**
 * @file event_log.hpp
 * @brief Append-only structured event stream for one orchestration run.
 * @author Dimitris Kafetzis
 *
 * Every scheduling decision and state transition is appended here before it
 * is acted upon. Records are NDJSON: {"seq","ts","run_id","task","event","payload"}.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agent_orchestrator {

namespace events {

inline constexpr std::string_view kRunStart           = "run_start";
inline constexpr std::string_view kRunEnd             = "run_end";
inline constexpr std::string_view kPhaseLockAcquired  = "phase_lock_acquired";
inline constexpr std::string_view kPhaseLockReleased  = "phase_lock_released";
inline constexpr std::string_view kTaskSkipped        = "task_skipped";
inline constexpr std::string_view kTaskReady          = "task_ready";
inline constexpr std::string_view kWorkspaceAllocated = "workspace_allocated";
inline constexpr std::string_view kWorkspaceReleased  = "workspace_released";
inline constexpr std::string_view kTaskStart          = "task_start";
inline constexpr std::string_view kProcessExited      = "process_exited";
inline constexpr std::string_view kTaskSucceeded      = "task_succeeded";
inline constexpr std::string_view kTaskFailed         = "task_failed";
inline constexpr std::string_view kTaskBlocked        = "task_blocked";
inline constexpr std::string_view kStuckTaskDetected  = "stuck_task_detected";
inline constexpr std::string_view kTaskRecovered      = "task_recovered";
inline constexpr std::string_view kEscalation         = "escalation";
inline constexpr std::string_view kHandoffWritten     = "handoff_written";

}  // namespace events

struct LogEvent {
    uint64_t seq = 0;
    Timestamp timestamp{};
    RunId run_id;
    TaskId task_id;                                 ///< Empty for run-level events
    std::string event_type;
    nlohmann::json payload = nlohmann::json::object();
};

[[nodiscard]] nlohmann::json to_json(const LogEvent& event);
[[nodiscard]] Result<LogEvent> parse_event_line(std::string_view line);

/**
 * @brief Read every record of `run_id` (all runs when empty) from an event file.
 *
 * Malformed lines are skipped; a missing file is an Io error.
 */
Result<std::vector<LogEvent>> read_event_file(const std::filesystem::path& path,
                                              const RunId& run_id = {});

/**
 * @brief Single serialized append path shared by all components.
 *
 * Each append is written and flushed under one lock, so concurrent writers
 * never interleave partial records. An in-memory copy backs the
 * read-after-write queries of the coordinating loop.
 */
class EventLog {
public:
    EventLog(RunId run_id, std::unique_ptr<ILogSink> sink);

    /// Append one record; returns its sequence number.
    uint64_t append(const TaskId& task_id, std::string_view event_type,
                    nlohmann::json payload = nlohmann::json::object());

    [[nodiscard]] bool has_event(const TaskId& task_id, std::string_view event_type) const;
    [[nodiscard]] std::optional<uint64_t> first_seq(const TaskId& task_id,
                                                    std::string_view event_type) const;
    [[nodiscard]] std::vector<LogEvent> snapshot() const;
    [[nodiscard]] std::vector<LogEvent> events_for(const TaskId& task_id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] const RunId& run_id() const noexcept { return run_id_; }

private:
    RunId run_id_;
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex mutex_;
    std::vector<LogEvent> events_;
    uint64_t next_seq_ = 1;
};

}  // namespace agent_orchestrator
