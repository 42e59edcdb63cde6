/**
 * @file run_summary.hpp
 * @brief Reduces a run's event stream into the final status report.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "telemetry/event_log.hpp"
#include "telemetry/phase_lock.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct TaskSummaryRow {
    TaskId task_id;
    std::string phase;
    std::string status = "pending";                 ///< TaskStatus name or "skipped"
    std::optional<Millis> duration;                 ///< First start to terminal record
    std::vector<std::string> escalations;           ///< Strategies applied, in order
    std::string reason;
    uint32_t attempts = 0;
};

struct RunSummary {
    RunId run_id;
    std::vector<std::string> phases;
    std::string config_path;
    std::string head_commit;                        ///< Project HEAD when the run started
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    std::string error;                              ///< Run-level error, if any
    bool cancelled = false;
    std::optional<int> exit_code;
    std::vector<TaskSummaryRow> rows;

    [[nodiscard]] const TaskSummaryRow* row(const TaskId& task_id) const;
    [[nodiscard]] size_t count(std::string_view status) const;
};

/**
 * @brief Stateless reducer and writer for run summaries.
 */
class RunSummaryGenerator {
public:
    /**
     * @brief Fold the event stream of one run into a summary.
     *
     * Task order follows the run_start record; tasks that never reached a
     * terminal record keep their last observed status.
     */
    [[nodiscard]] static RunSummary reduce(const std::vector<LogEvent>& events);

    [[nodiscard]] static std::string render_markdown(const RunSummary& summary);

    /// orchestrator-run-summary-<phase[+phase]>-<run_id>.md
    [[nodiscard]] static std::string file_name(const RunSummary& summary);

    /**
     * @brief Write the report under `summary_dir`, then release `locks`.
     *
     * Locks are released even when the report cannot be written.
     */
    static Result<std::filesystem::path> publish(const RunSummary& summary,
                                                 const std::filesystem::path& summary_dir,
                                                 std::vector<PhaseLock>& locks);
};

}  // namespace agent_orchestrator
