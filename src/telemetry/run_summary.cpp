/**
 * @file run_summary.cpp
 * @brief RunSummaryGenerator implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/run_summary.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace agent_orchestrator {

const TaskSummaryRow* RunSummary::row(const TaskId& task_id) const {
    auto it = std::find_if(rows.begin(), rows.end(),
                           [&](const TaskSummaryRow& r) { return r.task_id == task_id; });
    return it == rows.end() ? nullptr : &*it;
}

size_t RunSummary::count(std::string_view status) const {
    return static_cast<size_t>(std::count_if(rows.begin(), rows.end(),
                                             [&](const TaskSummaryRow& r) { return r.status == status; }));
}

namespace {

std::string payload_string(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string escape_cell(std::string text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    return out;
}

}  // namespace

// ─────────────────────────────────────────────
// Reduction
// ─────────────────────────────────────────────

RunSummary RunSummaryGenerator::reduce(const std::vector<LogEvent>& events) {
    RunSummary summary;
    std::unordered_map<TaskId, size_t> index;
    std::unordered_map<TaskId, Timestamp> first_start;

    auto row_for = [&](const TaskId& id) -> TaskSummaryRow& {
        auto [it, inserted] = index.try_emplace(id, summary.rows.size());
        if (inserted) summary.rows.push_back(TaskSummaryRow{.task_id = id});
        return summary.rows[it->second];
    };
    auto finish = [&](TaskSummaryRow& row, const LogEvent& event, std::string status) {
        row.status = std::move(status);
        if (auto it = first_start.find(row.task_id); it != first_start.end()) {
            row.duration = std::chrono::duration_cast<Millis>(event.timestamp - it->second);
        }
    };

    for (const auto& event : events) {
        const auto& type = event.event_type;
        const auto& payload = event.payload;

        if (type == events::kRunStart) {
            summary.run_id = event.run_id;
            summary.started_at = event.timestamp;
            summary.config_path = payload_string(payload, "config");
            summary.head_commit = payload_string(payload, "head_commit");
            if (auto it = payload.find("phases"); it != payload.end() && it->is_array()) {
                for (const auto& p : *it) summary.phases.push_back(p.get<std::string>());
            }
            if (auto it = payload.find("tasks"); it != payload.end() && it->is_array()) {
                for (const auto& t : *it) {
                    auto& row = row_for(t.value("id", ""));
                    row.phase = t.value("phase", "");
                }
            }
            continue;
        }
        if (type == events::kRunEnd) {
            summary.finished_at = event.timestamp;
            summary.error = payload_string(payload, "error");
            summary.cancelled = payload.value("cancelled", false);
            if (auto it = payload.find("exit_code"); it != payload.end() && it->is_number_integer()) {
                summary.exit_code = it->get<int>();
            }
            continue;
        }
        if (event.task_id.empty()) continue;

        auto& row = row_for(event.task_id);
        if (type == events::kTaskSkipped) {
            row.status = "skipped";
            row.reason = payload_string(payload, "reason");
        } else if (type == events::kTaskReady) {
            if (row.status == "pending") row.status = "ready";
        } else if (type == events::kTaskStart) {
            first_start.try_emplace(row.task_id, event.timestamp);
            row.status = "running";
            ++row.attempts;
        } else if (type == events::kTaskSucceeded) {
            finish(row, event, "succeeded");
            row.reason.clear();
        } else if (type == events::kTaskFailed) {
            finish(row, event, "failed");
            row.reason = payload_string(payload, "reason");
        } else if (type == events::kTaskBlocked) {
            finish(row, event, "blocked");
            row.reason = payload_string(payload, "reason");
        } else if (type == events::kEscalation) {
            auto strategy = payload_string(payload, "strategy");
            if (!strategy.empty()) row.escalations.push_back(std::move(strategy));
        }
    }
    return summary;
}

// ─────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────

std::string RunSummaryGenerator::file_name(const RunSummary& summary) {
    std::string phases;
    for (const auto& phase : summary.phases) {
        if (!phases.empty()) phases += '+';
        phases += phase;
    }
    if (phases.empty()) phases = "none";
    return "orchestrator-run-summary-" + phases + "-" + summary.run_id + ".md";
}

std::string RunSummaryGenerator::render_markdown(const RunSummary& summary) {
    std::ostringstream md;
    md << "# Orchestrator Run Summary\n\n"
       << "- Run id: `" << summary.run_id << "`\n"
       << "- Phases:";
    for (const auto& phase : summary.phases) md << ' ' << phase;
    md << '\n';
    if (!summary.config_path.empty()) md << "- Config: `" << summary.config_path << "`\n";
    if (!summary.head_commit.empty()) md << "- Project commit: `" << summary.head_commit << "`\n";
    if (summary.started_at) md << "- Started: " << format_timestamp(*summary.started_at) << '\n';
    if (summary.finished_at) md << "- Finished: " << format_timestamp(*summary.finished_at) << '\n';
    if (summary.started_at && summary.finished_at) {
        md << "- Elapsed: "
           << format_elapsed(std::chrono::duration_cast<Millis>(*summary.finished_at - *summary.started_at))
           << '\n';
    }
    if (summary.exit_code) md << "- Exit code: " << *summary.exit_code << '\n';
    if (summary.cancelled) md << "- Cancelled: yes\n";
    if (!summary.error.empty()) md << "- Error: " << escape_cell(summary.error) << '\n';

    md << "\n| Task | Phase | Status | Duration | Attempts | Escalations | Reason |\n"
       << "|------|-------|--------|----------|----------|-------------|--------|\n";
    for (const auto& row : summary.rows) {
        std::string escalations;
        for (const auto& e : row.escalations) {
            if (!escalations.empty()) escalations += ", ";
            escalations += e;
        }
        md << "| " << escape_cell(row.task_id)
           << " | " << row.phase
           << " | " << row.status
           << " | " << (row.duration ? format_elapsed(*row.duration) : std::string{"-"})
           << " | " << row.attempts
           << " | " << (escalations.empty() ? std::string{"-"} : escalations)
           << " | " << (row.reason.empty() ? std::string{"-"} : escape_cell(row.reason))
           << " |\n";
    }

    md << "\nTotals: " << summary.count("succeeded") << " succeeded, "
       << summary.count("failed") << " failed, "
       << summary.count("blocked") << " blocked, "
       << summary.count("skipped") << " skipped.\n";
    return md.str();
}

Result<std::filesystem::path> RunSummaryGenerator::publish(const RunSummary& summary,
                                                           const std::filesystem::path& summary_dir,
                                                           std::vector<PhaseLock>& locks) {
    auto release_locks = [&]() -> Result<void> {
        std::optional<Error> first;
        for (auto& lock : locks) {
            auto released = lock.release();
            if (!released && !first) first = released.error();
        }
        locks.clear();
        if (first) return *first;
        return {};
    };

    auto path = summary_dir / file_name(summary);
    std::error_code ec;
    std::filesystem::create_directories(summary_dir, ec);
    std::ofstream out;
    if (!ec) out.open(path, std::ios::trunc);
    if (ec || !out) {
        auto message = "cannot write run summary " + path.string();
        if (auto released = release_locks(); !released) {
            message += "; " + released.error().message;
        }
        return Error{ErrorKind::Io, std::move(message)};
    }
    out << render_markdown(summary);
    out.close();

    auto released = release_locks();
    if (!out) return Error{ErrorKind::Io, "failed writing run summary " + path.string()};
    if (!released) return released.error();
    return path;
}

}  // namespace agent_orchestrator
