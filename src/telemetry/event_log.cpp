/**
 * @file event_log.cpp
 * @brief EventLog implementation and NDJSON codec.
 * @author Dimitris Kafetzis
 */

#include "telemetry/event_log.hpp"

#include <chrono>
#include <fstream>

namespace agent_orchestrator {

nlohmann::json to_json(const LogEvent& event) {
    return nlohmann::json{
        {"seq", event.seq},
        {"ts", format_timestamp(event.timestamp)},
        {"run_id", event.run_id},
        {"task", event.task_id},
        {"event", event.event_type},
        {"payload", event.payload},
    };
}

Result<LogEvent> parse_event_line(std::string_view line) {
    try {
        auto json = nlohmann::json::parse(line);
        if (!json.is_object()) {
            return Error{ErrorKind::Io, "event record is not an object"};
        }
        LogEvent event;
        event.seq = json.at("seq").get<uint64_t>();
        auto ts = parse_timestamp(json.at("ts").get<std::string>());
        if (!ts) return Error{ErrorKind::Io, "malformed event timestamp"};
        event.timestamp = *ts;
        event.run_id = json.value("run_id", "");
        event.task_id = json.value("task", "");
        event.event_type = json.at("event").get<std::string>();
        event.payload = json.value("payload", nlohmann::json::object());
        return event;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorKind::Io, std::string{"malformed event record: "} + e.what()};
    }
}

Result<std::vector<LogEvent>> read_event_file(const std::filesystem::path& path,
                                              const RunId& run_id) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorKind::Io, "cannot open event log " + path.string()};
    }
    std::vector<LogEvent> events;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto event = parse_event_line(line);
        if (!event) continue;
        if (!run_id.empty() && event->run_id != run_id) continue;
        events.push_back(std::move(*event));
    }
    return events;
}

// ── EventLog ─────────────────────────────────

EventLog::EventLog(RunId run_id, std::unique_ptr<ILogSink> sink)
    : run_id_(std::move(run_id)), sink_(std::move(sink)) {}

uint64_t EventLog::append(const TaskId& task_id, std::string_view event_type,
                          nlohmann::json payload) {
    std::lock_guard lock(mutex_);
    LogEvent event{
        .seq = next_seq_++,
        .timestamp = std::chrono::system_clock::now(),
        .run_id = run_id_,
        .task_id = task_id,
        .event_type = std::string{event_type},
        .payload = std::move(payload),
    };

    // Durable before the caller acts on the transition.
    sink_->write(to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    sink_->flush();

    events_.push_back(std::move(event));
    return events_.back().seq;
}

bool EventLog::has_event(const TaskId& task_id, std::string_view event_type) const {
    return first_seq(task_id, event_type).has_value();
}

std::optional<uint64_t> EventLog::first_seq(const TaskId& task_id,
                                            std::string_view event_type) const {
    std::lock_guard lock(mutex_);
    for (const auto& event : events_) {
        if (event.task_id == task_id && event.event_type == event_type) return event.seq;
    }
    return std::nullopt;
}

std::vector<LogEvent> EventLog::snapshot() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::vector<LogEvent> EventLog::events_for(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    std::vector<LogEvent> out;
    for (const auto& event : events_) {
        if (event.task_id == task_id) out.push_back(event);
    }
    return out;
}

size_t EventLog::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

}  // namespace agent_orchestrator
