/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"
#include "core/types.hpp"

#include <chrono>

namespace agent_orchestrator {

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message)  { log(LogLevel::Info, message); }
void Logger::warn(std::string_view message)  { log(LogLevel::Warn, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }

void Logger::log(LogLevel level, std::string_view message) {
    log(level, "orchestrator", message);
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message,
                 const nlohmann::json& fields) {
    if (level < min_level_) return;

    nlohmann::json line;
    line["level"] = std::string{to_string(level)};
    line["ts"] = format_timestamp(std::chrono::system_clock::now());
    line["component"] = std::string{component};
    line["msg"] = std::string{message};
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            line[it.key()] = it.value();
        }
    }

    // Worker output can contain invalid UTF-8; never let a log line throw.
    auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard lock(mutex_);
    sink_->write(text);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::set_level(LogLevel level) noexcept { min_level_ = level; }
LogLevel Logger::level() const noexcept { return min_level_; }

}  // namespace agent_orchestrator
