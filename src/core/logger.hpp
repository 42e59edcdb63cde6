/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end. Every line is a single JSON object with
 * level, timestamp, component, message, and optional structured fields.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace agent_orchestrator {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

// ─────────────────────────────────────────────
// ILogSink (Virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for line-oriented output destinations.
 *
 * Shared by the diagnostic Logger and the run Event Log; both hand over one
 * complete JSON line per call.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 *
 * Components hold a ComponentLogger (a Logger reference plus a name), so the
 * sink and level are configured once in main().
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void log(LogLevel level, std::string_view component, std::string_view message,
             const nlohmann::json& fields = nullptr);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel lvl) const noexcept { return lvl >= min_level_; }

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/**
 * @brief Logger bound to a component name ("allocator", "watchdog", ...).
 */
class ComponentLogger {
public:
    ComponentLogger(Logger& logger, std::string component)
        : logger_(&logger), component_(std::move(component)) {}

    void debug(std::string_view msg, const nlohmann::json& fields = nullptr) {
        logger_->log(LogLevel::Debug, component_, msg, fields);
    }
    void info(std::string_view msg, const nlohmann::json& fields = nullptr) {
        logger_->log(LogLevel::Info, component_, msg, fields);
    }
    void warn(std::string_view msg, const nlohmann::json& fields = nullptr) {
        logger_->log(LogLevel::Warn, component_, msg, fields);
    }
    void error(std::string_view msg, const nlohmann::json& fields = nullptr) {
        logger_->log(LogLevel::Error, component_, msg, fields);
    }

    [[nodiscard]] Logger& base() noexcept { return *logger_; }

private:
    Logger* logger_;
    std::string component_;
};

}  // namespace agent_orchestrator
