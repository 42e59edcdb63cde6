/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <array>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace agent_orchestrator {

struct RunConfig {
    std::filesystem::path config_path;              ///< Source file; empty when parsed from text
    std::filesystem::path project_root = ".";
    std::filesystem::path logs_dir = "logs";        ///< Relative to project_root
    std::filesystem::path summary_dir = "docs";     ///< Relative to project_root
    std::vector<Phase> privileged_phases = {Phase::Main};
    Millis poll_interval{1000};
    Millis status_interval{10000};                  ///< 0 = no heartbeat
    uint32_t max_parallel = 0;                      ///< 0 = unlimited
    uint32_t worker_threads = 4;                    ///< Blocking job pool size
};

struct LogConfig {
    std::string level = "info";
    bool file = true;                               ///< NDJSON under logs_dir, else stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief A worker backend: a CLI agent invoked through a command template.
 */
struct RunnerConfig {
    std::string name;
    std::string command;
    int interrupt_signal = SIGINT;
};

struct WatchdogPolicy {
    bool enabled = true;
    Millis check_interval{30000};
    Millis stuck_threshold{900000};
    std::array<bool, kIndicatorCount> indicators{true, true, true, true};
    uint64_t min_log_growth_bytes = 64;
    uint32_t repetition_window = 30;                ///< Tail lines inspected
    uint32_t repetition_max_distinct = 3;           ///< At or below = degenerate

    [[nodiscard]] bool uses(Indicator indicator) const noexcept {
        return indicators[index_of(indicator)];
    }
};

struct EscalationPolicy {
    std::vector<Strategy> strategies = {Strategy::Notify, Strategy::Interrupt,
                                        Strategy::KillAndRetry};
    uint32_t max_retries = 3;
    Millis notify_window{0};
    Millis interrupt_grace{120000};
    Millis terminate_grace{10000};
    std::string alternate_runner;                   ///< Used by switch_agent
};

/**
 * @brief One declarative task entry, before graph validation.
 *
 * Templates (branch, workspace_path, command, log) are expanded by the
 * graph builder once the run id is known.
 */
struct TaskSpec {
    TaskId id;
    Phase phase = Phase::Main;
    std::string branch = "task/{task}";
    std::string workspace_path;
    std::string prompt;
    std::string reduced_prompt;
    std::string runner;                             ///< Name in [runners], or empty
    std::string command;                            ///< Inline template, overrides runner
    std::vector<TaskId> depends_on;
    bool manual = false;
    std::string log;                                ///< Empty = <logs_dir>/<id>.log
    WatchdogPolicy watchdog;
    EscalationPolicy escalation;
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    RunConfig run;
    LogConfig log;
    std::map<std::string, RunnerConfig> runners;
    WatchdogPolicy watchdog;
    EscalationPolicy escalation;
    std::vector<TaskSpec> tasks;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Relative project_root is resolved against the file's directory; logs and
 * summary directories against project_root.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text (base_dir anchors relative paths).
 */
Result<Config> parse_config(std::string_view toml_text, const std::filesystem::path& base_dir);

/**
 * @brief Apply AGENT_ORCH_* environment overrides.
 */
void apply_env_overrides(Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/// Signal number for a name such as "SIGINT" or "INT".
[[nodiscard]] std::optional<int> parse_signal_name(std::string_view name);

/// True for "1", "true", "yes", "on" (case-insensitive).
[[nodiscard]] bool truthy(std::string_view value);

inline constexpr std::string_view kEnvStatusInterval = "AGENT_ORCH_STATUS_INTERVAL";
inline constexpr std::string_view kEnvWatchdogInterval = "AGENT_ORCH_WATCHDOG_INTERVAL";
inline constexpr std::string_view kEnvRunnerNoop = "AGENT_ORCH_RUNNER_NOOP";
inline constexpr std::string_view kNoopRunnerCommand = "cat \"{prompt}\" > /dev/null";

}  // namespace agent_orchestrator
