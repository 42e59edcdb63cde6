/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace agent_orchestrator {

namespace {

using Errors = std::vector<std::string>;

std::string field_name(std::string_view context, std::string_view key) {
    std::string name{context};
    if (!name.empty()) name += '.';
    name += key;
    return name;
}

void read_string(const toml::table& tbl, std::string_view key, std::string& out,
                 Errors& errors, std::string_view context) {
    const auto* node = tbl.get(key);
    if (!node) return;
    if (auto value = node->value<std::string>(); value && node->is_string()) {
        out = *value;
    } else {
        errors.push_back(field_name(context, key) + " must be a string");
    }
}

void read_bool(const toml::table& tbl, std::string_view key, bool& out,
               Errors& errors, std::string_view context) {
    const auto* node = tbl.get(key);
    if (!node) return;
    if (auto value = node->value<bool>(); value && node->is_boolean()) {
        out = *value;
    } else {
        errors.push_back(field_name(context, key) + " must be a boolean");
    }
}

template <typename UInt>
void read_uint(const toml::table& tbl, std::string_view key, UInt& out,
               Errors& errors, std::string_view context) {
    const auto* node = tbl.get(key);
    if (!node) return;
    auto value = node->value<int64_t>();
    if (!node->is_integer() || !value || *value < 0) {
        errors.push_back(field_name(context, key) + " must be a non-negative integer");
        return;
    }
    out = static_cast<UInt>(*value);
}

/// Durations are written in seconds (integer or float) and stored as ms.
void read_seconds(const toml::table& tbl, std::string_view key, Millis& out,
                  Errors& errors, std::string_view context) {
    const auto* node = tbl.get(key);
    if (!node) return;
    std::optional<double> seconds;
    if (node->is_integer()) {
        seconds = static_cast<double>(*node->value<int64_t>());
    } else if (node->is_floating_point()) {
        seconds = *node->value<double>();
    }
    if (!seconds || *seconds < 0.0 || !std::isfinite(*seconds)) {
        errors.push_back(field_name(context, key) + " must be a non-negative number of seconds");
        return;
    }
    out = Millis{static_cast<int64_t>(std::llround(*seconds * 1000.0))};
}

void read_string_list(const toml::table& tbl, std::string_view key,
                      std::vector<std::string>& out, Errors& errors,
                      std::string_view context) {
    const auto* node = tbl.get(key);
    if (!node) return;
    const auto* arr = node->as_array();
    if (!arr) {
        errors.push_back(field_name(context, key) + " must be a list of strings");
        return;
    }
    out.clear();
    for (const auto& element : *arr) {
        auto value = element.value<std::string>();
        if (!element.is_string() || !value) {
            errors.push_back(field_name(context, key) + " must be a list of strings");
            return;
        }
        out.push_back(*value);
    }
}

void read_watchdog(const toml::table& tbl, WatchdogPolicy& policy, Errors& errors,
                   std::string_view context) {
    read_bool(tbl, "enabled", policy.enabled, errors, context);
    read_seconds(tbl, "check_interval", policy.check_interval, errors, context);
    read_seconds(tbl, "stuck_threshold", policy.stuck_threshold, errors, context);
    read_uint(tbl, "min_log_growth_bytes", policy.min_log_growth_bytes, errors, context);
    read_uint(tbl, "repetition_window", policy.repetition_window, errors, context);
    read_uint(tbl, "repetition_max_distinct", policy.repetition_max_distinct, errors, context);

    if (tbl.contains("indicators")) {
        std::vector<std::string> names;
        read_string_list(tbl, "indicators", names, errors, context);
        policy.indicators.fill(false);
        for (const auto& name : names) {
            if (auto indicator = parse_indicator(name)) {
                policy.indicators[index_of(*indicator)] = true;
            } else {
                errors.push_back(field_name(context, "indicators") + ": unknown indicator '"
                                 + name + "'");
            }
        }
    }
    if (policy.check_interval.count() == 0) {
        errors.push_back(field_name(context, "check_interval") + " must be positive");
    }
}

void read_escalation(const toml::table& tbl, EscalationPolicy& policy, Errors& errors,
                     std::string_view context) {
    if (tbl.contains("strategies")) {
        std::vector<std::string> names;
        read_string_list(tbl, "strategies", names, errors, context);
        policy.strategies.clear();
        for (const auto& name : names) {
            if (auto strategy = parse_strategy(name)) {
                policy.strategies.push_back(*strategy);
            } else {
                errors.push_back(field_name(context, "strategies") + ": unknown strategy '"
                                 + name + "'");
            }
        }
    }
    read_uint(tbl, "max_retries", policy.max_retries, errors, context);
    read_seconds(tbl, "notify_window", policy.notify_window, errors, context);
    read_seconds(tbl, "interrupt_grace", policy.interrupt_grace, errors, context);
    read_seconds(tbl, "terminate_grace", policy.terminate_grace, errors, context);
    read_string(tbl, "alternate_runner", policy.alternate_runner, errors, context);
}

TaskSpec read_task(const toml::table& tbl, size_t index, const Config& config, Errors& errors) {
    TaskSpec spec;
    spec.watchdog = config.watchdog;
    spec.escalation = config.escalation;

    read_string(tbl, "id", spec.id, errors, "tasks[" + std::to_string(index) + "]");
    std::string context = "tasks." + (spec.id.empty() ? std::to_string(index) : spec.id);

    std::string phase_name{to_string(spec.phase)};
    read_string(tbl, "phase", phase_name, errors, context);
    if (auto phase = parse_phase(phase_name)) {
        spec.phase = *phase;
    } else {
        errors.push_back(context + ".phase: invalid phase '" + phase_name + "'");
    }

    read_string(tbl, "branch", spec.branch, errors, context);
    read_string(tbl, "workspace_path", spec.workspace_path, errors, context);
    read_string(tbl, "prompt", spec.prompt, errors, context);
    read_string(tbl, "reduced_prompt", spec.reduced_prompt, errors, context);
    read_string(tbl, "runner", spec.runner, errors, context);
    read_string(tbl, "command", spec.command, errors, context);
    read_string_list(tbl, "depends_on", spec.depends_on, errors, context);
    read_bool(tbl, "manual", spec.manual, errors, context);
    read_string(tbl, "log", spec.log, errors, context);

    if (const auto* watchdog = tbl.get_as<toml::table>("watchdog")) {
        read_watchdog(*watchdog, spec.watchdog, errors, context + ".watchdog");
    }
    if (const auto* escalation = tbl.get_as<toml::table>("escalation")) {
        read_escalation(*escalation, spec.escalation, errors, context + ".escalation");
    }
    return spec;
}

std::string join_errors(const Errors& errors) {
    std::ostringstream oss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << errors[i];
    }
    return oss.str();
}

Result<Config> from_table(const toml::table& tbl, const std::filesystem::path& base_dir) {
    Config config;
    Errors errors;

    // [run]
    if (const auto* run = tbl.get_as<toml::table>("run")) {
        std::string project_root = config.run.project_root.string();
        std::string logs_dir = config.run.logs_dir.string();
        std::string summary_dir = config.run.summary_dir.string();
        read_string(*run, "project_root", project_root, errors, "run");
        read_string(*run, "logs_dir", logs_dir, errors, "run");
        read_string(*run, "summary_dir", summary_dir, errors, "run");
        config.run.project_root = project_root;
        config.run.logs_dir = logs_dir;
        config.run.summary_dir = summary_dir;

        if (run->contains("privileged_phases")) {
            std::vector<std::string> names;
            read_string_list(*run, "privileged_phases", names, errors, "run");
            config.run.privileged_phases.clear();
            for (const auto& name : names) {
                if (auto phase = parse_phase(name)) {
                    config.run.privileged_phases.push_back(*phase);
                } else {
                    errors.push_back("run.privileged_phases: invalid phase '" + name + "'");
                }
            }
        }
        read_seconds(*run, "poll_interval", config.run.poll_interval, errors, "run");
        read_seconds(*run, "status_interval", config.run.status_interval, errors, "run");
        read_uint(*run, "max_parallel", config.run.max_parallel, errors, "run");
        read_uint(*run, "worker_threads", config.run.worker_threads, errors, "run");
        if (config.run.poll_interval.count() == 0) {
            errors.emplace_back("run.poll_interval must be positive");
        }
    }

    // [log]
    if (const auto* log = tbl.get_as<toml::table>("log")) {
        read_string(*log, "level", config.log.level, errors, "log");
        read_bool(*log, "file", config.log.file, errors, "log");
        read_uint(*log, "max_file_size_mb", config.log.max_file_size_mb, errors, "log");
        read_uint(*log, "rotate_count", config.log.rotate_count, errors, "log");
    }

    // [runners.<name>]
    if (const auto* runners = tbl.get_as<toml::table>("runners")) {
        for (const auto& [key, node] : *runners) {
            std::string name{key.str()};
            const auto* runner_tbl = node.as_table();
            if (!runner_tbl) {
                errors.push_back("runners." + name + " must be a table");
                continue;
            }
            RunnerConfig runner;
            runner.name = name;
            read_string(*runner_tbl, "command", runner.command, errors, "runners." + name);
            std::string signal_name = "SIGINT";
            read_string(*runner_tbl, "interrupt_signal", signal_name, errors, "runners." + name);
            if (auto signo = parse_signal_name(signal_name)) {
                runner.interrupt_signal = *signo;
            } else {
                errors.push_back("runners." + name + ".interrupt_signal: unknown signal '"
                                 + signal_name + "'");
            }
            if (runner.command.empty()) {
                errors.push_back("Runner '" + name + "' has empty command");
            }
            config.runners.emplace(name, std::move(runner));
        }
    }

    // [watchdog] and [escalation] are defaults for every task
    if (const auto* watchdog = tbl.get_as<toml::table>("watchdog")) {
        read_watchdog(*watchdog, config.watchdog, errors, "watchdog");
    }
    if (const auto* escalation = tbl.get_as<toml::table>("escalation")) {
        read_escalation(*escalation, config.escalation, errors, "escalation");
    }

    // [[tasks]]
    if (const auto* node = tbl.get("tasks")) {
        const auto* tasks = node->as_array();
        if (!tasks) {
            errors.emplace_back("Config 'tasks' must be a list");
        } else {
            for (size_t i = 0; i < tasks->size(); ++i) {
                const auto* task_tbl = (*tasks)[i].as_table();
                if (!task_tbl) {
                    errors.emplace_back("Each task must be a table");
                    continue;
                }
                config.tasks.push_back(read_task(*task_tbl, i, config, errors));
            }
        }
    }

    if (!errors.empty()) {
        return Error{ErrorKind::Config, join_errors(errors)};
    }

    if (config.run.project_root.is_relative()) {
        config.run.project_root = base_dir / config.run.project_root;
    }
    config.run.project_root = config.run.project_root.lexically_normal();
    if (config.run.logs_dir.is_relative()) {
        config.run.logs_dir = config.run.project_root / config.run.logs_dir;
    }
    if (config.run.summary_dir.is_relative()) {
        config.run.summary_dir = config.run.project_root / config.run.summary_dir;
    }
    config.run.logs_dir = config.run.logs_dir.lexically_normal();
    config.run.summary_dir = config.run.summary_dir.lexically_normal();

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        auto base_dir = std::filesystem::absolute(path).parent_path();
        auto config = from_table(tbl, base_dir);
        if (config) config->run.config_path = std::filesystem::absolute(path).lexically_normal();
        return config;
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text, const std::filesystem::path& base_dir) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl, base_dir);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

void apply_env_overrides(Config& config) {
    auto seconds_from_env = [](std::string_view name) -> std::optional<Millis> {
        const char* raw = std::getenv(std::string{name}.c_str());
        if (!raw || !*raw) return std::nullopt;
        char* end = nullptr;
        double seconds = std::strtod(raw, &end);
        if (end == raw || seconds < 0.0) return std::nullopt;
        return Millis{static_cast<int64_t>(std::llround(seconds * 1000.0))};
    };

    if (auto interval = seconds_from_env(kEnvStatusInterval)) {
        config.run.status_interval = *interval;
    }
    if (auto interval = seconds_from_env(kEnvWatchdogInterval); interval && interval->count() > 0) {
        config.watchdog.check_interval = *interval;
        for (auto& task : config.tasks) {
            task.watchdog.check_interval = *interval;
        }
    }
    if (const char* noop = std::getenv(std::string{kEnvRunnerNoop}.c_str()); noop && truthy(noop)) {
        for (auto& [name, runner] : config.runners) {
            runner.command = std::string{kNoopRunnerCommand};
        }
        for (auto& task : config.tasks) {
            if (!task.command.empty()) task.command = std::string{kNoopRunnerCommand};
        }
    }
}

Config default_config() {
    return Config{};
}

std::optional<int> parse_signal_name(std::string_view name) {
    std::string upper;
    for (char c : name) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (upper.rfind("SIG", 0) == 0) upper = upper.substr(3);

    static const std::map<std::string, int> kSignals = {
        {"INT", SIGINT}, {"TERM", SIGTERM}, {"HUP", SIGHUP}, {"QUIT", SIGQUIT},
        {"USR1", SIGUSR1}, {"USR2", SIGUSR2}, {"KILL", SIGKILL}, {"CONT", SIGCONT},
    };
    if (auto it = kSignals.find(upper); it != kSignals.end()) return it->second;
    return std::nullopt;
}

bool truthy(std::string_view value) {
    std::string lower;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

}  // namespace agent_orchestrator
