/**
 * @file worker_backend.hpp
 * @brief Polymorphic worker backend capability and its implementations.
 * @author Dimitris Kafetzis
 *
 * The supervisor depends only on IWorkerBackend. PosixShellBackend runs a
 * CLI agent through /bin/sh in its own process group; ScriptedBackend is a
 * deterministic stand-in for tests and dry configurations.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace agent_orchestrator {

/**
 * @brief A fully expanded worker invocation.
 */
struct LaunchRequest {
    TaskId task_id;
    std::string command;                            ///< Shell command line, no placeholders
    std::filesystem::path workdir;
    std::filesystem::path log_path;                 ///< stdout+stderr, append mode
    std::map<std::string, std::string> environment; ///< Added to the inherited environment
};

struct ProcessHandle {
    pid_t pid = -1;
    std::string backend;
};

struct ExitStatus {
    int code = -1;                                  ///< Exit code, or 128+signal
    std::optional<int> signal;                      ///< Set when killed by a signal

    [[nodiscard]] bool success() const noexcept { return code == 0 && !signal; }
};

/// Human-readable "exit code N" / "killed by signal N".
[[nodiscard]] std::string describe(const ExitStatus& status);

// ─────────────────────────────────────────────
// IWorkerBackend (Virtual, one variant per CLI agent)
// ─────────────────────────────────────────────

class IWorkerBackend {
public:
    virtual ~IWorkerBackend() = default;

    /// Spawn the worker; non-blocking. Fails with ProcessLaunch.
    virtual Result<ProcessHandle> start(const LaunchRequest& request) = 0;

    /// Deliver the signal for `tier`. A process that already exited is not an error.
    virtual Result<void> signal(const ProcessHandle& handle, SignalTier tier) = 0;

    /// Non-blocking exit check. Returns the status once, and again on later calls.
    virtual std::optional<ExitStatus> poll(const ProcessHandle& handle) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// PosixShellBackend
// ─────────────────────────────────────────────

/**
 * @brief Runs a runner's command through /bin/sh -c.
 *
 * The child leads its own process group so signals reach the agent and any
 * helpers it spawned. Cooperative signalling uses the runner's configured
 * interrupt signal.
 */
class PosixShellBackend : public IWorkerBackend {
public:
    explicit PosixShellBackend(RunnerConfig runner);

    Result<ProcessHandle> start(const LaunchRequest& request) override;
    Result<void> signal(const ProcessHandle& handle, SignalTier tier) override;
    std::optional<ExitStatus> poll(const ProcessHandle& handle) override;
    [[nodiscard]] std::string_view name() const noexcept override { return runner_.name; }

private:
    RunnerConfig runner_;
    std::mutex mutex_;
    std::unordered_map<pid_t, ExitStatus> reaped_;
};

// ─────────────────────────────────────────────
// ScriptedBackend
// ─────────────────────────────────────────────

/**
 * @brief In-process fake worker with test-controlled behaviour.
 *
 * Each start() consumes the next queued Script for that task (or the
 * default one). Processes stay alive until finish() or until a signal the
 * script obeys arrives.
 */
class ScriptedBackend : public IWorkerBackend {
public:
    struct Script {
        bool fail_launch = false;
        std::optional<int> exit_immediately;        ///< Exit code right after start
        std::string log_output;                     ///< Appended to the log at start
        bool obey_cooperative = false;              ///< Exits on the cooperative signal
        bool obey_graceful = true;                  ///< Exits on SIGTERM
    };

    explicit ScriptedBackend(std::string name = "scripted");

    Result<ProcessHandle> start(const LaunchRequest& request) override;
    Result<void> signal(const ProcessHandle& handle, SignalTier tier) override;
    std::optional<ExitStatus> poll(const ProcessHandle& handle) override;
    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    // Test helpers
    void push_script(const TaskId& task_id, Script script);
    void set_default_script(Script script);
    void finish(const TaskId& task_id, int exit_code);
    [[nodiscard]] bool is_alive(const TaskId& task_id) const;
    [[nodiscard]] size_t start_count(const TaskId& task_id) const;
    [[nodiscard]] std::vector<LaunchRequest> launches() const;
    [[nodiscard]] std::vector<std::pair<TaskId, SignalTier>> signals() const;

private:
    struct FakeProcess {
        TaskId task_id;
        Script script;
        std::optional<ExitStatus> exit;
    };

    std::string name_;
    mutable std::mutex mutex_;
    pid_t next_pid_ = 40000;
    Script default_script_;
    std::unordered_map<TaskId, std::deque<Script>> scripts_;
    std::unordered_map<pid_t, FakeProcess> processes_;
    std::vector<LaunchRequest> launches_;
    std::vector<std::pair<TaskId, SignalTier>> signals_;
};

// ─────────────────────────────────────────────
// BackendRegistry
// ─────────────────────────────────────────────

/**
 * @brief Maps runner names to backends; "inline" task commands use the fallback.
 */
class BackendRegistry {
public:
    void add(const std::string& runner, std::shared_ptr<IWorkerBackend> backend);
    void set_fallback(std::shared_ptr<IWorkerBackend> backend);

    [[nodiscard]] IWorkerBackend* find(const std::string& runner) const;

    /// One PosixShellBackend per configured runner, plus an inline fallback.
    static BackendRegistry from_config(const std::map<std::string, RunnerConfig>& runners);

    /// Every runner resolves to the same backend.
    static BackendRegistry single(std::shared_ptr<IWorkerBackend> backend);

private:
    std::map<std::string, std::shared_ptr<IWorkerBackend>, std::less<>> backends_;
    std::shared_ptr<IWorkerBackend> fallback_;
};

}  // namespace agent_orchestrator
