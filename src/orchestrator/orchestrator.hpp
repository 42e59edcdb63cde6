/**
 * @file orchestrator.hpp
 * @brief Top-level Orchestrator facade that ties all modules together.
 * @author Dimitris Kafetzis
 *
 * One call to run() performs a complete orchestration run:
 *   1. Build and validate the task graph for the requested phase(s)
 *   2. Preflight the environment and take the phase locks
 *   3. Drive the coordinating loop until the graph is quiescent
 *   4. Reduce the event stream into the run summary and release the locks
 *
 * Version control and worker backends are injected for testability
 * (MockVcs and ScriptedBackend in tests, GitVcs and PosixShellBackend in
 * production).
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "process/worker_backend.hpp"
#include "workspace/vcs.hpp"

#include <atomic>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct RunRequest {
    std::vector<Phase> phases;                      ///< Empty = main
    bool include_manual = false;
    bool dry_run = false;
};

struct RunReport {
    RunId run_id;
    int exit_code = 0;
    std::vector<TaskId> order;                      ///< Topological order of scheduled tasks
    std::optional<std::filesystem::path> summary_path;
    std::optional<std::filesystem::path> events_path;
    std::optional<Error> error;                     ///< Run-level error
};

// ── Exit codes ───────────────────────────────
inline constexpr int kExitOk = 0;
inline constexpr int kExitTaskFailed = 1;
inline constexpr int kExitPreflight = 2;
inline constexpr int kExitLockHeld = 3;
inline constexpr int kExitEscalationExhausted = 4;
inline constexpr int kExitWorkspaceConflict = 5;
inline constexpr int kExitProcessLaunch = 6;
inline constexpr int kExitCancelled = 130;

/**
 * @brief The top-level Orchestrator that wires all modules together.
 */
class Orchestrator {
public:
    struct Options {
        Config config;
        std::ostream* console = nullptr;            ///< Progress lines; stdout when null
        std::shared_ptr<IVcsBackend> vcs;           ///< GitVcs when null
        std::optional<BackendRegistry> backends;    ///< From config.runners when absent
    };

    Orchestrator(Options opts, Logger& logger);
    ~Orchestrator();

    // Non-copyable, non-movable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Execute one run. Never throws; every failure is folded into the report.
    RunReport run(const RunRequest& request);

    /// Cancel the current run. Async-signal-safe.
    void request_stop() noexcept { stop_requested_.store(true); }
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /// YYYYmmdd-HHMMSS-<8 hex>
    [[nodiscard]] static RunId generate_run_id();

    [[nodiscard]] static int exit_code_for(ErrorKind kind) noexcept;

    /// <logs_dir>/framework-run.jsonl
    [[nodiscard]] std::filesystem::path events_path() const;

private:
    class Session;

    Config config_;
    Logger& logger_;
    ComponentLogger log_;
    std::ostream* console_;
    std::shared_ptr<IVcsBackend> vcs_;
    BackendRegistry backends_;
    std::atomic<bool> stop_requested_{false};
};

}  // namespace agent_orchestrator
