/**
 * @file phase_lock.hpp
 * @brief File-existence mutual exclusion for privileged run phases.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>

namespace agent_orchestrator {

/// framework-run.lock for the main phase, framework-run-<phase>.lock otherwise.
[[nodiscard]] std::filesystem::path lock_path(const std::filesystem::path& logs_dir, Phase phase);

struct PhaseLockInfo {
    Phase phase = Phase::Main;
    RunId holder_run_id;
    Timestamp acquired_at{};
};

/**
 * @brief Owns one phase lock file for its lifetime.
 *
 * Created with O_CREAT|O_EXCL so two runs can never both succeed. The file is
 * removed on release() or destruction, whichever comes first.
 */
class PhaseLock {
public:
    PhaseLock() = default;
    ~PhaseLock();

    PhaseLock(const PhaseLock&) = delete;
    PhaseLock& operator=(const PhaseLock&) = delete;
    PhaseLock(PhaseLock&& other) noexcept;
    PhaseLock& operator=(PhaseLock&& other) noexcept;

    /// Fails with PhaseLockHeld if the lock file already exists.
    static Result<PhaseLock> acquire(const std::filesystem::path& logs_dir, Phase phase,
                                     const RunId& run_id);

    /// Fails with PhaseLockHeld if the lock for `phase` exists; creates nothing.
    static Result<void> ensure_clear(const std::filesystem::path& logs_dir, Phase phase);

    /// Holder details of an existing lock; nullopt when absent or unreadable.
    static std::optional<PhaseLockInfo> inspect(const std::filesystem::path& logs_dir, Phase phase);

    /// Remove the lock file. Idempotent.
    Result<void> release();

    [[nodiscard]] bool held() const noexcept { return held_; }
    [[nodiscard]] const PhaseLockInfo& info() const noexcept { return info_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    PhaseLockInfo info_;
    bool held_ = false;
};

}  // namespace agent_orchestrator
