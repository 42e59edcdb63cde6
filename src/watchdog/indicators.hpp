/**
 * @file indicators.hpp
 * @brief Independent progress indicators and the per-task probe that runs them.
 * @author Dimitris Kafetzis
 *
 * Filesystem activity, version-control activity, log growth and output
 * pattern health. Each indicator satisfies ProgressIndicatorLike.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "workspace/vcs.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief What an indicator may look at for one sample.
 */
struct ProbeContext {
    std::filesystem::path workspace;
    std::filesystem::path log_path;
    std::filesystem::path repo_root;
    std::string branch;
    Timestamp window_start{};                       ///< Previous sample (or attach) time
    Timestamp now{};
};

struct IndicatorReading {
    Indicator kind = Indicator::Filesystem;
    bool signaled = false;
    bool degenerate = false;                        ///< OutputPattern only
    std::string detail;
};

/**
 * @brief All readings taken for one task at one instant.
 */
struct IndicatorSample {
    TaskId task_id;
    uint32_t attempt = 0;                           ///< Samples from older attempts are stale
    Timestamp at{};
    std::vector<IndicatorReading> readings;

    [[nodiscard]] const IndicatorReading* reading(Indicator kind) const;
};

// ─────────────────────────────────────────────
// Indicators
// ─────────────────────────────────────────────

/// Any regular file under the workspace (outside .git) modified within the window.
class FilesystemIndicator {
public:
    explicit FilesystemIndicator(size_t max_entries = 50000) : max_entries_(max_entries) {}
    IndicatorReading probe(const ProbeContext& ctx);
    static constexpr Indicator kind() { return Indicator::Filesystem; }

private:
    size_t max_entries_;
};

/// A commit on the task branch newer than the window start.
class VcsIndicator {
public:
    explicit VcsIndicator(IVcsBackend& vcs) : vcs_(&vcs) {}
    IndicatorReading probe(const ProbeContext& ctx);
    static constexpr Indicator kind() { return Indicator::VersionControl; }

private:
    IVcsBackend* vcs_;
    std::optional<Timestamp> reported_;             ///< Commit time already signalled
};

/// Log grew by more than min_bytes since the previous probe.
class LogGrowthIndicator {
public:
    explicit LogGrowthIndicator(uint64_t min_bytes) : min_bytes_(min_bytes) {}
    IndicatorReading probe(const ProbeContext& ctx);
    static constexpr Indicator kind() { return Indicator::LogGrowth; }

    void reset_baseline(uint64_t size) noexcept { last_size_ = size; }

private:
    uint64_t min_bytes_;
    std::optional<uint64_t> last_size_;
};

/**
 * @brief Log tail has new content that is not a degenerate repetition.
 *
 * Degenerate: the last `window` non-empty lines, with digits and surrounding
 * whitespace stripped, take at most `max_distinct` distinct values.
 */
class OutputPatternIndicator {
public:
    OutputPatternIndicator(uint32_t window, uint32_t max_distinct)
        : window_(window), max_distinct_(max_distinct) {}
    IndicatorReading probe(const ProbeContext& ctx);
    static constexpr Indicator kind() { return Indicator::OutputPattern; }

private:
    uint32_t window_;
    uint32_t max_distinct_;
    std::optional<size_t> last_digest_;
};

static_assert(ProgressIndicatorLike<FilesystemIndicator>);
static_assert(ProgressIndicatorLike<VcsIndicator>);
static_assert(ProgressIndicatorLike<LogGrowthIndicator>);
static_assert(ProgressIndicatorLike<OutputPatternIndicator>);

// ─────────────────────────────────────────────
// ProgressProbe
// ─────────────────────────────────────────────

/**
 * @brief The enabled indicators for one task attempt, with their baselines.
 */
class ProgressProbe {
public:
    ProgressProbe(const WatchdogPolicy& policy, IVcsBackend& vcs, ProbeContext base);

    /// Run every enabled indicator; advances the window to `now`.
    IndicatorSample sample(const TaskId& task_id, uint32_t attempt, Timestamp now);

private:
    WatchdogPolicy policy_;
    ProbeContext ctx_;
    FilesystemIndicator filesystem_;
    VcsIndicator vcs_;
    LogGrowthIndicator log_growth_;
    OutputPatternIndicator output_pattern_;
};

// ─────────────────────────────────────────────
// Log helpers
// ─────────────────────────────────────────────

/// Last `max_bytes` of a file, starting at a line boundary when possible.
std::string read_log_tail(const std::filesystem::path& path, size_t max_bytes = 64 * 1024);

/// Last `count` non-empty lines of `text`.
std::vector<std::string> last_lines(const std::string& text, size_t count);

/// True when `lines` repeat a small set of normalized values.
bool is_degenerate(const std::vector<std::string>& lines, uint32_t window, uint32_t max_distinct);

}  // namespace agent_orchestrator
