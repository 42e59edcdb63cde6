/**
 * @file indicators.cpp
 * @brief Progress indicator implementations.
 * @author Dimitris Kafetzis
 */

#include "watchdog/indicators.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <functional>
#include <set>
#include <sstream>

namespace agent_orchestrator {

namespace {

std::string normalize_line(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (c >= '0' && c <= '9') continue;
        out.push_back(c);
    }
    auto first = out.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    auto last = out.find_last_not_of(" \t\r");
    return out.substr(first, last - first + 1);
}

}  // namespace

const IndicatorReading* IndicatorSample::reading(Indicator kind) const {
    for (const auto& r : readings) {
        if (r.kind == kind) return &r;
    }
    return nullptr;
}

// ─────────────────────────────────────────────
// Filesystem
// ─────────────────────────────────────────────

IndicatorReading FilesystemIndicator::probe(const ProbeContext& ctx) {
    IndicatorReading reading{.kind = kind()};

    // Express the window start on the filesystem clock.
    auto age = std::chrono::system_clock::now() - ctx.window_start;
    auto threshold = std::filesystem::file_time_type::clock::now()
        - std::chrono::duration_cast<std::filesystem::file_time_type::duration>(age);

    std::error_code ec;
    size_t visited = 0;
    auto it = std::filesystem::recursive_directory_iterator(
        ctx.workspace, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (++visited > max_entries_) break;
        if (it->path().filename() == ".git") {
            it.disable_recursion_pending();
            continue;
        }
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        auto mtime = it->last_write_time(file_ec);
        if (!file_ec && mtime > threshold) {
            reading.signaled = true;
            reading.detail = it->path().lexically_relative(ctx.workspace).string();
            break;
        }
    }
    return reading;
}

// ─────────────────────────────────────────────
// Version control
// ─────────────────────────────────────────────

IndicatorReading VcsIndicator::probe(const ProbeContext& ctx) {
    IndicatorReading reading{.kind = kind()};
    if (ctx.branch.empty()) return reading;
    auto last = vcs_->last_commit_time(ctx.repo_root, ctx.branch);
    if (!last) return reading;

    // Commit times have whole-second resolution.
    auto window = std::chrono::floor<std::chrono::seconds>(ctx.window_start);
    if (*last >= window && reported_ != last) {
        reading.signaled = true;
        reading.detail = format_timestamp(*last);
        reported_ = last;
    }
    return reading;
}

// ─────────────────────────────────────────────
// Log growth
// ─────────────────────────────────────────────

IndicatorReading LogGrowthIndicator::probe(const ProbeContext& ctx) {
    IndicatorReading reading{.kind = kind()};
    std::error_code ec;
    auto size = std::filesystem::file_size(ctx.log_path, ec);
    if (ec) size = 0;

    if (last_size_) {
        // A truncated log restarts the baseline.
        auto growth = size >= *last_size_ ? size - *last_size_ : size;
        if (growth > min_bytes_) {
            reading.signaled = true;
        }
        reading.detail = "+" + std::to_string(growth) + " bytes";
    }
    last_size_ = size;
    return reading;
}

// ─────────────────────────────────────────────
// Output pattern
// ─────────────────────────────────────────────

IndicatorReading OutputPatternIndicator::probe(const ProbeContext& ctx) {
    IndicatorReading reading{.kind = kind()};
    auto tail = read_log_tail(ctx.log_path);
    auto lines = last_lines(tail, window_);

    std::string joined;
    for (const auto& line : lines) {
        joined += line;
        joined.push_back('\n');
    }
    auto digest = std::hash<std::string>{}(joined);
    bool is_new = !lines.empty() && (!last_digest_ || *last_digest_ != digest);
    last_digest_ = digest;

    reading.degenerate = is_degenerate(lines, window_, max_distinct_);
    reading.signaled = is_new && !reading.degenerate;
    if (reading.degenerate) {
        reading.detail = "repetitive output in last " + std::to_string(lines.size()) + " lines";
    } else if (!lines.empty()) {
        reading.detail = lines.back().substr(0, 120);
    }
    return reading;
}

// ─────────────────────────────────────────────
// ProgressProbe
// ─────────────────────────────────────────────

ProgressProbe::ProgressProbe(const WatchdogPolicy& policy, IVcsBackend& vcs, ProbeContext base)
    : policy_(policy)
    , ctx_(std::move(base))
    , vcs_(vcs)
    , log_growth_(policy.min_log_growth_bytes)
    , output_pattern_(policy.repetition_window, policy.repetition_max_distinct) {
    // Output written before this attempt is not progress.
    std::error_code ec;
    auto size = std::filesystem::file_size(ctx_.log_path, ec);
    log_growth_.reset_baseline(ec ? 0 : size);
    if (policy_.uses(Indicator::OutputPattern)) {
        output_pattern_.probe(ctx_);
    }
}

IndicatorSample ProgressProbe::sample(const TaskId& task_id, uint32_t attempt, Timestamp now) {
    ctx_.now = now;
    IndicatorSample sample{.task_id = task_id, .attempt = attempt, .at = now, .readings = {}};

    if (policy_.uses(Indicator::Filesystem)) sample.readings.push_back(filesystem_.probe(ctx_));
    if (policy_.uses(Indicator::VersionControl)) sample.readings.push_back(vcs_.probe(ctx_));
    if (policy_.uses(Indicator::LogGrowth)) sample.readings.push_back(log_growth_.probe(ctx_));
    if (policy_.uses(Indicator::OutputPattern)) sample.readings.push_back(output_pattern_.probe(ctx_));

    ctx_.window_start = now;
    return sample;
}

// ─────────────────────────────────────────────
// Log helpers
// ─────────────────────────────────────────────

std::string read_log_tail(const std::filesystem::path& path, size_t max_bytes) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) return {};
    auto size = static_cast<size_t>(file.tellg());
    auto offset = size > max_bytes ? size - max_bytes : 0;
    file.seekg(static_cast<std::streamoff>(offset));

    std::string tail(size - offset, '\0');
    file.read(tail.data(), static_cast<std::streamsize>(tail.size()));
    tail.resize(static_cast<size_t>(file.gcount()));

    if (offset > 0) {
        if (auto newline = tail.find('\n'); newline != std::string::npos) {
            tail.erase(0, newline + 1);
        }
    }
    return tail;
}

std::vector<std::string> last_lines(const std::string& text, size_t count) {
    std::vector<std::string> all;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) all.push_back(line);
    }
    if (all.size() > count) {
        all.erase(all.begin(), all.end() - static_cast<std::ptrdiff_t>(count));
    }
    return all;
}

bool is_degenerate(const std::vector<std::string>& lines, uint32_t window, uint32_t max_distinct) {
    if (window == 0 || lines.size() < window) return false;
    std::set<std::string> distinct;
    for (auto it = lines.end() - static_cast<std::ptrdiff_t>(window); it != lines.end(); ++it) {
        distinct.insert(normalize_line(*it));
        if (distinct.size() > max_distinct) return false;
    }
    return true;
}

}  // namespace agent_orchestrator
