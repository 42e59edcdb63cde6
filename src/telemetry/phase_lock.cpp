/**
 * @file phase_lock.cpp
 * @brief PhaseLock implementation (atomic exclusive file creation).
 * @author Dimitris Kafetzis
 */

#include "telemetry/phase_lock.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>

namespace agent_orchestrator {

std::filesystem::path lock_path(const std::filesystem::path& logs_dir, Phase phase) {
    if (phase == Phase::Main) return logs_dir / "framework-run.lock";
    return logs_dir / ("framework-run-" + std::string{to_string(phase)} + ".lock");
}

namespace {

Error held_error(const std::filesystem::path& path, Phase phase) {
    auto message = "phase lock for '" + std::string{to_string(phase)} + "' is held: "
                 + path.string();
    if (auto holder = PhaseLock::inspect(path.parent_path(), phase)) {
        message += " (run " + holder->holder_run_id + " since "
                 + format_timestamp(holder->acquired_at) + ")";
    }
    return Error{ErrorKind::PhaseLockHeld, std::move(message)};
}

}  // namespace

PhaseLock::~PhaseLock() {
    // Destructor cannot report; release() is called explicitly on normal paths.
    (void)release();
}

PhaseLock::PhaseLock(PhaseLock&& other) noexcept
    : path_(std::move(other.path_)), info_(std::move(other.info_)), held_(other.held_) {
    other.held_ = false;
}

PhaseLock& PhaseLock::operator=(PhaseLock&& other) noexcept {
    if (this != &other) {
        (void)release();
        path_ = std::move(other.path_);
        info_ = std::move(other.info_);
        held_ = other.held_;
        other.held_ = false;
    }
    return *this;
}

Result<PhaseLock> PhaseLock::acquire(const std::filesystem::path& logs_dir, Phase phase,
                                     const RunId& run_id) {
    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    if (ec) {
        return Error{ErrorKind::Io, "cannot create " + logs_dir.string() + ": " + ec.message()};
    }

    auto path = lock_path(logs_dir, phase);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return held_error(path, phase);
        return Error{ErrorKind::Io, "cannot create " + path.string() + ": " + std::strerror(errno)};
    }

    PhaseLock lock;
    lock.path_ = path;
    lock.info_ = PhaseLockInfo{phase, run_id, std::chrono::system_clock::now()};
    lock.held_ = true;

    nlohmann::json payload{
        {"run_id", run_id},
        {"phase", std::string{to_string(phase)}},
        {"started_at", format_timestamp(lock.info_.acquired_at)},
    };
    auto text = payload.dump() + "\n";
    const char* data = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return Error{ErrorKind::Io, "cannot write " + path.string() + ": " + std::strerror(err)};
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    ::close(fd);
    return lock;
}

Result<void> PhaseLock::ensure_clear(const std::filesystem::path& logs_dir, Phase phase) {
    auto path = lock_path(logs_dir, phase);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) return held_error(path, phase);
    return {};
}

std::optional<PhaseLockInfo> PhaseLock::inspect(const std::filesystem::path& logs_dir, Phase phase) {
    std::ifstream in(lock_path(logs_dir, phase));
    if (!in) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        auto json = nlohmann::json::parse(buffer.str());
        PhaseLockInfo info;
        info.phase = parse_phase(json.value("phase", "")).value_or(phase);
        info.holder_run_id = json.value("run_id", "");
        if (auto ts = parse_timestamp(json.value("started_at", ""))) info.acquired_at = *ts;
        return info;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

Result<void> PhaseLock::release() {
    if (!held_) return {};
    held_ = false;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorKind::Io, "cannot remove " + path_.string() + ": " + ec.message()};
    }
    return {};
}

}  // namespace agent_orchestrator
