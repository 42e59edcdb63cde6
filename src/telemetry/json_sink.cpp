/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>

namespace agent_orchestrator {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& file,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : path_(file)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    auto size = std::filesystem::file_size(path_, ec);
    current_size_ = ec ? 0 : size;
    current_file_.open(path_, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (max_file_size_bytes_ == 0 || current_size_ < max_file_size_bytes_) return;

    current_file_.close();
    std::error_code ec;
    auto numbered = [this](uint32_t n) {
        return std::filesystem::path{path_.string() + "." + std::to_string(n)};
    };
    if (max_files_ > 0) {
        std::filesystem::remove(numbered(max_files_), ec);
        for (uint32_t n = max_files_; n > 1; --n) {
            std::filesystem::rename(numbered(n - 1), numbered(n), ec);
        }
        std::filesystem::rename(path_, numbered(1), ec);
    } else {
        std::filesystem::remove(path_, ec);
    }

    current_file_.open(path_, std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

StdoutSink::StdoutSink() : out_(&std::cout) {}

void StdoutSink::write(std::string_view json_line) {
    *out_ << json_line << '\n';
}

void StdoutSink::flush() {
    out_->flush();
}

// ── MemorySink ───────────────────────────────

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(mutex_);
    lines_.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(mutex_);
    return lines_;
}

}  // namespace agent_orchestrator
