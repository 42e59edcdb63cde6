/**
 * @file json_sink.hpp
 * @brief NDJSON line sinks: rotating file, stdout, null, in-memory.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Appends lines to a file, rotating it past a size limit.
 *
 * Rotation renames file -> file.1 -> file.2 ... and drops the oldest.
 * max_file_size_mb = 0 disables rotation (the run event stream is never rotated).
 */
class JsonFileSink : public ILogSink {
public:
    explicit JsonFileSink(const std::filesystem::path& file,
                          uint32_t max_file_size_mb = 50,
                          uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return current_file_.is_open(); }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void rotate_if_needed();

    std::filesystem::path path_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to a stream (stdout by default).
 */
class StdoutSink : public ILogSink {
public:
    StdoutSink();
    explicit StdoutSink(std::ostream& out) : out_(&out) {}

    void write(std::string_view json_line) override;
    void flush() override;

private:
    std::ostream* out_;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps lines in memory for tests.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

}  // namespace agent_orchestrator
