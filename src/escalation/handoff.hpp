/**
 * @file handoff.hpp
 * @brief Handoff artifact written before a task switches to another worker.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct HandoffInput {
    TaskId task_id;
    std::string branch;
    std::filesystem::path workspace;
    std::string previous_runner;
    std::string next_runner;
    uint32_t attempt = 0;
    std::string reason;
    std::vector<std::string> commits;               ///< Completed subtasks, newest first
    std::vector<std::string> log_tail;              ///< Last known blocker
    std::string diff_stat;
};

/// <logs_dir>/handoff/<task_id>.md
[[nodiscard]] std::filesystem::path handoff_path(const std::filesystem::path& logs_dir,
                                                 const TaskId& task_id);

[[nodiscard]] std::string render_handoff(const HandoffInput& input, Timestamp at);

/// Render and write (replacing any earlier handoff of the task).
Result<std::filesystem::path> write_handoff(const std::filesystem::path& logs_dir,
                                            const HandoffInput& input);

}  // namespace agent_orchestrator
