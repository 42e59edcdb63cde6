/**
 * @file preflight.hpp
 * @brief Environment checks run before any lock is taken or task started.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "graph/task_graph.hpp"
#include "workspace/vcs.hpp"

#include <string>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Collect every problem that would make the run fail part-way.
 *
 * Only the tasks the run will schedule are inspected. Returns the list of
 * problems; empty means the run may proceed.
 */
std::vector<std::string> preflight_problems(const TaskGraph& graph, bool include_manual,
                                            const Config& config, IVcsBackend& vcs);

/// preflight_problems() folded into one ConfigError.
Result<void> run_preflight(const TaskGraph& graph, bool include_manual,
                           const Config& config, IVcsBackend& vcs);

}  // namespace agent_orchestrator
