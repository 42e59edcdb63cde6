/**
 * @file graph_builder.hpp
 * @brief Validates declarative task entries into a TaskGraph.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/template.hpp"
#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct BuildOptions {
    std::vector<Phase> phases;                      ///< Empty = every phase
    bool include_manual = false;
    RunId run_id = "preview";
    std::filesystem::path project_root = ".";
    std::filesystem::path logs_dir = "logs";
    std::map<std::string, RunnerConfig> runners;
};

/**
 * @brief Pure construction of the task graph for one run.
 *
 * Fails with ConfigError (duplicate id, dangling dependency, missing required
 * field, unknown runner or template key, dependency on an excluded task) or
 * DependencyCycleError. Never touches the filesystem.
 */
class TaskGraphBuilder {
public:
    static Result<TaskGraph> build(const std::vector<TaskSpec>& specs,
                                   const BuildOptions& options);

    /// Group task ids by phase, preserving declaration order.
    static std::map<Phase, std::vector<TaskId>> partition_by_phase(const TaskGraph& graph);

    /// Placeholders a worker command may reference (values are placeholders too).
    static TemplateVars command_placeholders();
};

}  // namespace agent_orchestrator
