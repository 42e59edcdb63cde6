/**
 * @file graph_builder.cpp
 * @brief TaskGraphBuilder implementation.
 * @author Dimitris Kafetzis
 */

#include "graph/graph_builder.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace agent_orchestrator {

namespace {

std::filesystem::path resolve(const std::filesystem::path& value,
                              const std::filesystem::path& base) {
    auto path = value.is_absolute() ? value : base / value;
    return path.lexically_normal();
}

std::string join(const std::vector<TaskId>& ids, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += sep;
        out += ids[i];
    }
    return out;
}

bool phase_selected(const BuildOptions& options, Phase phase) {
    return options.phases.empty()
        || std::find(options.phases.begin(), options.phases.end(), phase) != options.phases.end();
}

Result<void> validate_fields(const TaskSpec& spec, const BuildOptions& options) {
    if (spec.workspace_path.empty()) {
        return Error{ErrorKind::Config,
                     "Task '" + spec.id + "' missing required field 'workspace_path'"};
    }
    if (spec.prompt.empty()) {
        return Error{ErrorKind::Config, "Task '" + spec.id + "' missing required field 'prompt'"};
    }
    if (spec.command.empty()) {
        if (spec.runner.empty() && options.runners.size() != 1) {
            return Error{ErrorKind::Config,
                         "Task '" + spec.id + "' missing required field 'command' or 'runner'"};
        }
        if (!spec.runner.empty() && !options.runners.contains(spec.runner)) {
            return Error{ErrorKind::Config,
                         "Runner '" + spec.runner + "' not found in config (task '" + spec.id + "')"};
        }
    }
    if (!spec.escalation.alternate_runner.empty()
        && !options.runners.contains(spec.escalation.alternate_runner)) {
        return Error{ErrorKind::Config, "Task '" + spec.id + "': alternate runner '"
                                            + spec.escalation.alternate_runner + "' not found"};
    }
    return Result<void>{};
}

}  // namespace

TemplateVars TaskGraphBuilder::command_placeholders() {
    return TemplateVars{
        {"prompt", "{prompt}"},   {"task", "{task}"},       {"run_id", "{run_id}"},
        {"phase", "{phase}"},     {"branch", "{branch}"},   {"workspace", "{workspace}"},
        {"handoff", "{handoff}"},
    };
}

Result<TaskGraph> TaskGraphBuilder::build(const std::vector<TaskSpec>& specs,
                                          const BuildOptions& options) {
    // ── Identity and required fields ──────────
    std::unordered_map<TaskId, const TaskSpec*> by_id;
    for (const auto& spec : specs) {
        if (spec.id.empty()) {
            return Error{ErrorKind::Config, "Each task must have a non-empty 'id'"};
        }
        if (!by_id.emplace(spec.id, &spec).second) {
            return Error{ErrorKind::Config, "Duplicate task id: " + spec.id};
        }
        if (auto valid = validate_fields(spec, options); !valid) {
            return valid.error();
        }
    }

    for (const auto& spec : specs) {
        for (const auto& dep : spec.depends_on) {
            if (!by_id.contains(dep)) {
                return Error{ErrorKind::Config,
                             "Task '" + spec.id + "' depends on unknown task '" + dep + "'"};
            }
        }
    }

    // ── Cycle detection over the full declaration ──
    {
        TaskGraph full;
        for (const auto& spec : specs) {
            full.add_task(Task{.id = spec.id});
        }
        for (const auto& spec : specs) {
            for (const auto& dep : spec.depends_on) {
                full.add_dependency(dep, spec.id);
            }
        }
        if (auto cycle = full.find_cycle()) {
            return Error{ErrorKind::DependencyCycle,
                         "Dependency cycle detected: " + join(*cycle, " -> ")};
        }
    }

    // ── Selection ─────────────────────────────
    std::unordered_set<TaskId> selected;
    for (const auto& spec : specs) {
        if (phase_selected(options, spec.phase)) selected.insert(spec.id);
    }

    for (const auto& spec : specs) {
        if (!selected.contains(spec.id)) continue;
        if (spec.manual && !options.include_manual) continue;

        std::vector<TaskId> missing;
        for (const auto& dep : spec.depends_on) {
            const auto* dep_spec = by_id.at(dep);
            if (!selected.contains(dep) || (dep_spec->manual && !options.include_manual)) {
                missing.push_back(dep);
            }
        }
        if (!missing.empty()) {
            return Error{ErrorKind::Config, "Task '" + spec.id
                                                + "' depends on excluded tasks: " + join(missing, ", ")};
        }
    }

    // ── Expansion ─────────────────────────────
    TaskGraph graph;
    for (const auto& spec : specs) {
        if (!selected.contains(spec.id)) continue;

        TemplateVars vars{
            {"run_id", options.run_id},
            {"phase", std::string{to_string(spec.phase)}},
            {"task", spec.id},
        };

        auto branch = expand_template(spec.branch, vars);
        if (!branch) return branch.error();
        if (branch->empty()) {
            return Error{ErrorKind::Config, "Task '" + spec.id + "' expands to an empty branch"};
        }
        auto workspace = expand_template(spec.workspace_path, vars);
        if (!workspace) return workspace.error();

        Task task;
        task.id = spec.id;
        task.phase = spec.phase;
        task.branch = *branch;
        task.workspace_path = resolve(*workspace, options.project_root);
        task.prompt = resolve(spec.prompt, options.project_root);
        if (!spec.reduced_prompt.empty()) {
            task.reduced_prompt = resolve(spec.reduced_prompt, options.project_root);
        }
        task.manual = spec.manual;
        task.watchdog = spec.watchdog;
        task.escalation = spec.escalation;

        if (!spec.command.empty()) {
            task.runner = "inline";
            task.command = spec.command;
        } else {
            const auto& runner = spec.runner.empty()
                ? options.runners.begin()->second
                : options.runners.at(spec.runner);
            task.runner = runner.name;
            task.command = runner.command;
        }
        if (auto valid = validate_template(task.command, command_placeholders()); !valid) {
            return Error{ErrorKind::Config,
                         "Task '" + spec.id + "': " + valid.error().message};
        }

        if (!spec.log.empty()) {
            auto log = expand_template(spec.log, vars);
            if (!log) return log.error();
            task.log_path = resolve(*log, options.project_root);
        } else {
            task.log_path = options.logs_dir / (spec.id + ".log");
        }

        graph.add_task(std::move(task));
    }

    for (const auto& spec : specs) {
        if (!selected.contains(spec.id)) continue;
        for (const auto& dep : spec.depends_on) {
            graph.add_dependency(dep, spec.id);
        }
    }

    return graph;
}

std::map<Phase, std::vector<TaskId>> TaskGraphBuilder::partition_by_phase(const TaskGraph& graph) {
    std::map<Phase, std::vector<TaskId>> partition;
    for (const auto& id : graph.task_ids()) {
        partition[graph.get_task(id)->phase].push_back(id);
    }
    return partition;
}

}  // namespace agent_orchestrator
