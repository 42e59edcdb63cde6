/**
 * @file handoff.cpp
 * @brief Handoff artifact rendering.
 * @author Dimitris Kafetzis
 */

#include "escalation/handoff.hpp"

#include <chrono>
#include <fstream>
#include <sstream>

namespace agent_orchestrator {

std::filesystem::path handoff_path(const std::filesystem::path& logs_dir, const TaskId& task_id) {
    return logs_dir / "handoff" / (task_id + ".md");
}

std::string render_handoff(const HandoffInput& input, Timestamp at) {
    std::ostringstream md;
    md << "# Handoff: " << input.task_id << "\n\n"
       << "- Written: " << format_timestamp(at) << '\n'
       << "- Branch: `" << input.branch << "`\n"
       << "- Workspace: `" << input.workspace.string() << "`\n"
       << "- Attempt: " << input.attempt << '\n'
       << "- Previous worker: " << input.previous_runner << '\n'
       << "- Next worker: " << input.next_runner << '\n'
       << "- Reason: " << input.reason << "\n\n";

    md << "## Completed subtasks\n\n";
    if (input.commits.empty()) {
        md << "_No commits on the task branch yet._\n";
    } else {
        for (const auto& subject : input.commits) md << "- " << subject << '\n';
    }

    md << "\n## Last known blocker\n\n";
    if (input.log_tail.empty()) {
        md << "_The worker produced no output._\n";
    } else {
        md << "```\n";
        for (const auto& line : input.log_tail) md << line << '\n';
        md << "```\n";
    }

    md << "\n## Workspace diff\n\n";
    if (input.diff_stat.empty()) {
        md << "_No uncommitted or committed changes against the base._\n";
    } else {
        md << "```\n" << input.diff_stat << "\n```\n";
    }

    md << "\nContinue from the state above. The branch and workspace keep all prior work.\n";
    return md.str();
}

Result<std::filesystem::path> write_handoff(const std::filesystem::path& logs_dir,
                                            const HandoffInput& input) {
    auto path = handoff_path(logs_dir, input.task_id);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return Error{ErrorKind::Io, "cannot create " + path.parent_path().string() + ": " + ec.message()};
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorKind::Io, "cannot write handoff " + path.string()};
    }
    out << render_handoff(input, std::chrono::system_clock::now());
    out.close();
    if (!out) {
        return Error{ErrorKind::Io, "failed writing handoff " + path.string()};
    }
    return path;
}

}  // namespace agent_orchestrator
