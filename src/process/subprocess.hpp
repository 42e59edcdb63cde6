/**
 * @file subprocess.hpp
 * @brief Synchronous child-process helpers (fork/exec, no shell).
 * @author Dimitris Kafetzis
 *
 * Used for short version-control commands. Long-running workers go through
 * IWorkerBackend instead.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agent_orchestrator {

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

/**
 * @brief Run argv[0] (PATH lookup) in `cwd`, capture both streams, wait.
 *
 * Fails with ProcessLaunch when the program cannot be executed at all.
 */
Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd = {});

/**
 * @brief Locate an executable the way execvp would.
 */
std::optional<std::filesystem::path> find_executable(const std::string& name);

/**
 * @brief First word of a shell command line (quotes honoured, no expansion).
 */
std::string first_word(std::string_view command_line);

/**
 * @brief True for words /bin/sh resolves without a PATH lookup
 *        (builtins, keywords, variable assignments, expansions).
 */
bool is_shell_builtin(std::string_view word);

}  // namespace agent_orchestrator
