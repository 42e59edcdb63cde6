/**
 * @file posix_backend.cpp
 * @brief PosixShellBackend: fork/exec of /bin/sh -c in a new process group.
 * @author Dimitris Kafetzis
 */

#include "process/subprocess.hpp"
#include "process/worker_backend.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace agent_orchestrator {

std::string describe(const ExitStatus& status) {
    if (status.signal) {
        return "killed by signal " + std::to_string(*status.signal);
    }
    return "exit code " + std::to_string(status.code);
}

namespace {

constexpr const char* kShell = "/bin/sh";

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv{*entry};
        auto eq = kv.find('=');
        auto key = kv.substr(0, eq);
        if (overrides.find(std::string{key}) != overrides.end()) continue;
        env.emplace_back(kv);
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

ExitStatus decode_wait_status(int status) {
    ExitStatus exit;
    if (WIFEXITED(status)) {
        exit.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
        exit.code = 128 + *exit.signal;
    }
    return exit;
}

}  // namespace

PosixShellBackend::PosixShellBackend(RunnerConfig runner) : runner_(std::move(runner)) {}

Result<ProcessHandle> PosixShellBackend::start(const LaunchRequest& request) {
    // /bin/sh reports a missing program as exit 127; surface it as a launch failure instead.
    auto program = first_word(request.command);
    if (!is_shell_builtin(program) && !find_executable(program)) {
        return Error{ErrorKind::ProcessLaunch,
                     "Task '" + request.task_id + "': executable not found: " + program};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(request.workdir, ec)) {
        return Error{ErrorKind::ProcessLaunch,
                     "Task '" + request.task_id + "': workspace is not a directory: "
                         + request.workdir.string()};
    }

    int log_fd = ::open(request.log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        return Error{ErrorKind::ProcessLaunch, "Task '" + request.task_id + "': cannot open log "
                                                   + request.log_path.string() + ": "
                                                   + std::strerror(errno)};
    }

    int exec_pipe[2] = {-1, -1};
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        ::close(log_fd);
        return Error{ErrorKind::ProcessLaunch, std::string{"pipe failed: "} + std::strerror(saved)};
    }

    auto env = build_environment(request.environment);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& entry : env) envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::string command = request.command;
    std::string workdir = request.workdir.string();
    char* argv[] = {const_cast<char*>("sh"), const_cast<char*>("-c"), command.data(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(log_fd);
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return Error{ErrorKind::ProcessLaunch, std::string{"fork failed: "} + std::strerror(saved)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(log_fd, STDOUT_FILENO);
        ::dup2(log_fd, STDERR_FILENO);
        if (::chdir(workdir.c_str()) != 0) {
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execve(kShell, argv, envp.data());
        int err = errno;
        (void)!::write(exec_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Also set from the parent so a signal sent right after start() hits the group.
    ::setpgid(pid, pid);
    ::close(log_fd);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return Error{ErrorKind::ProcessLaunch, "Task '" + request.task_id + "': cannot spawn "
                                                   + kShell + ": " + std::strerror(child_errno)};
    }

    return ProcessHandle{.pid = pid, .backend = runner_.name};
}

Result<void> PosixShellBackend::signal(const ProcessHandle& handle, SignalTier tier) {
    int sig = SIGKILL;
    switch (tier) {
        case SignalTier::Cooperative: sig = runner_.interrupt_signal; break;
        case SignalTier::Graceful:    sig = SIGTERM; break;
        case SignalTier::Forceful:    sig = SIGKILL; break;
    }

    {
        std::lock_guard lock(mutex_);
        if (reaped_.contains(handle.pid)) return Result<void>{};
    }

    if (::kill(-handle.pid, sig) != 0) {
        if (errno == ESRCH) {
            // Group gone; the leader may still be an unreaped zombie.
            if (::kill(handle.pid, sig) != 0 && errno != ESRCH) {
                return Error{ErrorKind::Internal, std::string{"kill failed: "} + std::strerror(errno)};
            }
            return Result<void>{};
        }
        return Error{ErrorKind::Internal, std::string{"kill failed: "} + std::strerror(errno)};
    }
    return Result<void>{};
}

std::optional<ExitStatus> PosixShellBackend::poll(const ProcessHandle& handle) {
    std::lock_guard lock(mutex_);
    if (auto it = reaped_.find(handle.pid); it != reaped_.end()) {
        return it->second;
    }

    int status = 0;
    pid_t rc = ::waitpid(handle.pid, &status, WNOHANG);
    if (rc == 0) return std::nullopt;
    if (rc < 0) {
        if (errno == EINTR) return std::nullopt;
        // ECHILD: reaped elsewhere; report an unknown exit rather than hang forever.
        ExitStatus unknown;
        reaped_.emplace(handle.pid, unknown);
        return unknown;
    }

    auto exit = decode_wait_status(status);
    reaped_.emplace(handle.pid, exit);
    return exit;
}

// ─────────────────────────────────────────────
// BackendRegistry
// ─────────────────────────────────────────────

void BackendRegistry::add(const std::string& runner, std::shared_ptr<IWorkerBackend> backend) {
    backends_.insert_or_assign(runner, std::move(backend));
}

void BackendRegistry::set_fallback(std::shared_ptr<IWorkerBackend> backend) {
    fallback_ = std::move(backend);
}

IWorkerBackend* BackendRegistry::find(const std::string& runner) const {
    if (auto it = backends_.find(runner); it != backends_.end()) {
        return it->second.get();
    }
    return fallback_.get();
}

BackendRegistry BackendRegistry::from_config(const std::map<std::string, RunnerConfig>& runners) {
    BackendRegistry registry;
    for (const auto& [name, runner] : runners) {
        registry.add(name, std::make_shared<PosixShellBackend>(runner));
    }
    registry.set_fallback(std::make_shared<PosixShellBackend>(RunnerConfig{.name = "inline"}));
    return registry;
}

BackendRegistry BackendRegistry::single(std::shared_ptr<IWorkerBackend> backend) {
    BackendRegistry registry;
    registry.set_fallback(std::move(backend));
    return registry;
}

}  // namespace agent_orchestrator
