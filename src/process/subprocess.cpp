/**
 * @file subprocess.cpp
 * @brief run_command / find_executable implementation on POSIX.
 * @author Dimitris Kafetzis
 */

#include "process/subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agent_orchestrator {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool make_pipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

}  // namespace

Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd) {
    if (argv.empty()) {
        return Error{ErrorKind::ProcessLaunch, "empty command"};
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // carries errno if exec fails
    if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        int saved = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return Error{ErrorKind::ProcessLaunch, std::string{"pipe failed: "} + std::strerror(saved)};
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    std::string cwd_str = cwd.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return Error{ErrorKind::ProcessLaunch, std::string{"fork failed: "} + std::strerror(saved)};
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvp(c_argv[0], c_argv.data());
        int err = errno;
        (void)!::write(exec_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    CommandOutput output;
    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&output.stdout_text, &output.stderr_text};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (got > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(got));
            } else if (got == 0 || (got < 0 && errno != EINTR)) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) ::close(fd.fd);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorKind::Internal, std::string{"waitpid failed: "} + std::strerror(errno)};
        }
    }

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return Error{ErrorKind::ProcessLaunch,
                     "cannot execute '" + argv[0] + "': " + std::strerror(exec_errno)};
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    return output;
}

std::optional<std::filesystem::path> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    auto is_executable = [](const std::filesystem::path& p) {
        struct stat st{};
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        std::filesystem::path p{name};
        if (is_executable(p)) return p;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::stringstream ss(search);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = std::filesystem::path{dir} / name;
        if (is_executable(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string first_word(std::string_view command_line) {
    std::string word;
    char quote = 0;
    size_t i = 0;
    while (i < command_line.size() && (command_line[i] == ' ' || command_line[i] == '\t')) ++i;

    for (; i < command_line.size(); ++i) {
        char c = command_line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < command_line.size()) {
                word.push_back(command_line[++i]);
            } else {
                word.push_back(c);
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < command_line.size()) {
            word.push_back(command_line[++i]);
        } else if (c == ' ' || c == '\t' || c == ';' || c == '|' || c == '&' || c == '<' || c == '>') {
            break;
        } else {
            word.push_back(c);
        }
    }
    return word;
}

bool is_shell_builtin(std::string_view word) {
    static constexpr std::string_view kBuiltins[] = {
        ":", ".", "[", "alias", "bg", "break", "case", "cd", "command", "continue", "echo",
        "eval", "exec", "exit", "export", "false", "fg", "for", "if", "kill", "printf",
        "pwd", "read", "readonly", "return", "set", "shift", "source", "test", "times",
        "trap", "true", "type", "ulimit", "umask", "unset", "until", "wait", "while", "{", "(",
    };
    if (word.empty()) return true;
    if (word.find_first_of("$`=(") != std::string_view::npos) return true;
    for (auto builtin : kBuiltins) {
        if (word == builtin) return true;
    }
    return false;
}

}  // namespace agent_orchestrator
