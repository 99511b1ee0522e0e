/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <command.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace DisplayDetect {

namespace {
//!
//! \brief Owns a pipe file descriptor pair and closes whatever is still open on destruction.
//!
class Pipe
{
public:
    Pipe()
    {
        if (pipe2(m_fd, O_CLOEXEC) == -1) {
            throw CommandException(strprintf("Failed to create pipe: %s", strerror(errno)));
        }
    }

    ~Pipe()
    {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return m_fd[0]; }
    int WriteEnd() const { return m_fd[1]; }

    void CloseRead()
    {
        if (m_fd[0] != -1) {
            close(m_fd[0]);
            m_fd[0] = -1;
        }
    }

    void CloseWrite()
    {
        if (m_fd[1] != -1) {
            close(m_fd[1]);
            m_fd[1] = -1;
        }
    }

private:
    int m_fd[2] = {-1, -1};
};

//!
//! \brief Builds the argv array for execv. The returned pointers reference the strings in command.
//!
std::vector<char*> MakeArgv(const CommandLine& command)
{
    std::vector<char*> argv;

    for (const auto& arg : command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }

    argv.push_back(nullptr);

    return argv;
}

//!
//! \brief Child side of a fork. Redirects stdin from /dev/null if requested, stdout to stdout_fd if it is not -1,
//! and execs. Never returns.
//!
[[noreturn]] void ExecChild(const fs::path& executable, std::vector<char*>& argv, bool null_stdin, int stdout_fd)
{
    if (null_stdin) {
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd != -1) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }
    }

    if (stdout_fd != -1) {
        dup2(stdout_fd, STDOUT_FILENO);
    }

    execv(executable.c_str(), argv.data());
    _exit(127);
}

int DecodeWaitStatus(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return -1;
}
} // anonymous namespace

std::optional<fs::path> FindExecutable(const std::string& name)
{
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const fs::path& candidate) {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) {
            return fs::path(name);
        }

        return std::nullopt;
    }

    std::optional<std::string> path_env = GetEnvVariable("PATH");

    if (!path_env || path_env->empty()) {
        path_env = "/usr/local/bin:/usr/bin:/bin";
    }

    for (const auto& dir : StringSplit(*path_env, ":")) {
        if (dir.empty()) {
            continue;
        }

        fs::path candidate = fs::path(dir) / name;

        if (is_executable(candidate)) {
            return candidate;
        }
    }

    return std::nullopt;
}

std::string CommandLineToString(const CommandLine& command)
{
    std::string out;

    for (const auto& arg : command) {
        if (!out.empty()) {
            out += " ";
        }

        out += arg;
    }

    return out;
}

std::optional<fs::path> SubprocessRunner::ResolveExecutable(const CommandLine& command, const char* caller) const
{
    if (command.empty()) {
        error_log("%s: Empty command line.", caller);
        return std::nullopt;
    }

    std::optional<fs::path> executable = FindExecutable(command[0]);

    if (!executable) {
        error_log("%s: Unable to run command, %s not found", caller, command[0]);
    }

    return executable;
}

std::optional<std::string> CommandRunner::GetCommandOutput(const CommandLine& command, int timeout_seconds)
{
    std::optional<CommandResult> result = ExecuteCommand(command, timeout_seconds);

    if (!result) {
        return std::nullopt;
    }

    return result->m_output;
}

std::optional<CommandResult> SubprocessRunner::ExecuteCommand(const CommandLine& command, int timeout_seconds)
{
    std::optional<fs::path> executable = ResolveExecutable(command, __func__);

    if (!executable) {
        return std::nullopt;
    }

    debug_log("INFO: %s: Running: %s", __func__, CommandLineToString(command));

    CommandResult result;
    bool timed_out = false;
    bool reached_eof = false;
    pid_t pid = -1;

    try {
        Pipe stdout_pipe;
        std::vector<char*> argv = MakeArgv(command);

        pid = fork();

        if (pid == -1) {
            throw CommandException(strprintf("fork failed for %s: %s", command[0], strerror(errno)));
        }

        if (pid == 0) {
            ExecChild(*executable, argv, true, stdout_pipe.WriteEnd());
        }

        stdout_pipe.CloseWrite();

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
        char buffer[4096];

        while (true) {
            int poll_timeout_ms = -1;

            if (timeout_seconds > 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now()).count();

                if (remaining <= 0) {
                    timed_out = true;
                    break;
                }

                poll_timeout_ms = static_cast<int>(remaining);
            }

            struct pollfd fds[1];
            fds[0].fd = stdout_pipe.ReadEnd();
            fds[0].events = POLLIN;
            fds[0].revents = 0;

            int ret = poll(fds, 1, poll_timeout_ms);

            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }

                error_log("%s: Error in poll() for %s output: %s", __func__, command[0], strerror(errno));
                break;
            }

            if (ret == 0) {
                continue; // Deadline is rechecked at the top of the loop.
            }

            ssize_t bytes_read = read(stdout_pipe.ReadEnd(), buffer, sizeof(buffer));

            if (bytes_read > 0) {
                result.m_output.append(buffer, static_cast<size_t>(bytes_read));
            } else if (bytes_read == 0) {
                reached_eof = true;
                break;
            } else if (errno != EINTR) {
                error_log("%s: Error reading output of %s: %s", __func__, command[0], strerror(errno));
                break;
            }
        }
    } catch (const CommandException& e) {
        error_log("%s: %s", __func__, e.what());
        return std::nullopt;
    }

    // Any exit from the read loop other than EOF leaves a child that may never exit on its own.
    if (!reached_eof) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

    if (timed_out) {
        error_log("%s: %s timed out after %d seconds.", __func__, command[0], timeout_seconds);
        return std::nullopt;
    }

    if (!reached_eof) {
        return std::nullopt;
    }

    result.m_exit_code = DecodeWaitStatus(status);

    debug_log("INFO: %s: %s exited with %d.", __func__, command[0], result.m_exit_code);

    return result;
}

bool SubprocessRunner::RunCommand(const CommandLine& command)
{
    std::optional<fs::path> executable = ResolveExecutable(command, __func__);

    if (!executable) {
        return false;
    }

    debug_log("INFO: %s: Spawning: %s", __func__, CommandLineToString(command));

    std::vector<char*> argv = MakeArgv(command);

    // Double fork so the grandchild is reparented and never becomes a zombie of this process.
    pid_t pid = fork();

    if (pid == -1) {
        error_log("%s: fork failed for %s: %s", __func__, command[0], strerror(errno));
        return false;
    }

    if (pid == 0) {
        setsid();

        pid_t grandchild = fork();

        if (grandchild == 0) {
            ExecChild(*executable, argv, true, -1);
        }

        _exit(grandchild == -1 ? 1 : 0);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

    if (DecodeWaitStatus(status) != 0) {
        error_log("%s: Failed to spawn %s.", __func__, command[0]);
        return false;
    }

    return true;
}

int SubprocessRunner::RunCommandAndWait(const CommandLine& command)
{
    std::optional<fs::path> executable = ResolveExecutable(command, __func__);

    if (!executable) {
        return -1;
    }

    log("INFO: %s: Running: %s", __func__, CommandLineToString(command));

    std::vector<char*> argv = MakeArgv(command);

    pid_t pid = fork();

    if (pid == -1) {
        error_log("%s: fork failed for %s: %s", __func__, command[0], strerror(errno));
        return -1;
    }

    if (pid == 0) {
        ExecChild(*executable, argv, false, -1);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            error_log("%s: waitpid failed for %s: %s", __func__, command[0], strerror(errno));
            return -1;
        }
    }

    return DecodeWaitStatus(status);
}

CommandRunner& GetDefaultCommandRunner()
{
    static SubprocessRunner runner;

    return runner;
}

} // namespace DisplayDetect
