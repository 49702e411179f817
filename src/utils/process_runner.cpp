/**
 * @file process_runner.cpp
 * @brief fork/exec based command execution with separate output pipes
 *
 * **Process Layout**:
 * ```
 * parent ── stdin pipe ──▶ /bin/sh -c "<argv joined>"
 *        ◀─ stdout pipe ──
 *        ◀─ stderr pipe ──
 * ```
 * Both output pipes are drained with poll() so a chatty stderr can never
 * block the child while the parent waits on stdout.
 *
 * @date 2025
 */

#include "dockhand/utils/process_runner.hpp"
#include "dockhand/utils/string_utils.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dockhand {
namespace utils {

namespace {

void ClosePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

void WriteAll(int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            // Child closed stdin early (EPIPE); remaining input is irrelevant
            spdlog::debug("Stopped writing stdin: {}", strerror(errno));
            return;
        }
        written += static_cast<std::size_t>(n);
    }
}

void DrainOutputs(int stdout_fd, int stderr_fd, CommandResult& result) {
    std::array<char, 4096> buffer;
    std::array<pollfd, 2> fds = {{
        {stdout_fd, POLLIN, 0},
        {stderr_fd, POLLIN, 0}
    }};
    std::array<std::string*, 2> sinks = {&result.stdout_output, &result.stderr_output};
    int open_count = 2;

    while (open_count > 0) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw core::BackendInvocationError("Failed to read command output", strerror(errno));
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;

            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // anonymous namespace

ShellCommandRunner::ShellCommandRunner() {
    // A child that exits before reading stdin must not kill us with SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
}

CommandResult ShellCommandRunner::Run(const std::vector<std::string>& argv,
                                      const std::string& stdin_data) {
    std::string command = StringUtils::Join(argv, " ");
    spdlog::debug("Executing: {}", command);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};

    // Close-on-exec so children forked by concurrent calls never hold our ends
    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0) {
        std::string reason = strerror(errno);
        ClosePipe(in_pipe);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        throw core::BackendInvocationError("Failed to create pipes", reason);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = strerror(errno);
        ClosePipe(in_pipe);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        throw core::BackendInvocationError("Failed to fork", reason);
    }

    if (pid == 0) {
        // Child process - wire pipes to stdio and exec the shell
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        ClosePipe(in_pipe);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);

        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    // Parent process
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    WriteAll(in_pipe[1], stdin_data);
    close(in_pipe[1]);

    CommandResult result;
    DrainOutputs(out_pipe[0], err_pipe[0], result);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw core::BackendInvocationError("Failed to wait for command", strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    spdlog::debug("Command exited with code {}", result.exit_code);
    return result;
}

} // namespace utils
} // namespace dockhand
