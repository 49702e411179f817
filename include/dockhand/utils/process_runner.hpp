/**
 * @file process_runner.hpp
 * @brief Execution of backend command lines with captured output
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace dockhand {
namespace utils {

/**
 * @struct CommandResult
 * @brief Outcome of one command invocation
 */
struct CommandResult {
    int exit_code{0};           ///< Exit status (128 + signal when killed)
    std::string stdout_output;  ///< Captured standard output
    std::string stderr_output;  ///< Captured standard error
};

/**
 * @class CommandRunner
 * @brief Abstract command execution seam used by the CLI adapter
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command and wait for it to finish
     * @param argv Program followed by its argument tokens (shell words)
     * @param stdin_data Bytes written to the command's standard input
     * @return Exit code and captured output
     * @throws core::BackendInvocationError if the process cannot be launched
     */
    virtual CommandResult Run(const std::vector<std::string>& argv,
                              const std::string& stdin_data = "") = 0;
};

/**
 * @class ShellCommandRunner
 * @brief Runs the joined argv through `/bin/sh -c`
 *
 * Standard output and standard error are captured separately. The working
 * directory is inherited from the calling process.
 *
 * @note Constructing a runner sets the process-wide SIGPIPE disposition to
 *       SIG_IGN, so a command that exits before consuming its stdin surfaces
 *       as EPIPE instead of terminating the caller. Code that relies on the
 *       default SIGPIPE action must not share a process with this runner.
 */
class ShellCommandRunner : public CommandRunner {
public:
    ShellCommandRunner();

    CommandResult Run(const std::vector<std::string>& argv,
                      const std::string& stdin_data = "") override;
};

} // namespace utils
} // namespace dockhand
