/**
 * @file docker_cli.hpp
 * @brief Adapter driving the Docker command-line binary
 *
 * Every operation becomes one `docker ...` invocation executed through a
 * CommandRunner. Output is decoded by the response parser.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/adapter.hpp"
#include "dockhand/utils/process_runner.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dockhand {
namespace adapters {

/**
 * @class DockerCli
 * @brief Docker CLI backend
 *
 * **Invocation**:
 * ```
 * <docker_binary> <argv from CliArgumentBuilder>
 * ```
 * Execute() with a timeout wraps the call in the host `timeout` utility;
 * its exit code 124 is reported as TimeoutError.
 *
 * **Usage Example**:
 * @code
 * DockerCli cli(AdapterConfigBuilder().WithNamespace("ci").WithCpus(1).Build());
 * auto id = cli.Run(RunSpecBuilder("alpine", "job").WithCommand({"sleep", "60"}).Build());
 * auto result = cli.Execute("job", {"echo", "hello"});
 * cli.Remove("job", true);
 * @endcode
 */
class DockerCli : public core::Adapter {
public:
    /**
     * @brief Construct the adapter
     *
     * When credentials are supplied `docker login --password-stdin` runs
     * immediately. A failed login is logged and does not abort construction.
     *
     * @param config Namespace and resource limits
     * @param docker_binary Docker executable (resolved through PATH)
     * @param credentials Optional registry login
     * @param runner Command executor (ShellCommandRunner when null)
     */
    explicit DockerCli(core::AdapterConfig config = {},
                       std::string docker_binary = "docker",
                       const std::optional<core::Credentials>& credentials = std::nullopt,
                       std::shared_ptr<utils::CommandRunner> runner = nullptr);

    void CreateNetwork(const std::string& name, bool internal = false) override;
    void RemoveNetwork(const std::string& name) override;
    void NetworkConnect(const std::string& container, const std::string& network) override;
    void NetworkDisconnect(const std::string& container,
                           const std::string& network,
                           bool force = false) override;
    std::vector<core::Network> ListNetworks() override;

    std::vector<core::Stats> GetStats(const std::optional<std::string>& container,
                                      const core::Filters& filters = {}) override;
    void Pull(const std::string& image) override;
    std::vector<core::Container> List(const core::Filters& filters = {}) override;
    std::string Run(const core::RunSpec& spec) override;
    core::ExecResult Execute(const std::string& name,
                             const std::vector<std::string>& command,
                             const std::map<std::string, std::string>& vars = {},
                             std::optional<std::chrono::seconds> timeout = std::nullopt) override;
    void Remove(const std::string& name, bool force = false) override;

    const std::string& GetDockerBinary() const { return docker_binary_; }

private:
    /**
     * @brief Run `<docker_binary> <args>`
     * @return Command result regardless of exit code
     */
    utils::CommandResult Invoke(const std::vector<std::string>& args,
                                const std::string& stdin_data = "");

    /**
     * @brief Run `<docker_binary> <args>` and require exit code 0
     * @throws core::BackendInvocationError with stderr otherwise
     */
    utils::CommandResult InvokeChecked(const std::string& operation,
                                       const std::vector<std::string>& args);

    void Login(const core::Credentials& credentials);

    std::string docker_binary_;                     ///< Docker executable
    std::shared_ptr<utils::CommandRunner> runner_;  ///< Process executor
};

} // namespace adapters
} // namespace dockhand
