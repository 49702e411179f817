/**
 * @file orchestration.hpp
 * @brief Backend-independent facade over a container engine adapter
 *
 * Callers program against Orchestration and pick the backend once, either
 * by handing in an adapter or through MakeAdapter() and a configuration.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/adapter.hpp"
#include "dockhand/core/config.hpp"

#include <future>
#include <memory>

namespace dockhand {
namespace core {

/**
 * @brief Construct the adapter selected by a configuration
 *
 * Backend::CLI yields adapters::DockerCli using `config.docker_binary`;
 * Backend::API yields adapters::DockerApi using `config.socket_path`.
 * Credentials and AdapterConfig are passed through.
 */
std::shared_ptr<Adapter> MakeAdapter(const OrchestrationConfig& config);

/**
 * @class Orchestration
 * @brief Thin delegating facade over one Adapter
 *
 * Every operation forwards its arguments unchanged and returns the adapter's
 * result or propagates its exception. The *Async variants run the blocking
 * call on a separate thread; exceptions surface from future::get().
 *
 * **Usage Example**:
 * @code
 * OrchestrationConfig config;
 * config.backend = Backend::API;
 * Orchestration orchestration(MakeAdapter(config));
 *
 * orchestration.CreateNetwork("jobs", true);
 * auto run = orchestration.RunAsync(RunSpecBuilder("alpine", "job")
 *     .WithNetwork("jobs")
 *     .WithCommand({"sleep", "30"})
 *     .Build());
 * std::string id = run.get();
 * @endcode
 *
 * **Thread Safety**: As safe as the wrapped adapter; both shipped adapters
 * accept concurrent calls against different containers.
 */
class Orchestration {
public:
    /**
     * @brief Wrap an adapter
     * @throws ConfigError if @p adapter is null
     */
    explicit Orchestration(std::shared_ptr<Adapter> adapter);

    // ========================================================================
    // Networks
    // ========================================================================

    void CreateNetwork(const std::string& name, bool internal = false);
    void RemoveNetwork(const std::string& name);
    void NetworkConnect(const std::string& container, const std::string& network);
    void NetworkDisconnect(const std::string& container, const std::string& network,
                           bool force = false);
    std::vector<Network> ListNetworks();

    // ========================================================================
    // Containers
    // ========================================================================

    std::vector<Stats> GetStats(const std::optional<std::string>& container = std::nullopt,
                                const Filters& filters = {});
    void Pull(const std::string& image);
    std::vector<Container> List(const Filters& filters = {});
    std::string Run(const RunSpec& spec);
    ExecResult Execute(const std::string& name,
                       const std::vector<std::string>& command,
                       const std::map<std::string, std::string>& vars = {},
                       std::optional<std::chrono::seconds> timeout = std::nullopt);
    void Remove(const std::string& name, bool force = false);

    // ========================================================================
    // Asynchronous variants
    // ========================================================================

    std::future<std::string> RunAsync(const RunSpec& spec);
    std::future<ExecResult> ExecuteAsync(const std::string& name,
                                         const std::vector<std::string>& command,
                                         const std::map<std::string, std::string>& vars = {},
                                         std::optional<std::chrono::seconds> timeout = std::nullopt);
    std::future<std::vector<Stats>> GetStatsAsync(
        const std::optional<std::string>& container = std::nullopt,
        const Filters& filters = {});
    std::future<void> PullAsync(const std::string& image);

    Adapter& GetAdapter() const { return *adapter_; }
    const AdapterConfig& GetConfig() const { return adapter_->GetConfig(); }

private:
    std::shared_ptr<Adapter> adapter_;  ///< Backend implementation
};

} // namespace core
} // namespace dockhand
