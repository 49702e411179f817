/**
 * @file adapter.hpp
 * @brief Backend-agnostic container engine contract
 *
 * Every backend (Docker CLI, Docker engine HTTP API) implements the same
 * operations so callers can swap one for the other without changes.
 *
 * **Failure Model**:
 * - Operations are fail-fast: a non-zero exit code or an unexpected HTTP
 *   status raises BackendInvocationError carrying the raw diagnostic
 * - Only Execute() accepts a timeout; expiry raises TimeoutError
 * - Nothing is retried
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/config.hpp"
#include "dockhand/core/container.hpp"
#include "dockhand/core/network.hpp"
#include "dockhand/core/run_spec.hpp"
#include "dockhand/core/stats.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dockhand {
namespace core {

/// Backend-native key=value filters ("label" -> "tier=web", "status" -> "running")
using Filters = std::map<std::string, std::string>;

/**
 * @class Adapter
 * @brief Abstract container engine adapter
 *
 * Adapters keep no mutable state after construction; concurrent calls
 * against different containers are safe. Mutations of the same container
 * or network are not coordinated.
 */
class Adapter {
public:
    explicit Adapter(AdapterConfig config) : config_(std::move(config)) {}
    virtual ~Adapter() = default;

    Adapter(const Adapter&) = delete;
    Adapter& operator=(const Adapter&) = delete;

    // ========================================================================
    // Networks
    // ========================================================================

    /**
     * @brief Create a network
     * @param name Network name
     * @param internal Restrict external access to the network
     */
    virtual void CreateNetwork(const std::string& name, bool internal = false) = 0;

    virtual void RemoveNetwork(const std::string& name) = 0;

    /// Attach a container to a network
    virtual void NetworkConnect(const std::string& container, const std::string& network) = 0;

    /// Detach a container from a network
    virtual void NetworkDisconnect(const std::string& container,
                                   const std::string& network,
                                   bool force = false) = 0;

    virtual std::vector<Network> ListNetworks() = 0;

    // ========================================================================
    // Containers
    // ========================================================================

    /**
     * @brief Resource statistics snapshot
     *
     * With a container name only that container is sampled. Without one the
     * containers matching @p filters are listed first; when none match and
     * filters were given the result is empty.
     *
     * @param container Container name or id
     * @param filters Listing filters used when no container is given
     * @return One Stats entry per sampled container
     */
    virtual std::vector<Stats> GetStats(const std::optional<std::string>& container,
                                        const Filters& filters = {}) = 0;

    /// Pull an image from its registry
    virtual void Pull(const std::string& image) = 0;

    /**
     * @brief List containers (running and stopped)
     * @param filters Backend-native filters
     */
    virtual std::vector<Container> List(const Filters& filters = {}) = 0;

    /**
     * @brief Create and start a container
     *
     * The container receives the `<namespace>-created=<epoch ms>` label and
     * the resource limits of GetConfig().
     *
     * @return Container id reported by the backend
     */
    virtual std::string Run(const RunSpec& spec) = 0;

    /**
     * @brief Run a command inside a running container
     * @param name Container name
     * @param command Command tokens
     * @param vars Environment variables for the command
     * @param timeout Maximum run time (none when empty)
     * @return Exit code and captured output
     * @throws TimeoutError when the timeout expires
     * @throws BackendInvocationError when the command fails
     */
    virtual ExecResult Execute(const std::string& name,
                               const std::vector<std::string>& command,
                               const std::map<std::string, std::string>& vars = {},
                               std::optional<std::chrono::seconds> timeout = std::nullopt) = 0;

    /// Remove a container (force kills a running one)
    virtual void Remove(const std::string& name, bool force = false) = 0;

    const AdapterConfig& GetConfig() const { return config_; }

protected:
    AdapterConfig config_;  ///< Namespace and resource limits
};

} // namespace core
} // namespace dockhand
