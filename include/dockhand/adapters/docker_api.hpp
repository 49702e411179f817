/**
 * @file docker_api.hpp
 * @brief Adapter talking to the Docker engine HTTP API
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/adapter.hpp"
#include "dockhand/utils/http_transport.hpp"

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dockhand {
namespace adapters {

/**
 * @class DockerApi
 * @brief Docker engine HTTP API backend
 *
 * Requests go to `http://localhost/...` over the engine's unix socket.
 * Every response status is checked against the one the engine documents
 * for success; anything else raises BackendInvocationError with the body.
 *
 * **Execute Flow**:
 * ```
 * POST /containers/{name}/exec  (201, exec id)
 * POST /exec/{id}/start         (200, multiplexed output)
 * GET  /exec/{id}/json          (200, ExitCode)
 * ```
 */
class DockerApi : public core::Adapter {
public:
    /// Server address recorded in the registry auth header
    static constexpr const char* kRegistryServer = "https://index.docker.io/v1/";

    /**
     * @brief Construct the adapter
     * @param config Namespace and resource limits
     * @param socket_path Engine unix socket
     * @param credentials Registry credentials sent as X-Registry-Auth
     * @param transport Request transport (UnixSocketTransport when null)
     */
    explicit DockerApi(core::AdapterConfig config = {},
                       std::string socket_path = "/var/run/docker.sock",
                       const std::optional<core::Credentials>& credentials = std::nullopt,
                       std::shared_ptr<utils::HttpTransport> transport = nullptr);

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

    /**
     * @brief Base64 encoded registry auth document
     * @return Empty when no credentials were supplied
     */
    const std::string& GetRegistryAuth() const { return registry_auth_; }

    /**
     * @brief Encode credentials for the X-Registry-Auth header
     *
     * Base64 of `{"username","password","serveraddress"[,"email"]}`.
     */
    static std::string EncodeRegistryAuth(const core::Credentials& credentials);

private:
    utils::HttpResponse Call(const std::string& method,
                             const std::string& target,
                             const std::string& body = "",
                             std::optional<std::chrono::seconds> timeout = std::nullopt);

    /**
     * @brief Perform a request and require one of the expected statuses
     * @throws core::BackendInvocationError with the response body otherwise
     */
    utils::HttpResponse CallExpecting(const std::string& operation,
                                      std::initializer_list<int> expected,
                                      const std::string& method,
                                      const std::string& target,
                                      const std::string& body = "",
                                      std::optional<std::chrono::seconds> timeout = std::nullopt);

    std::string socket_path_;                           ///< Engine socket path
    std::string registry_auth_;                         ///< X-Registry-Auth value
    std::shared_ptr<utils::HttpTransport> transport_;   ///< Request transport
};

} // namespace adapters
} // namespace dockhand
