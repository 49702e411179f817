/**
 * @file config.hpp
 * @brief Adapter and orchestration configuration
 *
 * AdapterConfig holds the resource limits and provenance namespace applied to
 * every container an adapter launches. It is handed to the adapter when the
 * adapter is constructed and never changes afterwards.
 *
 * OrchestrationConfig adds backend selection and connection settings and can
 * be loaded from a JSON file:
 * ```
 * {
 *   "backend": "api",
 *   "socket": "/var/run/docker.sock",
 *   "docker": "docker",
 *   "namespace": "ci",
 *   "cpus": 2, "memory": 1024, "swap": 2048,
 *   "credentials": {"username": "bot", "password": "...", "email": "bot@example.com"}
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace dockhand {
namespace core {

/**
 * @struct AdapterConfig
 * @brief Per-adapter settings applied to every run
 */
struct AdapterConfig {
    std::string namespace_name{"utopia"};  ///< Provenance label prefix
    int cpus{0};                           ///< CPU limit (0 = unlimited)
    int memory{0};                         ///< Memory limit in MB (0 = unlimited)
    int swap{0};                           ///< Swap limit in MB (0 = unlimited)
};

/**
 * @class AdapterConfigBuilder
 * @brief Fluent API for building adapter configurations
 *
 * **Usage Example**:
 * @code
 * auto config = AdapterConfigBuilder()
 *     .WithNamespace("ci")
 *     .WithCpus(2)
 *     .WithMemory(512)
 *     .Build();
 * DockerCli cli(config);
 * @endcode
 */
class AdapterConfigBuilder {
public:
    AdapterConfigBuilder& WithNamespace(const std::string& namespace_name);
    AdapterConfigBuilder& WithCpus(int cpus);
    AdapterConfigBuilder& WithMemory(int megabytes);
    AdapterConfigBuilder& WithSwap(int megabytes);

    AdapterConfig Build() const;

private:
    AdapterConfig config_;  ///< Configuration being built
};

/**
 * @enum Backend
 * @brief Container engine access mode
 */
enum class Backend {
    CLI,  ///< Docker command-line binary
    API   ///< Docker engine HTTP API over the unix socket
};

/**
 * @struct Credentials
 * @brief Registry credentials passed through to the backend
 */
struct Credentials {
    std::string username;  ///< Registry user
    std::string password;  ///< Registry password or token
    std::string email;     ///< Account email (engine API only)
};

/**
 * @struct OrchestrationConfig
 * @brief Everything needed to construct an adapter
 */
struct OrchestrationConfig {
    Backend backend{Backend::CLI};                       ///< Backend to use
    std::string docker_binary{"docker"};                 ///< CLI executable
    std::string socket_path{"/var/run/docker.sock"};     ///< Engine socket
    std::optional<Credentials> credentials;              ///< Registry login
    AdapterConfig adapter;                               ///< Limits and namespace
};

/**
 * @brief Parse a backend name ("cli" or "api", case-insensitive)
 * @throws ConfigError on unknown names
 */
Backend ParseBackend(const std::string& name);

std::string BackendToString(Backend backend);

/**
 * @brief Load orchestration settings from a JSON file
 *
 * Keys absent from the file keep their defaults.
 *
 * @param path JSON configuration file
 * @return Parsed configuration
 * @throws ConfigError if the file is unreadable or malformed
 */
OrchestrationConfig LoadConfigFile(const std::filesystem::path& path);

/**
 * @brief Parse orchestration settings from JSON text
 * @throws ConfigError if the text is malformed or a value has the wrong type
 */
OrchestrationConfig ParseConfig(const std::string& json_text);

} // namespace core
} // namespace dockhand
