/**
 * @file argument_builder.hpp
 * @brief Translation of run/exec requests into backend invocations
 *
 * Produces the argv tokens placed after the `docker` binary for the CLI
 * backend, and the JSON request bodies for the engine HTTP API. Both forms
 * carry the same semantic fields; builders never emit empty tokens.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/config.hpp"
#include "dockhand/core/run_spec.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dockhand {
namespace builders {

/// Backend-native key=value filters
using Filters = std::map<std::string, std::string>;

/**
 * @brief Provenance label key for a namespace ("<namespace>-created")
 */
std::string ProvenanceLabelKey(const std::string& namespace_name);

/**
 * @brief Current wall-clock time in milliseconds since the epoch
 */
std::int64_t NowMillis();

/**
 * @class CliArgumentBuilder
 * @brief Builds Docker CLI argv tokens (without the binary itself)
 *
 * Tokens are shell words: values containing whitespace are wrapped in
 * single quotes because the command line is executed through `/bin/sh -c`.
 *
 * **Run Flag Order**:
 * ```
 * run -d [--rm] [--network=N] [--entrypoint=E] [--cpus=C] [--memory=Mm]
 *     [--memory-swap=Sm] --label=<ns>-created=<ms> --name=<name>
 *     [--volume <mount>:/tmp:rw] [--volume V]... [--label k=v]...
 *     [--workdir W] [--hostname H] [--env K=V]... <image> <command>...
 * ```
 */
class CliArgumentBuilder {
public:
    /**
     * @brief Build `docker run` arguments
     * @param spec Container to launch
     * @param config Namespace and resource limits
     * @param created_at_ms Timestamp recorded in the provenance label
     * @return Ordered argv tokens
     */
    static std::vector<std::string> BuildRun(const core::RunSpec& spec,
                                             const core::AdapterConfig& config,
                                             std::int64_t created_at_ms);

    /**
     * @brief Build `docker exec` arguments
     * @param name Container name
     * @param command Command tokens
     * @param vars Environment variables for the command
     */
    static std::vector<std::string> BuildExec(const std::string& name,
                                              const std::vector<std::string>& command,
                                              const std::map<std::string, std::string>& vars);

    static std::vector<std::string> BuildList(const Filters& filters);
    static std::vector<std::string> BuildStats(const std::vector<std::string>& container_ids);
    static std::vector<std::string> BuildRemove(const std::string& name, bool force);
    static std::vector<std::string> BuildPull(const std::string& image);

    static std::vector<std::string> BuildNetworkCreate(const std::string& name, bool internal);
    static std::vector<std::string> BuildNetworkRemove(const std::string& name);
    static std::vector<std::string> BuildNetworkConnect(const std::string& container,
                                                        const std::string& network);
    static std::vector<std::string> BuildNetworkDisconnect(const std::string& container,
                                                           const std::string& network,
                                                           bool force);
    static std::vector<std::string> BuildNetworkList();

    /**
     * @brief Build `docker login` arguments (password read from stdin)
     */
    static std::vector<std::string> BuildLogin(const std::string& username);

    /**
     * @brief Render `--env` token pairs, dropping keys that filter to nothing
     */
    static std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& vars);

    /**
     * @brief Render `--label` token pairs with quote stripping and quoting
     */
    static std::vector<std::string> BuildLabels(const std::map<std::string, std::string>& labels);
};

/**
 * @class ApiRequestBuilder
 * @brief Builds Docker engine API request bodies and query strings
 */
class ApiRequestBuilder {
public:
    /**
     * @brief Build the `POST /containers/create` body
     *
     * Resource limits are mapped to HostConfig.NanoCpus, Memory and
     * MemorySwap so that both backends honour them.
     */
    static nlohmann::json BuildCreateContainer(const core::RunSpec& spec,
                                               const core::AdapterConfig& config,
                                               std::int64_t created_at_ms);

    /// Build the `POST /containers/{id}/exec` body
    static nlohmann::json BuildExecCreate(const std::vector<std::string>& command,
                                          const std::map<std::string, std::string>& vars);

    /// Build the `POST /networks/create` body
    static nlohmann::json BuildNetworkCreate(const std::string& name, bool internal);

    /// Build the `POST /networks/{id}/disconnect` body
    static nlohmann::json BuildNetworkDisconnect(const std::string& container, bool force);

    /**
     * @brief Encode filters as the engine's `{"key": ["value"]}` object
     * @return URL-encoded JSON, or empty when there are no filters
     */
    static std::string EncodeFilters(const Filters& filters);

    /// Environment entries as "KEY=value" with filtered keys
    static std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& vars);
};

} // namespace builders
} // namespace dockhand
