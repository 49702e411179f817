/**
 * @file response_parser.hpp
 * @brief Decoding of backend output into domain entities
 *
 * Two families of input are handled:
 * - Docker CLI output: one JSON object per line (`--format '{{json .}}'`)
 *   or the legacy whitespace/tab separated text format.
 * - Docker engine HTTP API bodies: JSON documents with engine field names,
 *   mapped through fixed tables.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container.hpp"
#include "dockhand/core/network.hpp"
#include "dockhand/core/stats.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dockhand {
namespace parsers {

/**
 * @struct PercentValue
 * @brief Result of best-effort percentage decoding
 */
struct PercentValue {
    double fraction{0.0};  ///< Value divided by 100 (0 when invalid)
    bool valid{false};     ///< false when the input could not be decoded
};

/***************************************************************************
 * Docker CLI Output
 ***************************************************************************/

/**
 * @brief Decode a label string of the form `k=v,k=v`
 *
 * Segments that do not split into exactly two parts on '=' are dropped:
 * `"env=prod,broken,tier=web"` yields `{env: prod, tier: web}`.
 */
std::map<std::string, std::string> ParseLabels(const std::string& labels);

/**
 * @brief Decode a percentage such as `"12.34%"` into a fraction
 *
 * Never throws; unparseable, negative or non-finite input yields
 * `{0.0, false}`.
 */
PercentValue ParsePercentage(const std::string& text);

/**
 * @brief Decode one container listing line
 *
 * Accepts a JSON object (`ID`, `Names`, `Status`, `Labels`) or the legacy
 * tab separated form `ID\tNames\tStatus[\tLabels]`.
 *
 * @throws core::ParseError on malformed JSON or a wrong field count
 */
core::Container ParseContainerLine(const std::string& line);

/**
 * @brief Decode one network listing line
 *
 * Accepts a JSON object (`ID`, `Name`, `Driver`, `Scope`) or the legacy
 * whitespace separated form `ID Name Driver Scope`.
 *
 * @throws core::ParseError on malformed JSON or a wrong field count
 */
core::Network ParseNetworkLine(const std::string& line);

/**
 * @brief Decode one `docker stats --format '{{json .}}'` line
 *
 * Percentages degrade to 0 with the validity flag cleared. Missing IO
 * fields yield zero pairs; present but malformed IO text raises.
 *
 * @throws core::ParseError on malformed JSON or malformed IO text
 */
core::Stats ParseStatsLine(const std::string& line);

/// Decode every non-blank line of `docker ps` output
std::vector<core::Container> ParseContainerList(const std::string& output);

/// Decode every non-blank line of `docker network ls` output
std::vector<core::Network> ParseNetworkList(const std::string& output);

/// Decode every non-blank line of `docker stats` output
std::vector<core::Stats> ParseStatsList(const std::string& output);

/***************************************************************************
 * Docker Engine API Bodies
 ***************************************************************************/

/**
 * @brief Decode a `GET /containers/json` body
 * @throws core::ParseError if the body is not a JSON array
 */
std::vector<core::Container> ParseApiContainers(const std::string& body);

/**
 * @brief Decode a `GET /networks` body
 * @throws core::ParseError if the body is not a JSON array
 */
std::vector<core::Network> ParseApiNetworks(const std::string& body);

/**
 * @brief Decode a `GET /containers/{id}/stats?stream=false` body
 *
 * CPU fraction is `cpu_delta / system_delta * online_cpus` and memory
 * fraction is `(usage - inactive_file) / limit`, matching the CLI.
 *
 * @throws core::ParseError if the body is not a JSON object
 */
core::Stats ParseApiStats(const std::string& body);

/**
 * @brief Extract the `Id` field of a create response
 * @throws core::ParseError when the field is missing
 */
std::string ParseCreatedId(const std::string& body);

/**
 * @brief Extract the `ExitCode` of a `GET /exec/{id}/json` body
 * @return Exit code, or std::nullopt while the process is still running
 * @throws core::ParseError on malformed JSON
 */
std::optional<int> ParseExecExitCode(const std::string& body);

/**
 * @brief Scan `POST /images/create` progress lines for an error entry
 * @return Error message of the first failing line, if any
 */
std::optional<std::string> FindPullError(const std::string& body);

/**
 * @brief Split an attached exec stream into stdout and stderr
 *
 * Without a TTY the engine frames output as
 * `[stream:1][0][0][0][size:4 big-endian][payload]`. Input that does not
 * follow the framing is returned as stdout unchanged.
 */
std::pair<std::string, std::string> DemultiplexStream(const std::string& raw);

} // namespace parsers
} // namespace dockhand
