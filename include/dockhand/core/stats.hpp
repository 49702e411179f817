/**
 * @file stats.hpp
 * @brief Container resource statistics
 *
 * CPU and memory usage are fractions (0.45 means 45%), never percentages.
 * Every IO mapping carries an inbound and an outbound byte count.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <ostream>
#include <string>

namespace dockhand {
namespace core {

/**
 * @struct IoStats
 * @brief Inbound/outbound byte pair
 */
struct IoStats {
    double in{0.0};   ///< Bytes in (read, received, used)
    double out{0.0};  ///< Bytes out (written, sent, limit)
};

bool operator==(const IoStats& lhs, const IoStats& rhs);
bool operator!=(const IoStats& lhs, const IoStats& rhs);

/**
 * @struct Stats
 * @brief Point-in-time resource usage of one container
 *
 * Collection is best-effort: an unparseable percentage leaves the value at 0
 * and clears the matching validity flag so callers can tell "idle" apart from
 * "unknown".
 */
struct Stats {
    std::string container_id;         ///< Container ID
    std::string container_name;       ///< Container name
    double cpu_usage{0.0};            ///< CPU usage fraction (>= 0)
    double memory_usage{0.0};         ///< Memory usage fraction (>= 0)
    IoStats disk_io;                  ///< Block IO (read / write)
    IoStats memory_io;                ///< Memory (used / limit)
    IoStats network_io;               ///< Network IO (received / sent)
    bool cpu_usage_valid{true};       ///< false when cpu_usage was defaulted
    bool memory_usage_valid{true};    ///< false when memory_usage was defaulted
};

bool operator==(const Stats& lhs, const Stats& rhs);
bool operator!=(const Stats& lhs, const Stats& rhs);
std::ostream& operator<<(std::ostream& os, const Stats& stats);

void to_json(nlohmann::json& j, const IoStats& io);
void from_json(const nlohmann::json& j, IoStats& io);

/// Serialise with containerId, containerName, cpuUsage, memoryUsage, diskIO, memoryIO, networkIO
void to_json(nlohmann::json& j, const Stats& stats);
void from_json(const nlohmann::json& j, Stats& stats);

} // namespace core
} // namespace dockhand
