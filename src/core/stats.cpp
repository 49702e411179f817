/**
 * @file stats.cpp
 * @brief Stats equality, printing and JSON mapping
 *
 * **JSON Layout**:
 * ```
 * {
 *   "containerId": "f3a1...", "containerName": "web",
 *   "cpuUsage": 0.45, "memoryUsage": 0.12,
 *   "diskIO":    {"in": 1000.0, "out": 0.0},
 *   "memoryIO":  {"in": 52428800.0, "out": 2147483648.0},
 *   "networkIO": {"in": 1200.0, "out": 800.0}
 * }
 * ```
 * The validity flags are only written when false.
 *
 * @date 2025
 */

#include "dockhand/core/stats.hpp"

#include <nlohmann/json.hpp>

namespace dockhand {
namespace core {

bool operator==(const IoStats& lhs, const IoStats& rhs) {
    return lhs.in == rhs.in && lhs.out == rhs.out;
}

bool operator!=(const IoStats& lhs, const IoStats& rhs) {
    return !(lhs == rhs);
}

bool operator==(const Stats& lhs, const Stats& rhs) {
    return lhs.container_id == rhs.container_id &&
           lhs.container_name == rhs.container_name &&
           lhs.cpu_usage == rhs.cpu_usage &&
           lhs.memory_usage == rhs.memory_usage &&
           lhs.disk_io == rhs.disk_io &&
           lhs.memory_io == rhs.memory_io &&
           lhs.network_io == rhs.network_io &&
           lhs.cpu_usage_valid == rhs.cpu_usage_valid &&
           lhs.memory_usage_valid == rhs.memory_usage_valid;
}

bool operator!=(const Stats& lhs, const Stats& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Stats& stats) {
    auto print_io = [&os](const IoStats& io) {
        os << "{in: " << io.in << ", out: " << io.out << "}";
    };

    os << "Stats(containerId: " << stats.container_id
       << ", containerName: " << stats.container_name
       << ", cpuUsage: " << stats.cpu_usage
       << ", memoryUsage: " << stats.memory_usage
       << ", diskIO: ";
    print_io(stats.disk_io);
    os << ", memoryIO: ";
    print_io(stats.memory_io);
    os << ", networkIO: ";
    print_io(stats.network_io);
    return os << ")";
}

void to_json(nlohmann::json& j, const IoStats& io) {
    j = nlohmann::json{{"in", io.in}, {"out", io.out}};
}

void from_json(const nlohmann::json& j, IoStats& io) {
    io.in = j.value("in", 0.0);
    io.out = j.value("out", 0.0);
}

void to_json(nlohmann::json& j, const Stats& stats) {
    j = nlohmann::json{
        {"containerId", stats.container_id},
        {"containerName", stats.container_name},
        {"cpuUsage", stats.cpu_usage},
        {"memoryUsage", stats.memory_usage},
        {"diskIO", stats.disk_io},
        {"memoryIO", stats.memory_io},
        {"networkIO", stats.network_io}
    };

    if (!stats.cpu_usage_valid) {
        j["cpuUsageValid"] = false;
    }
    if (!stats.memory_usage_valid) {
        j["memoryUsageValid"] = false;
    }
}

void from_json(const nlohmann::json& j, Stats& stats) {
    stats.container_id = j.value("containerId", "");
    stats.container_name = j.value("containerName", "");
    stats.cpu_usage = j.value("cpuUsage", 0.0);
    stats.memory_usage = j.value("memoryUsage", 0.0);
    stats.disk_io = j.value("diskIO", IoStats{});
    stats.memory_io = j.value("memoryIO", IoStats{});
    stats.network_io = j.value("networkIO", IoStats{});
    stats.cpu_usage_valid = j.value("cpuUsageValid", true);
    stats.memory_usage_valid = j.value("memoryUsageValid", true);
}

} // namespace core
} // namespace dockhand
