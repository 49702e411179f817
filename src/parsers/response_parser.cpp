/**
 * @file response_parser.cpp
 * @brief Implementation of backend output decoding
 *
 * **CLI Field Tables**:
 * ```
 * docker ps        ID -> id, Names -> name, Status -> status, Labels -> labels
 * docker network   ID -> id, Name -> name, Driver -> driver, Scope -> scope
 * docker stats     ID -> containerId, Name -> containerName,
 *                  CPUPerc -> cpuUsage, MemPerc -> memoryUsage,
 *                  BlockIO -> diskIO, MemUsage -> memoryIO, NetIO -> networkIO
 * ```
 *
 * **Engine Field Tables**:
 * ```
 * /containers/json   Id, Names[0] (leading '/' removed), Status, Labels
 * /networks          Id, Name, Driver, Scope
 * /containers/{id}/stats
 *                    id, name, cpu_stats, precpu_stats, memory_stats,
 *                    networks.*.rx_bytes/tx_bytes,
 *                    blkio_stats.io_service_bytes_recursive[op=read|write]
 * ```
 *
 * **Error Policy**:
 * Structural problems (unparseable JSON, wrong field count, malformed IO
 * text) raise core::ParseError. Percentages degrade to zero with the
 * validity flag cleared so that one bad field never aborts collection.
 *
 * @date 2025
 */

#include "dockhand/parsers/response_parser.hpp"
#include "dockhand/parsers/unit_parser.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace dockhand {
namespace parsers {

namespace {

using utils::StringUtils;

json ParseJson(const std::string& text, const std::string& what) {
    try {
        return json::parse(text);
    }
    catch (const json::parse_error& e) {
        throw core::ParseError("Malformed " + what + " JSON: " + e.what());
    }
}

// Field as string; absent or null fields read as empty
std::string StringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw core::ParseError(std::string("Field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

std::string StripLeadingSlash(const std::string& name) {
    if (!name.empty() && name.front() == '/') {
        return name.substr(1);
    }
    return name;
}

// Walk a path of object keys down to a number
std::optional<double> NumberAt(const json& root, std::initializer_list<const char*> path) {
    const json* node = &root;
    for (const char* key : path) {
        if (!node->is_object()) {
            return std::nullopt;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return std::nullopt;
        }
        node = &(*it);
    }
    if (!node->is_number()) {
        return std::nullopt;
    }
    return node->get<double>();
}

core::IoStats IoField(const json& j, const char* key) {
    std::string text = StringField(j, key);
    if (text.empty()) {
        return core::IoStats{};
    }
    return ParseIoStats(text);
}

template <typename T, typename LineParser>
std::vector<T> ParseLines(const std::string& output, LineParser parse_line) {
    std::vector<T> items;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (StringUtils::Trim(line).empty()) continue;
        items.push_back(parse_line(line));
    }

    return items;
}

void ApplyCpuStats(const json& j, core::Stats& stats) {
    auto total = NumberAt(j, {"cpu_stats", "cpu_usage", "total_usage"});
    auto system = NumberAt(j, {"cpu_stats", "system_cpu_usage"});
    if (!total || !system) {
        stats.cpu_usage = 0.0;
        stats.cpu_usage_valid = false;
        return;
    }

    double pre_total = NumberAt(j, {"precpu_stats", "cpu_usage", "total_usage"}).value_or(0.0);
    double pre_system = NumberAt(j, {"precpu_stats", "system_cpu_usage"}).value_or(0.0);

    double online_cpus = NumberAt(j, {"cpu_stats", "online_cpus"}).value_or(0.0);
    if (online_cpus <= 0.0) {
        const auto& percpu = j["cpu_stats"]["cpu_usage"];
        if (percpu.contains("percpu_usage") && percpu["percpu_usage"].is_array()) {
            online_cpus = static_cast<double>(percpu["percpu_usage"].size());
        }
    }
    if (online_cpus <= 0.0) {
        online_cpus = 1.0;
    }

    double cpu_delta = *total - pre_total;
    double system_delta = *system - pre_system;

    stats.cpu_usage = (cpu_delta > 0.0 && system_delta > 0.0)
        ? (cpu_delta / system_delta) * online_cpus
        : 0.0;
    stats.cpu_usage_valid = true;
}

void ApplyMemoryStats(const json& j, core::Stats& stats) {
    auto usage = NumberAt(j, {"memory_stats", "usage"});
    auto limit = NumberAt(j, {"memory_stats", "limit"});

    double used = usage.value_or(0.0);
    // cgroup v2 reports inactive_file, v1 total_inactive_file
    auto inactive = NumberAt(j, {"memory_stats", "stats", "inactive_file"});
    if (!inactive) {
        inactive = NumberAt(j, {"memory_stats", "stats", "total_inactive_file"});
    }
    if (inactive && *inactive < used) {
        used -= *inactive;
    }

    stats.memory_io.in = used;
    stats.memory_io.out = limit.value_or(0.0);

    if (!usage || !limit || *limit <= 0.0) {
        stats.memory_usage = 0.0;
        stats.memory_usage_valid = false;
        return;
    }

    stats.memory_usage = used / *limit;
    stats.memory_usage_valid = true;
}

void ApplyNetworkStats(const json& j, core::Stats& stats) {
    auto it = j.find("networks");
    if (it == j.end() || !it->is_object()) {
        return;
    }

    for (const auto& [iface, counters] : it->items()) {
        stats.network_io.in += NumberAt(counters, {"rx_bytes"}).value_or(0.0);
        stats.network_io.out += NumberAt(counters, {"tx_bytes"}).value_or(0.0);
    }
}

void ApplyBlockStats(const json& j, core::Stats& stats) {
    auto blkio = j.find("blkio_stats");
    if (blkio == j.end() || !blkio->is_object()) {
        return;
    }
    auto entries = blkio->find("io_service_bytes_recursive");
    if (entries == blkio->end() || !entries->is_array()) {
        return;
    }

    for (const auto& entry : *entries) {
        if (!entry.is_object()) continue;
        std::string op = StringUtils::Trim(StringField(entry, "op"));
        std::transform(op.begin(), op.end(), op.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        double value = NumberAt(entry, {"value"}).value_or(0.0);

        if (op == "read") {
            stats.disk_io.in += value;
        } else if (op == "write") {
            stats.disk_io.out += value;
        }
    }
}

} // anonymous namespace

// ============================================================================
// CLI OUTPUT DECODING
// ============================================================================

std::map<std::string, std::string> ParseLabels(const std::string& labels) {
    std::map<std::string, std::string> result;

    for (const auto& pair : StringUtils::Split(labels, ',', true)) {
        auto key_value = StringUtils::Split(pair, '=', true);
        if (key_value.size() == 2) {
            result[key_value[0]] = key_value[1];
        }
    }

    return result;
}

PercentValue ParsePercentage(const std::string& text) {
    std::string number = StringUtils::Trim(StringUtils::ReplaceAll(text, "%", ""));

    PercentValue percent;
    if (number.empty()) {
        return percent;
    }

    try {
        std::size_t consumed = 0;
        double value = std::stod(number, &consumed);
        if (consumed != number.size() || !std::isfinite(value) || value < 0.0) {
            return percent;
        }
        percent.fraction = value / 100.0;
        percent.valid = true;
    }
    catch (const std::exception&) {
        spdlog::debug("Unparseable percentage '{}', defaulting to 0", text);
    }

    return percent;
}

core::Container ParseContainerLine(const std::string& line) {
    std::string trimmed = StringUtils::Trim(line);
    core::Container container;

    if (StringUtils::StartsWith(trimmed, "{")) {
        json details = ParseJson(trimmed, "container");
        container.id = StringField(details, "ID");
        container.name = StringField(details, "Names");
        container.status = StringField(details, "Status");
        container.labels = ParseLabels(StringField(details, "Labels"));
        return container;
    }

    // Legacy: {{.ID}}\t{{.Names}}\t{{.Status}}[\t{{.Labels}}]
    auto fields = StringUtils::Split(trimmed, '\t', true);
    if (fields.size() != 3 && fields.size() != 4) {
        throw core::ParseError("Expected 3 or 4 tab separated container fields, got " +
                               std::to_string(fields.size()));
    }

    container.id = fields[0];
    container.name = fields[1];
    container.status = fields[2];
    if (fields.size() == 4) {
        container.labels = ParseLabels(fields[3]);
    }
    return container;
}

core::Network ParseNetworkLine(const std::string& line) {
    std::string trimmed = StringUtils::Trim(line);
    core::Network network;

    if (StringUtils::StartsWith(trimmed, "{")) {
        json details = ParseJson(trimmed, "network");
        network.id = StringField(details, "ID");
        network.name = StringField(details, "Name");
        network.driver = StringField(details, "Driver");
        network.scope = StringField(details, "Scope");
        return network;
    }

    // Legacy: {{.ID}} {{.Name}} {{.Driver}} {{.Scope}}
    auto fields = StringUtils::SplitWhitespace(trimmed);
    if (fields.size() != 4) {
        throw core::ParseError("Expected 4 network fields, got " + std::to_string(fields.size()));
    }

    network.id = fields[0];
    network.name = fields[1];
    network.driver = fields[2];
    network.scope = fields[3];
    return network;
}

core::Stats ParseStatsLine(const std::string& line) {
    json data = ParseJson(StringUtils::Trim(line), "stats");
    if (!data.is_object()) {
        throw core::ParseError("Stats line is not a JSON object");
    }

    core::Stats stats;
    stats.container_id = StringField(data, "ID");
    stats.container_name = StringField(data, "Name");

    auto percent_field = [&data](const char* key) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_string()) {
            return PercentValue{};
        }
        return ParsePercentage(it->get<std::string>());
    };

    auto cpu = percent_field("CPUPerc");
    stats.cpu_usage = cpu.fraction;
    stats.cpu_usage_valid = cpu.valid;

    auto memory = percent_field("MemPerc");
    stats.memory_usage = memory.fraction;
    stats.memory_usage_valid = memory.valid;

    stats.disk_io = IoField(data, "BlockIO");
    stats.memory_io = IoField(data, "MemUsage");
    stats.network_io = IoField(data, "NetIO");

    return stats;
}

std::vector<core::Container> ParseContainerList(const std::string& output) {
    return ParseLines<core::Container>(output, ParseContainerLine);
}

std::vector<core::Network> ParseNetworkList(const std::string& output) {
    return ParseLines<core::Network>(output, ParseNetworkLine);
}

std::vector<core::Stats> ParseStatsList(const std::string& output) {
    return ParseLines<core::Stats>(output, ParseStatsLine);
}

// ============================================================================
// ENGINE API DECODING
// ============================================================================

std::vector<core::Container> ParseApiContainers(const std::string& body) {
    json list = ParseJson(body, "container list");
    if (!list.is_array()) {
        throw core::ParseError("Container list is not a JSON array");
    }

    std::vector<core::Container> containers;
    for (const auto& item : list) {
        core::Container container;
        container.id = StringField(item, "Id");
        container.status = StringField(item, "Status");

        auto names = item.find("Names");
        if (names != item.end() && names->is_array() && !names->empty() &&
            names->at(0).is_string()) {
            container.name = StripLeadingSlash(names->at(0).get<std::string>());
        }

        auto labels = item.find("Labels");
        if (labels != item.end() && labels->is_object()) {
            for (const auto& [key, value] : labels->items()) {
                if (value.is_string()) {
                    container.labels[key] = value.get<std::string>();
                }
            }
        }

        containers.push_back(container);
    }

    return containers;
}

std::vector<core::Network> ParseApiNetworks(const std::string& body) {
    json list = ParseJson(body, "network list");
    if (!list.is_array()) {
        throw core::ParseError("Network list is not a JSON array");
    }

    std::vector<core::Network> networks;
    for (const auto& item : list) {
        core::Network network;
        network.id = StringField(item, "Id");
        network.name = StringField(item, "Name");
        network.driver = StringField(item, "Driver");
        network.scope = StringField(item, "Scope");
        networks.push_back(network);
    }

    return networks;
}

core::Stats ParseApiStats(const std::string& body) {
    json j = ParseJson(body, "stats");
    if (!j.is_object()) {
        throw core::ParseError("Stats body is not a JSON object");
    }

    core::Stats stats;
    stats.container_id = StringField(j, "id");
    stats.container_name = StripLeadingSlash(StringField(j, "name"));

    ApplyCpuStats(j, stats);
    ApplyMemoryStats(j, stats);
    ApplyNetworkStats(j, stats);
    ApplyBlockStats(j, stats);

    return stats;
}

std::string ParseCreatedId(const std::string& body) {
    json j = ParseJson(body, "create response");
    std::string id = j.is_object() ? StringField(j, "Id") : "";
    if (id.empty()) {
        throw core::ParseError("Create response carries no Id");
    }
    return id;
}

std::optional<int> ParseExecExitCode(const std::string& body) {
    json j = ParseJson(body, "exec inspect");
    if (!j.is_object()) {
        throw core::ParseError("Exec inspect body is not a JSON object");
    }

    auto running = j.find("Running");
    if (running != j.end() && !running->is_null()) {
        if (!running->is_boolean()) {
            throw core::ParseError("Field 'Running' is not a boolean");
        }
        if (running->get<bool>()) {
            return std::nullopt;
        }
    }

    auto code = j.find("ExitCode");
    if (code == j.end() || !code->is_number_integer()) {
        return std::nullopt;
    }
    return code->get<int>();
}

std::optional<std::string> FindPullError(const std::string& body) {
    std::istringstream stream(body);
    std::string line;

    while (std::getline(stream, line)) {
        line = StringUtils::Trim(line);
        if (line.empty()) continue;

        json progress = json::parse(line, nullptr, false);
        if (progress.is_discarded() || !progress.is_object()) continue;

        if (progress.contains("error")) {
            const auto& error = progress["error"];
            return error.is_string() ? error.get<std::string>() : error.dump();
        }
        if (progress.contains("errorDetail") && progress["errorDetail"].is_object()) {
            const auto& detail = progress["errorDetail"];
            auto message = detail.find("message");
            if (message != detail.end() && message->is_string()) {
                return message->get<std::string>();
            }
            return detail.dump();
        }
    }

    return std::nullopt;
}

std::pair<std::string, std::string> DemultiplexStream(const std::string& raw) {
    constexpr std::size_t kHeaderSize = 8;

    std::string out;
    std::string err;
    std::size_t pos = 0;

    while (pos < raw.size()) {
        if (raw.size() - pos < kHeaderSize) {
            return {raw, ""};
        }

        auto stream_type = static_cast<unsigned char>(raw[pos]);
        if (stream_type > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) {
            return {raw, ""};
        }

        std::size_t size = 0;
        for (std::size_t i = 4; i < kHeaderSize; ++i) {
            size = (size << 8) | static_cast<unsigned char>(raw[pos + i]);
        }

        pos += kHeaderSize;
        if (raw.size() - pos < size) {
            return {raw, ""};
        }

        std::string payload = raw.substr(pos, size);
        if (stream_type == 2) {
            err += payload;
        } else {
            out += payload;
        }
        pos += size;
    }

    return {out, err};
}

} // namespace parsers
} // namespace dockhand
