/**
 * @file unit_parser.cpp
 * @brief Byte quantity parsing for container statistics
 *
 * **Unit Table**:
 * ```
 * B   = 1        KiB = 1024
 * KB  = 1e3      MiB = 1024^2
 * MB  = 1e6      GiB = 1024^3
 * GB  = 1e9      TiB = 1024^4
 * TB  = 1e12
 * ```
 * Suffixes are matched longest first because every unit ends in "B".
 *
 * @date 2025
 */

#include "dockhand/parsers/unit_parser.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <utility>

namespace dockhand {
namespace parsers {

namespace {

using utils::StringUtils;

// Ordered by suffix length, longest first
const std::array<std::pair<const char*, double>, 10> kUnits = {{
    {"KiB", 1024.0},
    {"MiB", 1048576.0},
    {"GiB", 1073741824.0},
    {"TiB", 1099511627776.0},
    {"KB", 1e3},
    {"kB", 1e3},
    {"MB", 1e6},
    {"GB", 1e9},
    {"TB", 1e12},
    {"B", 1.0},
}};

double ParseNumber(const std::string& text, const std::string& context) {
    std::string trimmed = StringUtils::Trim(text);
    if (trimmed.empty()) {
        throw core::ParseError("Missing numeric value in '" + context + "'");
    }

    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(trimmed, &consumed);
    }
    catch (const std::exception&) {
        throw core::ParseError("Invalid numeric value in '" + context + "'");
    }

    if (consumed != trimmed.size() || !std::isfinite(value)) {
        throw core::ParseError("Invalid numeric value in '" + context + "'");
    }

    return value;
}

// Longest known suffix of the text, or empty
std::string MatchUnit(const std::string& text) {
    for (const auto& entry : kUnits) {
        if (StringUtils::EndsWith(text, entry.first)) {
            return entry.first;
        }
    }
    return "";
}

} // anonymous namespace

double UnitMultiplier(const std::string& unit) {
    for (const auto& [suffix, multiplier] : kUnits) {
        if (unit == suffix) {
            return multiplier;
        }
    }
    return 0.0;
}

double ParseByteSize(const std::string& quantity) {
    std::string trimmed = StringUtils::Trim(quantity);
    std::string unit = MatchUnit(trimmed);
    if (unit.empty()) {
        return ParseNumber(trimmed, quantity);
    }

    std::string number = trimmed.substr(0, trimmed.size() - unit.size());
    return ParseNumber(number, quantity) * UnitMultiplier(unit);
}

core::IoStats ParseIoStats(const std::string& stats) {
    auto parts = StringUtils::Split(stats, " / ");
    if (parts.size() != 2) {
        throw core::ParseError("Expected '<in> / <out>' but got '" + stats + "'");
    }

    core::IoStats io;
    io.in = ParseByteSize(parts[0]);
    io.out = ParseByteSize(parts[1]);

    spdlog::trace("Parsed IO '{}' -> in={} out={}", stats, io.in, io.out);
    return io;
}

} // namespace parsers
} // namespace dockhand
