/**
 * @file unit_parser.hpp
 * @brief Conversion of human-readable byte quantities into byte counts
 *
 * The Docker CLI reports IO as `"<value><unit> / <value><unit>"`, for
 * example `"12.3MB / 4.5GB"` or `"50MiB / 1.944GiB"`.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/stats.hpp"

#include <string>

namespace dockhand {
namespace parsers {

/**
 * @brief Multiplier for a unit suffix
 *
 * Decimal: B, KB (also kB), MB, GB, TB. Binary: KiB, MiB, GiB, TiB.
 *
 * @param unit Unit suffix
 * @return Bytes per unit, or 0 when the suffix is unknown
 */
double UnitMultiplier(const std::string& unit);

/**
 * @brief Convert one `"<value><unit>"` quantity to bytes
 *
 * The longest known suffix wins, so `"1KiB"` is never read as `"1Ki" B`.
 * Without a known suffix the whole string is taken as a raw byte count.
 *
 * @param quantity Quantity such as `"12.3MB"` or `"512"`
 * @return Byte count
 * @throws core::ParseError if the numeric part is not a complete number
 */
double ParseByteSize(const std::string& quantity);

/**
 * @brief Parse an IO pair such as `"12.3MB / 1.2GiB"`
 * @param stats IO text
 * @return Inbound and outbound byte counts
 * @throws core::ParseError if the text does not split on " / " into exactly
 *         two quantities, or a quantity is malformed
 */
core::IoStats ParseIoStats(const std::string& stats);

} // namespace parsers
} // namespace dockhand
