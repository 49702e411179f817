/**
 * @file network.hpp
 * @brief Network value type returned by network listing
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
 * @struct Network
 * @brief Snapshot of a container network
 */
struct Network {
    std::string name;    ///< Network name
    std::string id;      ///< Network ID
    std::string driver;  ///< Driver ("bridge", "overlay", ...)
    std::string scope;   ///< Scope ("local", "swarm")
};

bool operator==(const Network& lhs, const Network& rhs);
bool operator!=(const Network& lhs, const Network& rhs);
std::ostream& operator<<(std::ostream& os, const Network& network);

void to_json(nlohmann::json& j, const Network& network);
void from_json(const nlohmann::json& j, Network& network);

} // namespace core
} // namespace dockhand
