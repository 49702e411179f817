/**
 * @file network.cpp
 * @brief Network equality, printing and JSON mapping
 *
 * @date 2025
 */

#include "dockhand/core/network.hpp"

#include <nlohmann/json.hpp>

namespace dockhand {
namespace core {

bool operator==(const Network& lhs, const Network& rhs) {
    return lhs.name == rhs.name &&
           lhs.id == rhs.id &&
           lhs.driver == rhs.driver &&
           lhs.scope == rhs.scope;
}

bool operator!=(const Network& lhs, const Network& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Network& network) {
    return os << "Network(name: " << network.name
              << ", id: " << network.id
              << ", driver: " << network.driver
              << ", scope: " << network.scope << ")";
}

void to_json(nlohmann::json& j, const Network& network) {
    j = nlohmann::json{
        {"name", network.name},
        {"id", network.id},
        {"driver", network.driver},
        {"scope", network.scope}
    };
}

void from_json(const nlohmann::json& j, Network& network) {
    network.name = j.value("name", "");
    network.id = j.value("id", "");
    network.driver = j.value("driver", "");
    network.scope = j.value("scope", "");
}

} // namespace core
} // namespace dockhand
