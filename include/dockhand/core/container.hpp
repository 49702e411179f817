/**
 * @file container.hpp
 * @brief Container value type returned by listing operations
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <map>
#include <ostream>
#include <string>

namespace dockhand {
namespace core {

/**
 * @struct Container
 * @brief Snapshot of a container as reported by the backend
 *
 * Rebuilt on every query, never cached. Equality is structural and includes
 * the label mapping.
 */
struct Container {
    std::string name;                           ///< Container name
    std::string id;                             ///< Container ID
    std::string status;                         ///< Human readable status ("Up 2 minutes")
    std::map<std::string, std::string> labels;  ///< Labels attached to the container
};

bool operator==(const Container& lhs, const Container& rhs);
bool operator!=(const Container& lhs, const Container& rhs);
std::ostream& operator<<(std::ostream& os, const Container& container);

/// Serialise with the domain field names (name, id, status, labels)
void to_json(nlohmann::json& j, const Container& container);
void from_json(const nlohmann::json& j, Container& container);

} // namespace core
} // namespace dockhand
