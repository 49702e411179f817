/**
 * @file container.cpp
 * @brief Container equality, printing and JSON mapping
 *
 * @date 2025
 */

#include "dockhand/core/container.hpp"

#include <nlohmann/json.hpp>

namespace dockhand {
namespace core {

bool operator==(const Container& lhs, const Container& rhs) {
    return lhs.name == rhs.name &&
           lhs.id == rhs.id &&
           lhs.status == rhs.status &&
           lhs.labels == rhs.labels;
}

bool operator!=(const Container& lhs, const Container& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Container& container) {
    os << "Container(name: " << container.name
       << ", id: " << container.id
       << ", status: " << container.status
       << ", labels: {";

    bool first = true;
    for (const auto& [key, value] : container.labels) {
        os << (first ? "" : ", ") << key << ": " << value;
        first = false;
    }

    return os << "})";
}

void to_json(nlohmann::json& j, const Container& container) {
    j = nlohmann::json{
        {"name", container.name},
        {"id", container.id},
        {"status", container.status},
        {"labels", container.labels}
    };
}

void from_json(const nlohmann::json& j, Container& container) {
    container.name = j.value("name", "");
    container.id = j.value("id", "");
    container.status = j.value("status", "");
    container.labels = j.value("labels", std::map<std::string, std::string>{});
}

} // namespace core
} // namespace dockhand
