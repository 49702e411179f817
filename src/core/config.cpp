/**
 * @file config.cpp
 * @brief Configuration builders and JSON loading
 *
 * @date 2025
 */

#include "dockhand/core/config.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace dockhand {
namespace core {

// ============================================================================
// ADAPTER CONFIG BUILDER (FLUENT API)
// ============================================================================

AdapterConfigBuilder& AdapterConfigBuilder::WithNamespace(const std::string& namespace_name) {
    config_.namespace_name = namespace_name;
    return *this;
}

AdapterConfigBuilder& AdapterConfigBuilder::WithCpus(int cpus) {
    config_.cpus = cpus;
    return *this;
}

AdapterConfigBuilder& AdapterConfigBuilder::WithMemory(int megabytes) {
    config_.memory = megabytes;
    return *this;
}

AdapterConfigBuilder& AdapterConfigBuilder::WithSwap(int megabytes) {
    config_.swap = megabytes;
    return *this;
}

AdapterConfig AdapterConfigBuilder::Build() const {
    return config_;
}

// ============================================================================
// BACKEND SELECTION
// ============================================================================

Backend ParseBackend(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "cli") return Backend::CLI;
    if (lower == "api") return Backend::API;

    throw ConfigError("Unknown backend: " + name);
}

std::string BackendToString(Backend backend) {
    switch (backend) {
        case Backend::CLI: return "cli";
        case Backend::API: return "api";
    }
    return "unknown";
}

// ============================================================================
// JSON LOADING
// ============================================================================

OrchestrationConfig ParseConfig(const std::string& json_text) {
    OrchestrationConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            throw ConfigError("Configuration root must be an object");
        }

        if (j.contains("backend")) {
            config.backend = ParseBackend(j["backend"].get<std::string>());
        }
        config.docker_binary = j.value("docker", config.docker_binary);
        config.socket_path = j.value("socket", config.socket_path);

        config.adapter.namespace_name = j.value("namespace", config.adapter.namespace_name);
        config.adapter.cpus = j.value("cpus", config.adapter.cpus);
        config.adapter.memory = j.value("memory", config.adapter.memory);
        config.adapter.swap = j.value("swap", config.adapter.swap);

        if (j.contains("credentials")) {
            const auto& creds = j["credentials"];
            Credentials credentials;
            credentials.username = creds.at("username").get<std::string>();
            credentials.password = creds.at("password").get<std::string>();
            credentials.email = creds.value("email", "");
            config.credentials = credentials;
        }
    }
    catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

OrchestrationConfig LoadConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();

    auto config = ParseConfig(content.str());
    spdlog::debug("Loaded configuration from {} (backend: {})",
                  path.string(), BackendToString(config.backend));
    return config;
}

} // namespace core
} // namespace dockhand
