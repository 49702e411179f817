/**
 * @file orchestration.cpp
 * @brief Implementation of the orchestration facade and backend factory
 *
 * @date 2025
 */

#include "dockhand/core/orchestration.hpp"
#include "dockhand/adapters/docker_api.hpp"
#include "dockhand/adapters/docker_cli.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace dockhand {
namespace core {

std::shared_ptr<Adapter> MakeAdapter(const OrchestrationConfig& config) {
    spdlog::debug("Creating {} adapter", BackendToString(config.backend));

    switch (config.backend) {
        case Backend::CLI:
            return std::make_shared<adapters::DockerCli>(
                config.adapter, config.docker_binary, config.credentials);
        case Backend::API:
            return std::make_shared<adapters::DockerApi>(
                config.adapter, config.socket_path, config.credentials);
    }

    throw ConfigError("Unsupported backend");
}

Orchestration::Orchestration(std::shared_ptr<Adapter> adapter)
    : adapter_(std::move(adapter)) {
    if (!adapter_) {
        throw ConfigError("Orchestration requires an adapter");
    }
}

void Orchestration::CreateNetwork(const std::string& name, bool internal) {
    adapter_->CreateNetwork(name, internal);
}

void Orchestration::RemoveNetwork(const std::string& name) {
    adapter_->RemoveNetwork(name);
}

void Orchestration::NetworkConnect(const std::string& container, const std::string& network) {
    adapter_->NetworkConnect(container, network);
}

void Orchestration::NetworkDisconnect(const std::string& container,
                                      const std::string& network,
                                      bool force) {
    adapter_->NetworkDisconnect(container, network, force);
}

std::vector<Network> Orchestration::ListNetworks() {
    return adapter_->ListNetworks();
}

std::vector<Stats> Orchestration::GetStats(const std::optional<std::string>& container,
                                           const Filters& filters) {
    return adapter_->GetStats(container, filters);
}

void Orchestration::Pull(const std::string& image) {
    adapter_->Pull(image);
}

std::vector<Container> Orchestration::List(const Filters& filters) {
    return adapter_->List(filters);
}

std::string Orchestration::Run(const RunSpec& spec) {
    return adapter_->Run(spec);
}

ExecResult Orchestration::Execute(const std::string& name,
                                  const std::vector<std::string>& command,
                                  const std::map<std::string, std::string>& vars,
                                  std::optional<std::chrono::seconds> timeout) {
    return adapter_->Execute(name, command, vars, timeout);
}

void Orchestration::Remove(const std::string& name, bool force) {
    adapter_->Remove(name, force);
}

// ============================================================================
// ASYNCHRONOUS VARIANTS
// ============================================================================

// The lambdas capture the adapter by shared_ptr so a future may outlive
// the facade that created it.

std::future<std::string> Orchestration::RunAsync(const RunSpec& spec) {
    return std::async(std::launch::async, [adapter = adapter_, spec]() {
        return adapter->Run(spec);
    });
}

std::future<ExecResult> Orchestration::ExecuteAsync(
    const std::string& name,
    const std::vector<std::string>& command,
    const std::map<std::string, std::string>& vars,
    std::optional<std::chrono::seconds> timeout) {

    return std::async(std::launch::async, [adapter = adapter_, name, command, vars, timeout]() {
        return adapter->Execute(name, command, vars, timeout);
    });
}

std::future<std::vector<Stats>> Orchestration::GetStatsAsync(
    const std::optional<std::string>& container,
    const Filters& filters) {

    return std::async(std::launch::async, [adapter = adapter_, container, filters]() {
        return adapter->GetStats(container, filters);
    });
}

std::future<void> Orchestration::PullAsync(const std::string& image) {
    return std::async(std::launch::async, [adapter = adapter_, image]() {
        adapter->Pull(image);
    });
}

} // namespace core
} // namespace dockhand
