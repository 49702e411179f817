/**
 * @file docker_cli.cpp
 * @brief Implementation of the Docker CLI backend
 *
 * **Operation Mapping**:
 * ```
 * CreateNetwork     -> docker network create <name> [--internal]
 * RemoveNetwork     -> docker network rm <name>
 * NetworkConnect    -> docker network connect <network> <container>
 * NetworkDisconnect -> docker network disconnect [--force] <network> <container>
 * ListNetworks      -> docker network ls --no-trunc --format '{{json .}}'
 * GetStats          -> docker stats --no-trunc --no-stream --format '{{json .}}' <ids>
 * Pull              -> docker pull <image>
 * List              -> docker ps --all --no-trunc --format '{{json .}}' [--filter k=v]
 * Run               -> docker run -d ... <image> <command>
 * Execute           -> [timeout <s>] docker exec [--env K=V] <name> <command>
 * Remove            -> docker rm [--force] <name>
 * ```
 *
 * @date 2025
 */

#include "dockhand/adapters/docker_cli.hpp"
#include "dockhand/builders/argument_builder.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/parsers/response_parser.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace dockhand {
namespace adapters {

namespace {

using builders::CliArgumentBuilder;
using utils::StringUtils;

/// Exit status of coreutils `timeout` when the deadline expired
constexpr int kTimeoutExitCode = 124;

} // anonymous namespace

DockerCli::DockerCli(core::AdapterConfig config,
                     std::string docker_binary,
                     const std::optional<core::Credentials>& credentials,
                     std::shared_ptr<utils::CommandRunner> runner)
    : core::Adapter(std::move(config))
    , docker_binary_(std::move(docker_binary))
    , runner_(runner ? std::move(runner) : std::make_shared<utils::ShellCommandRunner>()) {

    spdlog::debug("Docker CLI adapter using '{}' (namespace '{}')",
                  docker_binary_, config_.namespace_name);

    if (credentials && !credentials->username.empty() && !credentials->password.empty()) {
        Login(*credentials);
    }
}

utils::CommandResult DockerCli::Invoke(const std::vector<std::string>& args,
                                       const std::string& stdin_data) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(StringUtils::QuoteIfWhitespace(docker_binary_));
    argv.insert(argv.end(), args.begin(), args.end());
    return runner_->Run(argv, stdin_data);
}

utils::CommandResult DockerCli::InvokeChecked(const std::string& operation,
                                              const std::vector<std::string>& args) {
    auto result = Invoke(args);
    if (result.exit_code != 0) {
        spdlog::error("docker {} failed with exit code {}", operation, result.exit_code);
        throw core::BackendInvocationError("Docker " + operation + " failed",
                                           StringUtils::Trim(result.stderr_output),
                                           result.exit_code);
    }
    return result;
}

void DockerCli::Login(const core::Credentials& credentials) {
    spdlog::info("Logging in to registry as '{}'", credentials.username);

    auto result = Invoke(CliArgumentBuilder::BuildLogin(credentials.username),
                         credentials.password);
    if (result.exit_code != 0) {
        spdlog::error("Registry login failed: {}", StringUtils::Trim(result.stderr_output));
    }
}

// ============================================================================
// NETWORKS
// ============================================================================

void DockerCli::CreateNetwork(const std::string& name, bool internal) {
    spdlog::info("Creating network '{}'{}", name, internal ? " (internal)" : "");
    InvokeChecked("network create", CliArgumentBuilder::BuildNetworkCreate(name, internal));
}

void DockerCli::RemoveNetwork(const std::string& name) {
    spdlog::info("Removing network '{}'", name);
    InvokeChecked("network rm", CliArgumentBuilder::BuildNetworkRemove(name));
}

void DockerCli::NetworkConnect(const std::string& container, const std::string& network) {
    spdlog::info("Connecting '{}' to network '{}'", container, network);
    InvokeChecked("network connect", CliArgumentBuilder::BuildNetworkConnect(container, network));
}

void DockerCli::NetworkDisconnect(const std::string& container,
                                  const std::string& network,
                                  bool force) {
    spdlog::info("Disconnecting '{}' from network '{}'", container, network);
    InvokeChecked("network disconnect",
                  CliArgumentBuilder::BuildNetworkDisconnect(container, network, force));
}

std::vector<core::Network> DockerCli::ListNetworks() {
    auto result = InvokeChecked("network ls", CliArgumentBuilder::BuildNetworkList());
    return parsers::ParseNetworkList(result.stdout_output);
}

// ============================================================================
// CONTAINERS
// ============================================================================

std::vector<core::Stats> DockerCli::GetStats(const std::optional<std::string>& container,
                                             const core::Filters& filters) {
    std::vector<std::string> ids;

    if (container) {
        ids.push_back(*container);
    } else {
        for (const auto& listed : List(filters)) {
            ids.push_back(listed.id);
        }
        if (ids.empty() && !filters.empty()) {
            spdlog::debug("No containers match the stats filters");
            return {};
        }
    }

    auto result = InvokeChecked("stats", CliArgumentBuilder::BuildStats(ids));
    return parsers::ParseStatsList(result.stdout_output);
}

void DockerCli::Pull(const std::string& image) {
    spdlog::info("Pulling image '{}'", image);
    InvokeChecked("pull", CliArgumentBuilder::BuildPull(image));
}

std::vector<core::Container> DockerCli::List(const core::Filters& filters) {
    auto result = InvokeChecked("ps", CliArgumentBuilder::BuildList(filters));
    return parsers::ParseContainerList(result.stdout_output);
}

std::string DockerCli::Run(const core::RunSpec& spec) {
    spdlog::info("Starting container '{}' from '{}'", spec.name, spec.image);

    auto args = CliArgumentBuilder::BuildRun(spec, config_, builders::NowMillis());
    auto result = InvokeChecked("run", args);

    std::string id = StringUtils::Trim(result.stdout_output);
    spdlog::debug("Container '{}' started: {}", spec.name, id);
    return id;
}

core::ExecResult DockerCli::Execute(const std::string& name,
                                    const std::vector<std::string>& command,
                                    const std::map<std::string, std::string>& vars,
                                    std::optional<std::chrono::seconds> timeout) {
    spdlog::debug("Executing in '{}': {}", name, StringUtils::Join(command, " "));

    std::vector<std::string> argv;
    if (timeout) {
        argv.push_back("timeout");
        argv.push_back(std::to_string(timeout->count()));
    }
    argv.push_back(StringUtils::QuoteIfWhitespace(docker_binary_));

    auto args = CliArgumentBuilder::BuildExec(name, command, vars);
    argv.insert(argv.end(), args.begin(), args.end());

    auto result = runner_->Run(argv);

    if (result.exit_code == kTimeoutExitCode) {
        spdlog::warn("Command in '{}' timed out", name);
        throw core::TimeoutError("Command in container '" + name + "' timed out");
    }
    if (result.exit_code != 0) {
        spdlog::error("docker exec in '{}' failed with exit code {}", name, result.exit_code);
        throw core::BackendInvocationError("Docker exec failed",
                                           StringUtils::Trim(result.stderr_output),
                                           result.exit_code);
    }

    core::ExecResult exec;
    exec.exit_code = result.exit_code;
    exec.stdout_output = std::move(result.stdout_output);
    exec.stderr_output = std::move(result.stderr_output);
    return exec;
}

void DockerCli::Remove(const std::string& name, bool force) {
    spdlog::info("Removing container '{}'{}", name, force ? " (forced)" : "");

    auto result = Invoke(CliArgumentBuilder::BuildRemove(name, force));

    if (result.exit_code != 0) {
        spdlog::error("docker rm '{}' failed with exit code {}", name, result.exit_code);
        throw core::BackendInvocationError("Docker rm failed",
                                           StringUtils::Trim(result.stderr_output),
                                           result.exit_code);
    }

    // docker rm echoes each removed container
    if (!StringUtils::Contains(result.stdout_output, name)) {
        spdlog::error("docker rm '{}' did not report the container as removed", name);
        throw core::BackendInvocationError("Docker rm did not remove the container",
                                           StringUtils::Trim(result.stdout_output),
                                           result.exit_code);
    }
}

} // namespace adapters
} // namespace dockhand
