/**
 * @file main.cpp
 * @brief dockhand - command-line front end for the orchestration adapters
 *
 * Exposes every adapter operation as a subcommand. Backend and limits come
 * from an optional JSON configuration file; command-line flags override it.
 * Query results are printed to stdout as JSON, logs go to stderr.
 *
 * **Examples**:
 * ```
 * dockhand ps --filter label=ci-created
 * dockhand --backend api --cpus 1 run alpine job -- sleep 60
 * dockhand exec job --timeout 10 -- sh -c 'echo hi'
 * dockhand network create jobs --internal
 * dockhand stats job
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "dockhand/core/errors.hpp"
#include "dockhand/core/orchestration.hpp"

#include <iostream>
#include <map>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace dockhand;

/*******************************************************************************
 * Helpers
 ******************************************************************************/

std::map<std::string, std::string> ParseAssignments(const std::vector<std::string>& items,
                                                    const std::string& what) {
    std::map<std::string, std::string> result;
    for (const auto& item : items) {
        auto pos = item.find('=');
        if (pos == std::string::npos || pos == 0) {
            throw core::ConfigError("Invalid " + what + " '" + item + "', expected KEY=VALUE");
        }
        result[item.substr(0, pos)] = item.substr(pos + 1);
    }
    return result;
}

void PrintJson(const json& value) {
    std::cout << value.dump(2) << std::endl;
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"dockhand - uniform container orchestration over the Docker CLI or engine API"};
    app.require_subcommand(1);

    // Global options
    std::string backend_name;
    std::string docker_binary;
    std::string socket_path;
    std::string config_path;
    std::string namespace_name;
    int cpus = 0;
    int memory = 0;
    int swap = 0;
    std::string username;
    std::string email;
    bool password_stdin = false;
    bool verbose = false;

    auto* backend_opt = app.add_option("--backend", backend_name, "Backend to use (cli or api)")
        ->check(CLI::IsMember({"cli", "api"}, CLI::ignore_case));
    auto* docker_opt = app.add_option("--docker", docker_binary, "Docker executable for the cli backend");
    auto* socket_opt = app.add_option("--socket", socket_path, "Engine socket for the api backend");
    app.add_option("--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    auto* namespace_opt = app.add_option("--namespace", namespace_name, "Provenance label namespace");
    auto* cpus_opt = app.add_option("--cpus", cpus, "CPU limit for started containers")
        ->check(CLI::NonNegativeNumber);
    auto* memory_opt = app.add_option("--memory", memory, "Memory limit in MB")
        ->check(CLI::NonNegativeNumber);
    auto* swap_opt = app.add_option("--swap", swap, "Swap limit in MB")
        ->check(CLI::NonNegativeNumber);
    auto* username_opt = app.add_option("--username", username, "Registry username");
    app.add_flag("--password-stdin", password_stdin, "Read the registry password from stdin");
    auto* email_opt = app.add_option("--email", email, "Registry account email");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // ps
    std::vector<std::string> filter_items;
    auto* ps = app.add_subcommand("ps", "List containers");
    ps->add_option("-f,--filter", filter_items, "Filter KEY=VALUE (repeatable)");

    // run
    core::RunSpec spec;
    std::vector<std::string> env_items;
    std::vector<std::string> label_items;
    auto* run = app.add_subcommand("run", "Create and start a container");
    run->add_option("image", spec.image, "Image reference")->required();
    run->add_option("name", spec.name, "Container name")->required();
    run->add_option("command", spec.command, "Command and arguments");
    run->add_option("--entrypoint", spec.entrypoint, "Entrypoint override");
    run->add_option("-w,--workdir", spec.workdir, "Working directory");
    run->add_option("-V,--volume", spec.volumes, "Bind mount host:container[:mode] (repeatable)");
    run->add_option("-e,--env", env_items, "Environment KEY=VALUE (repeatable)");
    run->add_option("-l,--label", label_items, "Label KEY=VALUE (repeatable)");
    run->add_option("--hostname", spec.hostname, "Container hostname");
    run->add_option("--network", spec.network, "Network to attach");
    run->add_option("--mount", spec.mount_folder, "Host folder mounted read-write at /tmp");
    run->add_flag("--rm", spec.remove, "Remove the container when it exits");

    // exec
    std::string exec_name;
    std::vector<std::string> exec_command;
    std::vector<std::string> exec_env_items;
    int exec_timeout = 0;
    auto* exec = app.add_subcommand("exec", "Run a command in a running container");
    exec->add_option("name", exec_name, "Container name")->required();
    exec->add_option("command", exec_command, "Command and arguments")->required();
    exec->add_option("-e,--env", exec_env_items, "Environment KEY=VALUE (repeatable)");
    exec->add_option("--timeout", exec_timeout, "Timeout in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber);

    // rm
    std::string rm_name;
    bool rm_force = false;
    auto* rm = app.add_subcommand("rm", "Remove a container");
    rm->add_option("name", rm_name, "Container name")->required();
    rm->add_flag("-f,--force", rm_force, "Kill a running container first");

    // stats
    std::string stats_container;
    std::vector<std::string> stats_filter_items;
    auto* stats = app.add_subcommand("stats", "Resource usage snapshot");
    auto* stats_container_opt = stats->add_option("container", stats_container, "Container name or id");
    stats->add_option("-f,--filter", stats_filter_items, "Filter KEY=VALUE when no container is given");

    // pull
    std::string image;
    auto* pull = app.add_subcommand("pull", "Pull an image");
    pull->add_option("image", image, "Image reference")->required();

    // network
    std::string network_name;
    std::string network_container;
    bool network_internal = false;
    bool network_force = false;
    auto* network = app.add_subcommand("network", "Manage networks");
    network->require_subcommand(1);
    auto* network_ls = network->add_subcommand("ls", "List networks");
    auto* network_create = network->add_subcommand("create", "Create a network");
    network_create->add_option("name", network_name, "Network name")->required();
    network_create->add_flag("--internal", network_internal, "Restrict external access");
    auto* network_rm = network->add_subcommand("rm", "Remove a network");
    network_rm->add_option("name", network_name, "Network name")->required();
    auto* network_connect = network->add_subcommand("connect", "Attach a container");
    network_connect->add_option("network", network_name, "Network name")->required();
    network_connect->add_option("container", network_container, "Container name")->required();
    auto* network_disconnect = network->add_subcommand("disconnect", "Detach a container");
    network_disconnect->add_option("network", network_name, "Network name")->required();
    network_disconnect->add_option("container", network_container, "Container name")->required();
    network_disconnect->add_flag("-f,--force", network_force, "Force the disconnect");

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout stays machine readable
    spdlog::set_default_logger(spdlog::stderr_color_mt("dockhand"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        core::OrchestrationConfig config;
        if (!config_path.empty()) {
            config = core::LoadConfigFile(config_path);
        }

        // Command-line flags override the file
        if (*backend_opt) config.backend = core::ParseBackend(backend_name);
        if (*docker_opt) config.docker_binary = docker_binary;
        if (*socket_opt) config.socket_path = socket_path;
        if (*namespace_opt) config.adapter.namespace_name = namespace_name;
        if (*cpus_opt) config.adapter.cpus = cpus;
        if (*memory_opt) config.adapter.memory = memory;
        if (*swap_opt) config.adapter.swap = swap;

        if (*username_opt) {
            core::Credentials credentials = config.credentials.value_or(core::Credentials{});
            credentials.username = username;
            if (password_stdin) {
                std::getline(std::cin, credentials.password);
            }
            if (*email_opt) {
                credentials.email = email;
            }
            config.credentials = credentials;
        }

        core::Orchestration orchestration(core::MakeAdapter(config));

        if (ps->parsed()) {
            PrintJson(orchestration.List(ParseAssignments(filter_items, "filter")));
        }
        else if (run->parsed()) {
            spec.environment = ParseAssignments(env_items, "environment variable");
            spec.labels = ParseAssignments(label_items, "label");
            PrintJson({{"id", orchestration.Run(spec)}});
        }
        else if (exec->parsed()) {
            std::optional<std::chrono::seconds> timeout;
            if (exec_timeout > 0) {
                timeout = std::chrono::seconds(exec_timeout);
            }
            auto result = orchestration.Execute(exec_name, exec_command,
                                                ParseAssignments(exec_env_items, "environment variable"),
                                                timeout);
            std::cout << result.stdout_output;
            std::cerr << result.stderr_output;
        }
        else if (rm->parsed()) {
            orchestration.Remove(rm_name, rm_force);
        }
        else if (stats->parsed()) {
            std::optional<std::string> container;
            if (*stats_container_opt) {
                container = stats_container;
            }
            PrintJson(orchestration.GetStats(container,
                                             ParseAssignments(stats_filter_items, "filter")));
        }
        else if (pull->parsed()) {
            orchestration.Pull(image);
        }
        else if (network_ls->parsed()) {
            PrintJson(orchestration.ListNetworks());
        }
        else if (network_create->parsed()) {
            orchestration.CreateNetwork(network_name, network_internal);
        }
        else if (network_rm->parsed()) {
            orchestration.RemoveNetwork(network_name);
        }
        else if (network_connect->parsed()) {
            orchestration.NetworkConnect(network_container, network_name);
        }
        else if (network_disconnect->parsed()) {
            orchestration.NetworkDisconnect(network_container, network_name, network_force);
        }
    }
    catch (const core::TimeoutError& e) {
        spdlog::error("[TIMEOUT] {}", e.what());
        return 1;
    }
    catch (const core::BackendInvocationError& e) {
        spdlog::error("[BACKEND] {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::error("[ERROR] {}", e.what());
        return 1;
    }

    return 0;
}
