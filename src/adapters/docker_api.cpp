/**
 * @file docker_api.cpp
 * @brief Implementation of the Docker engine HTTP API backend
 *
 * **Endpoint Mapping**:
 * ```
 * CreateNetwork     POST   /networks/create                       201
 * RemoveNetwork     DELETE /networks/{name}                       204
 * NetworkConnect    POST   /networks/{network}/connect            200
 * NetworkDisconnect POST   /networks/{network}/disconnect         200
 * ListNetworks      GET    /networks                              200
 * GetStats          GET    /containers/{id}/stats?stream=false    200
 * Pull              POST   /images/create?fromImage={image}       200
 * List              GET    /containers/json?all=true[&filters=]   200
 * Run               POST   /containers/create?name={name}         201
 *                   POST   /containers/{id}/start                 204, 304
 * Remove            DELETE /containers/{name}?force={bool}        204
 * ```
 *
 * @date 2025
 */

#include "dockhand/adapters/docker_api.hpp"
#include "dockhand/builders/argument_builder.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/parsers/response_parser.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace dockhand {
namespace adapters {

namespace {

using builders::ApiRequestBuilder;
using utils::StringUtils;

/// Exec exit code reported by the `timeout` utility
constexpr int kTimeoutExitCode = 124;

std::string PathSegment(const std::string& value) {
    return StringUtils::UrlEncode(value);
}

} // anonymous namespace

DockerApi::DockerApi(core::AdapterConfig config,
                     std::string socket_path,
                     const std::optional<core::Credentials>& credentials,
                     std::shared_ptr<utils::HttpTransport> transport)
    : core::Adapter(std::move(config))
    , socket_path_(std::move(socket_path))
    , transport_(std::move(transport)) {

    if (!transport_) {
        transport_ = std::make_shared<utils::UnixSocketTransport>(socket_path_);
    }

    if (credentials && !credentials->username.empty() && !credentials->password.empty()) {
        registry_auth_ = EncodeRegistryAuth(*credentials);
        spdlog::debug("Registry auth prepared for '{}'", credentials->username);
    }

    spdlog::debug("Docker API adapter using '{}' (namespace '{}')",
                  socket_path_, config_.namespace_name);
}

std::string DockerApi::EncodeRegistryAuth(const core::Credentials& credentials) {
    json auth = {
        {"username", credentials.username},
        {"password", credentials.password},
        {"serveraddress", kRegistryServer}
    };
    if (!credentials.email.empty()) {
        auth["email"] = credentials.email;
    }
    return StringUtils::ToBase64(auth.dump());
}

utils::HttpResponse DockerApi::Call(const std::string& method,
                                    const std::string& target,
                                    const std::string& body,
                                    std::optional<std::chrono::seconds> timeout) {
    utils::HttpRequest request;
    request.method = method;
    request.target = target;
    request.body = body;
    request.timeout = timeout;
    if (!registry_auth_.empty()) {
        request.headers["X-Registry-Auth"] = registry_auth_;
    }
    return transport_->Send(request);
}

utils::HttpResponse DockerApi::CallExpecting(const std::string& operation,
                                             std::initializer_list<int> expected,
                                             const std::string& method,
                                             const std::string& target,
                                             const std::string& body,
                                             std::optional<std::chrono::seconds> timeout) {
    auto response = Call(method, target, body, timeout);

    if (std::find(expected.begin(), expected.end(), response.status) == expected.end()) {
        spdlog::error("{} failed: {} {} returned {}", operation, method, target, response.status);
        throw core::BackendInvocationError("Error " + operation + " (HTTP " +
                                           std::to_string(response.status) + ")",
                                           StringUtils::Trim(response.body),
                                           response.status);
    }
    return response;
}

// ============================================================================
// NETWORKS
// ============================================================================

void DockerApi::CreateNetwork(const std::string& name, bool internal) {
    spdlog::info("Creating network '{}'{}", name, internal ? " (internal)" : "");
    CallExpecting("creating network", {201}, "POST", "/networks/create",
                  ApiRequestBuilder::BuildNetworkCreate(name, internal).dump());
}

void DockerApi::RemoveNetwork(const std::string& name) {
    spdlog::info("Removing network '{}'", name);
    CallExpecting("removing network", {204}, "DELETE", "/networks/" + PathSegment(name));
}

void DockerApi::NetworkConnect(const std::string& container, const std::string& network) {
    spdlog::info("Connecting '{}' to network '{}'", container, network);
    json body = {{"Container", container}};
    CallExpecting("attaching network", {200}, "POST",
                  "/networks/" + PathSegment(network) + "/connect", body.dump());
}

void DockerApi::NetworkDisconnect(const std::string& container,
                                  const std::string& network,
                                  bool force) {
    spdlog::info("Disconnecting '{}' from network '{}'", container, network);
    CallExpecting("detaching network", {200}, "POST",
                  "/networks/" + PathSegment(network) + "/disconnect",
                  ApiRequestBuilder::BuildNetworkDisconnect(container, force).dump());
}

std::vector<core::Network> DockerApi::ListNetworks() {
    auto response = CallExpecting("listing networks", {200}, "GET", "/networks");
    return parsers::ParseApiNetworks(response.body);
}

// ============================================================================
// CONTAINERS
// ============================================================================

std::vector<core::Stats> DockerApi::GetStats(const std::optional<std::string>& container,
                                             const core::Filters& filters) {
    std::vector<std::string> ids;

    if (container) {
        ids.push_back(*container);
    } else {
        for (const auto& listed : List(filters)) {
            ids.push_back(listed.id);
        }
        if (ids.empty()) {
            spdlog::debug("No containers to sample");
            return {};
        }
    }

    std::vector<core::Stats> result;
    result.reserve(ids.size());

    for (const auto& id : ids) {
        auto response = CallExpecting("getting stats", {200}, "GET",
                                      "/containers/" + PathSegment(id) + "/stats?stream=false");
        auto stats = parsers::ParseApiStats(response.body);
        if (stats.container_id.empty()) {
            stats.container_id = id;
        }
        result.push_back(std::move(stats));
    }

    return result;
}

void DockerApi::Pull(const std::string& image) {
    spdlog::info("Pulling image '{}'", image);

    auto response = CallExpecting("pulling image", {200}, "POST",
                                  "/images/create?fromImage=" + StringUtils::UrlEncode(image));

    // Failures after the headers are sent arrive as progress entries
    if (auto error = parsers::FindPullError(response.body)) {
        spdlog::error("Pull of '{}' failed: {}", image, *error);
        throw core::BackendInvocationError("Error pulling image", *error, response.status);
    }
}

std::vector<core::Container> DockerApi::List(const core::Filters& filters) {
    std::string target = "/containers/json?all=true";

    std::string encoded = ApiRequestBuilder::EncodeFilters(filters);
    if (!encoded.empty()) {
        target += "&filters=" + encoded;
    }

    auto response = CallExpecting("listing containers", {200}, "GET", target);
    return parsers::ParseApiContainers(response.body);
}

std::string DockerApi::Run(const core::RunSpec& spec) {
    spdlog::info("Starting container '{}' from '{}'", spec.name, spec.image);

    json body = ApiRequestBuilder::BuildCreateContainer(spec, config_, builders::NowMillis());

    std::string target = "/containers/create";
    if (!spec.name.empty()) {
        target += "?name=" + StringUtils::UrlEncode(spec.name);
    }

    auto created = CallExpecting("creating container", {201}, "POST", target, body.dump());
    std::string id = parsers::ParseCreatedId(created.body);

    CallExpecting("starting container", {204, 304}, "POST",
                  "/containers/" + PathSegment(id) + "/start");

    spdlog::debug("Container '{}' started: {}", spec.name, id);
    return id;
}

core::ExecResult DockerApi::Execute(const std::string& name,
                                    const std::vector<std::string>& command,
                                    const std::map<std::string, std::string>& vars,
                                    std::optional<std::chrono::seconds> timeout) {
    spdlog::debug("Executing in '{}': {}", name, StringUtils::Join(command, " "));

    json create_body = ApiRequestBuilder::BuildExecCreate(command, vars);
    auto created = CallExpecting("creating exec instance", {201}, "POST",
                                 "/containers/" + PathSegment(name) + "/exec",
                                 create_body.dump(), timeout);
    std::string exec_id = parsers::ParseCreatedId(created.body);

    json start_body = {{"Detach", false}, {"Tty", false}};
    auto started = CallExpecting("starting exec instance", {200}, "POST",
                                 "/exec/" + PathSegment(exec_id) + "/start",
                                 start_body.dump(), timeout);

    auto [out, err] = parsers::DemultiplexStream(started.body);

    auto inspected = CallExpecting("inspecting exec instance", {200}, "GET",
                                   "/exec/" + PathSegment(exec_id) + "/json");
    auto exit_code = parsers::ParseExecExitCode(inspected.body);

    if (!exit_code) {
        throw core::BackendInvocationError("Exec instance did not finish",
                                           StringUtils::Trim(inspected.body));
    }
    if (*exit_code == kTimeoutExitCode) {
        spdlog::warn("Command in '{}' timed out", name);
        throw core::TimeoutError("Command in container '" + name + "' timed out");
    }
    if (*exit_code != 0) {
        spdlog::error("Exec in '{}' failed with exit code {}", name, *exit_code);
        throw core::BackendInvocationError("Exec failed", StringUtils::Trim(err), *exit_code);
    }

    core::ExecResult result;
    result.exit_code = *exit_code;
    result.stdout_output = std::move(out);
    result.stderr_output = std::move(err);
    return result;
}

void DockerApi::Remove(const std::string& name, bool force) {
    spdlog::info("Removing container '{}'{}", name, force ? " (forced)" : "");
    CallExpecting("removing container", {204}, "DELETE",
                  "/containers/" + PathSegment(name) + "?force=" + (force ? "true" : "false"));
}

} // namespace adapters
} // namespace dockhand
