/**
 * @file argument_builder.cpp
 * @brief Implementation of CLI argv and engine API body construction
 *
 * **Escaping Rules (CLI)**:
 * - Command tokens and flag values containing whitespace are single quoted
 * - Label values lose every `'` before quoting
 * - Environment keys keep only `[A-Za-z0-9_.-]`; an entry whose key filters
 *   to nothing is skipped
 * - Resource flags appear only for positive limits
 * - Empty tokens are never emitted
 *
 * **Example**:
 * ```
 * RunSpec{image="alpine", name="job", command={"sh","-c","echo hi"}}
 *   -> run -d --label=utopia-created=1700000000000 --name=job alpine sh -c 'echo hi'
 * ```
 *
 * @date 2025
 */

#include "dockhand/builders/argument_builder.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

using json = nlohmann::json;

namespace dockhand {
namespace builders {

namespace {

using utils::StringUtils;

constexpr const char* kJsonFormat = "{{json .}}";
constexpr std::int64_t kBytesPerMegabyte = 1024 * 1024;
constexpr std::int64_t kNanoCpusPerCpu = 1000000000;

void AppendPair(std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    if (value.empty()) {
        return;
    }
    args.push_back(flag);
    args.push_back(value);
}

std::vector<std::string> DropEmpty(std::vector<std::string> args) {
    args.erase(std::remove_if(args.begin(), args.end(),
                              [](const std::string& arg) { return arg.empty(); }),
               args.end());
    return args;
}

std::vector<std::string> QuoteAll(const std::vector<std::string>& tokens) {
    std::vector<std::string> quoted;
    quoted.reserve(tokens.size());
    for (const auto& token : tokens) {
        quoted.push_back(StringUtils::QuoteIfWhitespace(token));
    }
    return quoted;
}

} // anonymous namespace

std::string ProvenanceLabelKey(const std::string& namespace_name) {
    return namespace_name + "-created";
}

std::int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// CLI ARGUMENTS
// ============================================================================

std::vector<std::string> CliArgumentBuilder::BuildEnvironment(
    const std::map<std::string, std::string>& vars) {

    std::vector<std::string> args;
    for (const auto& [raw_key, value] : vars) {
        std::string key = StringUtils::FilterEnvKey(raw_key);
        if (key.empty()) {
            spdlog::warn("Skipping environment variable with invalid key '{}'", raw_key);
            continue;
        }
        args.push_back("--env");
        args.push_back(key + "=" + StringUtils::QuoteIfWhitespace(value));
    }
    return args;
}

std::vector<std::string> CliArgumentBuilder::BuildLabels(
    const std::map<std::string, std::string>& labels) {

    std::vector<std::string> args;
    for (const auto& [key, raw_value] : labels) {
        if (key.empty()) continue;
        std::string value = StringUtils::ReplaceAll(raw_value, "'", "");
        args.push_back("--label");
        args.push_back(key + "=" + StringUtils::QuoteIfWhitespace(value));
    }
    return args;
}

std::vector<std::string> CliArgumentBuilder::BuildRun(const core::RunSpec& spec,
                                                      const core::AdapterConfig& config,
                                                      std::int64_t created_at_ms) {
    std::vector<std::string> args = {"run", "-d"};

    if (spec.remove) {
        args.push_back("--rm");
    }
    if (!spec.network.empty()) {
        args.push_back("--network=" + StringUtils::QuoteIfWhitespace(spec.network));
    }
    if (!spec.entrypoint.empty()) {
        args.push_back("--entrypoint=" + StringUtils::QuoteIfWhitespace(spec.entrypoint));
    }

    // Resource limits
    if (config.cpus > 0) {
        args.push_back("--cpus=" + std::to_string(config.cpus));
    }
    if (config.memory > 0) {
        args.push_back("--memory=" + std::to_string(config.memory) + "m");
    }
    if (config.swap > 0) {
        args.push_back("--memory-swap=" + std::to_string(config.swap) + "m");
    }

    args.push_back("--label=" + ProvenanceLabelKey(config.namespace_name) + "=" +
                   std::to_string(created_at_ms));
    args.push_back("--name=" + StringUtils::QuoteIfWhitespace(spec.name));

    if (!spec.mount_folder.empty()) {
        AppendPair(args, "--volume", StringUtils::QuoteIfWhitespace(spec.mount_folder + ":/tmp:rw"));
    }
    for (const auto& volume : spec.volumes) {
        AppendPair(args, "--volume", StringUtils::QuoteIfWhitespace(volume));
    }

    auto labels = BuildLabels(spec.labels);
    args.insert(args.end(), labels.begin(), labels.end());

    AppendPair(args, "--workdir", StringUtils::QuoteIfWhitespace(spec.workdir));
    AppendPair(args, "--hostname", StringUtils::QuoteIfWhitespace(spec.hostname));

    auto env = BuildEnvironment(spec.environment);
    args.insert(args.end(), env.begin(), env.end());

    args.push_back(spec.image);

    auto command = QuoteAll(spec.command);
    args.insert(args.end(), command.begin(), command.end());

    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildExec(
    const std::string& name,
    const std::vector<std::string>& command,
    const std::map<std::string, std::string>& vars) {

    std::vector<std::string> args = {"exec"};

    auto env = BuildEnvironment(vars);
    args.insert(args.end(), env.begin(), env.end());

    args.push_back(name);

    auto quoted = QuoteAll(command);
    args.insert(args.end(), quoted.begin(), quoted.end());

    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildList(const Filters& filters) {
    std::vector<std::string> args = {
        "ps", "--all", "--no-trunc",
        "--format", StringUtils::QuoteIfWhitespace(kJsonFormat)
    };

    for (const auto& [key, value] : filters) {
        args.push_back("--filter");
        args.push_back(StringUtils::QuoteIfWhitespace(key + "=" + value));
    }

    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildStats(const std::vector<std::string>& container_ids) {
    std::vector<std::string> args = {
        "stats", "--no-trunc", "--no-stream",
        "--format", StringUtils::QuoteIfWhitespace(kJsonFormat)
    };
    args.insert(args.end(), container_ids.begin(), container_ids.end());
    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildRemove(const std::string& name, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(name);
    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildPull(const std::string& image) {
    return DropEmpty({"pull", image});
}

std::vector<std::string> CliArgumentBuilder::BuildNetworkCreate(const std::string& name, bool internal) {
    std::vector<std::string> args = {"network", "create", name};
    if (internal) {
        args.push_back("--internal");
    }
    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildNetworkRemove(const std::string& name) {
    return DropEmpty({"network", "rm", name});
}

std::vector<std::string> CliArgumentBuilder::BuildNetworkConnect(const std::string& container,
                                                                 const std::string& network) {
    return DropEmpty({"network", "connect", network, container});
}

std::vector<std::string> CliArgumentBuilder::BuildNetworkDisconnect(const std::string& container,
                                                                    const std::string& network,
                                                                    bool force) {
    std::vector<std::string> args = {"network", "disconnect"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(network);
    args.push_back(container);
    return DropEmpty(std::move(args));
}

std::vector<std::string> CliArgumentBuilder::BuildNetworkList() {
    return {"network", "ls", "--no-trunc", "--format", StringUtils::QuoteIfWhitespace(kJsonFormat)};
}

std::vector<std::string> CliArgumentBuilder::BuildLogin(const std::string& username) {
    return DropEmpty({"login", "--username", StringUtils::QuoteIfWhitespace(username), "--password-stdin"});
}

// ============================================================================
// ENGINE API BODIES
// ============================================================================

std::vector<std::string> ApiRequestBuilder::BuildEnvironment(
    const std::map<std::string, std::string>& vars) {

    std::vector<std::string> env;
    for (const auto& [raw_key, value] : vars) {
        std::string key = StringUtils::FilterEnvKey(raw_key);
        if (key.empty()) {
            spdlog::warn("Skipping environment variable with invalid key '{}'", raw_key);
            continue;
        }
        env.push_back(key + "=" + value);
    }
    return env;
}

json ApiRequestBuilder::BuildCreateContainer(const core::RunSpec& spec,
                                             const core::AdapterConfig& config,
                                             std::int64_t created_at_ms) {
    json body;
    body["Image"] = spec.image;

    if (!spec.command.empty()) {
        body["Cmd"] = spec.command;
    }
    if (!spec.entrypoint.empty()) {
        body["Entrypoint"] = json::array({spec.entrypoint});
    }
    if (!spec.workdir.empty()) {
        body["WorkingDir"] = spec.workdir;
    }
    if (!spec.hostname.empty()) {
        body["Hostname"] = spec.hostname;
    }

    json labels = json::object();
    for (const auto& [key, value] : spec.labels) {
        if (!key.empty()) {
            labels[key] = value;
        }
    }
    labels[ProvenanceLabelKey(config.namespace_name)] = std::to_string(created_at_ms);
    body["Labels"] = labels;

    auto env = BuildEnvironment(spec.environment);
    if (!env.empty()) {
        body["Env"] = env;
    }

    json host_config;
    host_config["AutoRemove"] = spec.remove;

    std::vector<std::string> binds;
    if (!spec.mount_folder.empty()) {
        binds.push_back(spec.mount_folder + ":/tmp:rw");
    }
    for (const auto& volume : spec.volumes) {
        if (!volume.empty()) {
            binds.push_back(volume);
        }
    }
    if (!binds.empty()) {
        host_config["Binds"] = binds;
    }
    if (!spec.network.empty()) {
        host_config["NetworkMode"] = spec.network;
    }

    // Resource limits
    if (config.cpus > 0) {
        host_config["NanoCpus"] = static_cast<std::int64_t>(config.cpus) * kNanoCpusPerCpu;
    }
    if (config.memory > 0) {
        host_config["Memory"] = static_cast<std::int64_t>(config.memory) * kBytesPerMegabyte;
    }
    if (config.swap > 0) {
        host_config["MemorySwap"] = static_cast<std::int64_t>(config.swap) * kBytesPerMegabyte;
    }

    body["HostConfig"] = host_config;
    return body;
}

json ApiRequestBuilder::BuildExecCreate(const std::vector<std::string>& command,
                                        const std::map<std::string, std::string>& vars) {
    json body = {
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"Tty", false},
        {"Cmd", command}
    };

    auto env = BuildEnvironment(vars);
    if (!env.empty()) {
        body["Env"] = env;
    }
    return body;
}

json ApiRequestBuilder::BuildNetworkCreate(const std::string& name, bool internal) {
    return {
        {"Name", name},
        {"Internal", internal},
        {"CheckDuplicate", true}
    };
}

json ApiRequestBuilder::BuildNetworkDisconnect(const std::string& container, bool force) {
    return {
        {"Container", container},
        {"Force", force}
    };
}

std::string ApiRequestBuilder::EncodeFilters(const Filters& filters) {
    if (filters.empty()) {
        return "";
    }

    json encoded = json::object();
    for (const auto& [key, value] : filters) {
        encoded[key] = json::array({value});
    }
    return StringUtils::UrlEncode(encoded.dump());
}

} // namespace builders
} // namespace dockhand
