#include <gtest/gtest.h>

#include "dockhand/adapters/docker_api.hpp"
#include "dockhand/adapters/docker_cli.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/core/orchestration.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace dockhand;

namespace {

/// Adapter that records the operations it receives
class RecordingAdapter : public core::Adapter {
public:
    RecordingAdapter() : core::Adapter(core::AdapterConfigBuilder().WithNamespace("rec").Build()) {}

    void CreateNetwork(const std::string& name, bool internal) override {
        calls.push_back("CreateNetwork " + name + (internal ? " internal" : ""));
    }
    void RemoveNetwork(const std::string& name) override {
        calls.push_back("RemoveNetwork " + name);
    }
    void NetworkConnect(const std::string& container, const std::string& network) override {
        calls.push_back("NetworkConnect " + container + " " + network);
    }
    void NetworkDisconnect(const std::string& container, const std::string& network,
                           bool force) override {
        calls.push_back("NetworkDisconnect " + container + " " + network + (force ? " force" : ""));
    }
    std::vector<core::Network> ListNetworks() override {
        calls.push_back("ListNetworks");
        return {core::Network{"jobs", "n1", "bridge", "local"}};
    }
    std::vector<core::Stats> GetStats(const std::optional<std::string>& container,
                                      const core::Filters& filters) override {
        calls.push_back("GetStats " + container.value_or("*") + " " +
                        std::to_string(filters.size()));
        core::Stats stats;
        stats.container_name = container.value_or("");
        return {stats};
    }
    void Pull(const std::string& image) override {
        if (image == "missing") {
            throw core::BackendInvocationError("Pull failed", "not found", 1);
        }
        calls.push_back("Pull " + image);
    }
    std::vector<core::Container> List(const core::Filters& filters) override {
        calls.push_back("List " + std::to_string(filters.size()));
        return {};
    }
    std::string Run(const core::RunSpec& spec) override {
        calls.push_back("Run " + spec.name);
        return "id-" + spec.name;
    }
    core::ExecResult Execute(const std::string& name,
                             const std::vector<std::string>& command,
                             const std::map<std::string, std::string>&,
                             std::optional<std::chrono::seconds> timeout) override {
        if (timeout && timeout->count() == 0) {
            throw core::TimeoutError("timed out");
        }
        calls.push_back("Execute " + name + " " + command.front());
        core::ExecResult result;
        result.stdout_output = "ran " + command.front();
        return result;
    }
    void Remove(const std::string& name, bool force) override {
        calls.push_back("Remove " + name + (force ? " force" : ""));
    }

    std::vector<std::string> calls;
};

} // namespace

TEST(OrchestrationTest, ForwardsEveryOperation) {
    auto adapter = std::make_shared<RecordingAdapter>();
    core::Orchestration orchestration(adapter);

    orchestration.CreateNetwork("jobs", true);
    orchestration.NetworkConnect("web", "jobs");
    orchestration.NetworkDisconnect("web", "jobs", true);
    auto networks = orchestration.ListNetworks();
    orchestration.RemoveNetwork("jobs");
    orchestration.Pull("alpine");
    orchestration.List({{"status", "running"}});
    auto id = orchestration.Run(core::RunSpecBuilder("alpine", "web").Build());
    auto result = orchestration.Execute("web", {"ls"});
    auto stats = orchestration.GetStats(std::string("web"));
    orchestration.Remove("web", true);

    std::vector<std::string> expected = {
        "CreateNetwork jobs internal",
        "NetworkConnect web jobs",
        "NetworkDisconnect web jobs force",
        "ListNetworks",
        "RemoveNetwork jobs",
        "Pull alpine",
        "List 1",
        "Run web",
        "Execute web ls",
        "GetStats web 0",
        "Remove web force"
    };
    EXPECT_EQ(adapter->calls, expected);
    EXPECT_EQ(networks.size(), 1u);
    EXPECT_EQ(id, "id-web");
    EXPECT_EQ(result.stdout_output, "ran ls");
    EXPECT_EQ(stats[0].container_name, "web");
    EXPECT_EQ(orchestration.GetConfig().namespace_name, "rec");
}

TEST(OrchestrationTest, PropagatesAdapterErrors) {
    core::Orchestration orchestration(std::make_shared<RecordingAdapter>());

    EXPECT_THROW(orchestration.Pull("missing"), core::BackendInvocationError);
    EXPECT_THROW(orchestration.Execute("web", {"sleep"}, {}, std::chrono::seconds(0)),
                 core::TimeoutError);
}

TEST(OrchestrationTest, AsyncVariantsDeliverResults) {
    auto adapter = std::make_shared<RecordingAdapter>();
    core::Orchestration orchestration(adapter);

    auto run = orchestration.RunAsync(core::RunSpecBuilder("alpine", "job").Build());
    EXPECT_EQ(run.get(), "id-job");

    auto exec = orchestration.ExecuteAsync("job", {"true"});
    EXPECT_EQ(exec.get().stdout_output, "ran true");

    auto stats = orchestration.GetStatsAsync(std::nullopt, {{"label", "x"}});
    EXPECT_EQ(stats.get().size(), 1u);

    auto pull = orchestration.PullAsync("missing");
    EXPECT_THROW(pull.get(), core::BackendInvocationError);
}

TEST(OrchestrationTest, NullAdapterIsRejected) {
    EXPECT_THROW(core::Orchestration(nullptr), core::ConfigError);
}

TEST(OrchestrationTest, FactorySelectsBackend) {
    core::OrchestrationConfig config;
    config.adapter = core::AdapterConfigBuilder().WithNamespace("factory").Build();

    config.backend = core::Backend::CLI;
    config.docker_binary = "/opt/docker";
    auto cli = core::MakeAdapter(config);
    auto* as_cli = dynamic_cast<adapters::DockerCli*>(cli.get());
    ASSERT_NE(as_cli, nullptr);
    EXPECT_EQ(as_cli->GetDockerBinary(), "/opt/docker");
    EXPECT_EQ(cli->GetConfig().namespace_name, "factory");

    config.backend = core::Backend::API;
    auto api = core::MakeAdapter(config);
    EXPECT_NE(dynamic_cast<adapters::DockerApi*>(api.get()), nullptr);
    EXPECT_EQ(api->GetConfig().namespace_name, "factory");
}
