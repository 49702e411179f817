#include <gtest/gtest.h>

#include "dockhand/core/container.hpp"
#include "dockhand/core/network.hpp"
#include "dockhand/core/run_spec.hpp"
#include "dockhand/core/stats.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace dockhand;
using json = nlohmann::json;

TEST(ModelTest, ContainerEqualityIncludesLabels) {
    core::Container a{"web", "abc", "Up", {{"tier", "web"}}};
    core::Container b = a;
    EXPECT_EQ(a, b);

    b.labels["tier"] = "db";
    EXPECT_NE(a, b);
}

TEST(ModelTest, ContainerJsonRoundTrip) {
    core::Container container{"web", "abc", "Up 1 second", {{"utopia-created", "1"}, {"a", ""}}};
    json j = container;

    EXPECT_EQ(j["name"], "web");
    EXPECT_EQ(j["labels"]["utopia-created"], "1");
    EXPECT_EQ(j.get<core::Container>(), container);
}

TEST(ModelTest, NetworkJsonRoundTrip) {
    core::Network network{"jobs", "n1", "bridge", "local"};
    json j = network;

    EXPECT_EQ(j.dump(), R"({"driver":"bridge","id":"n1","name":"jobs","scope":"local"})");
    EXPECT_EQ(j.get<core::Network>(), network);
}

TEST(ModelTest, StatsJsonUsesDomainKeys) {
    core::Stats stats;
    stats.container_id = "abc";
    stats.container_name = "web";
    stats.cpu_usage = 0.25;
    stats.memory_usage = 0.5;
    stats.disk_io = {1.0, 2.0};
    stats.memory_io = {3.0, 4.0};
    stats.network_io = {5.0, 6.0};

    json j = stats;
    EXPECT_EQ(j["containerId"], "abc");
    EXPECT_DOUBLE_EQ(j["cpuUsage"].get<double>(), 0.25);
    EXPECT_DOUBLE_EQ(j["networkIO"]["out"].get<double>(), 6.0);
    EXPECT_FALSE(j.contains("cpuUsageValid"));

    EXPECT_EQ(j.get<core::Stats>(), stats);
}

TEST(ModelTest, StatsValidityFlagsSurviveSerialization) {
    core::Stats stats;
    stats.container_id = "abc";
    stats.memory_usage_valid = false;

    json j = stats;
    EXPECT_EQ(j["memoryUsageValid"], false);

    auto decoded = json::parse(j.dump()).get<core::Stats>();
    EXPECT_EQ(decoded, stats);
    EXPECT_TRUE(decoded.cpu_usage_valid);
    EXPECT_FALSE(decoded.memory_usage_valid);
}

TEST(ModelTest, StatsPrintsEveryField) {
    core::Stats stats;
    stats.container_name = "web";
    stats.network_io = {1.0, 2.0};

    std::ostringstream oss;
    oss << stats;
    EXPECT_NE(oss.str().find("containerName: web"), std::string::npos);
    EXPECT_NE(oss.str().find("networkIO: {in: 1, out: 2}"), std::string::npos);
}

TEST(ModelTest, RunSpecBuilderCollectsFields) {
    auto spec = core::RunSpecBuilder("alpine", "job")
        .WithCommand({"true"})
        .WithVolume("/a:/b")
        .WithVolume("/c:/d")
        .WithEnvironment("K", "V")
        .WithLabel("tier", "web")
        .WithHostname("box")
        .WithNetwork("jobs")
        .WithAutoRemove()
        .WithMountFolder("/srv")
        .Build();

    EXPECT_EQ(spec.image, "alpine");
    EXPECT_EQ(spec.name, "job");
    EXPECT_EQ(spec.volumes.size(), 2u);
    EXPECT_EQ(spec.environment.at("K"), "V");
    EXPECT_EQ(spec.labels.at("tier"), "web");
    EXPECT_TRUE(spec.remove);
    EXPECT_EQ(spec.mount_folder, "/srv");
}
