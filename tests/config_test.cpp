#include <gtest/gtest.h>

#include "dockhand/core/config.hpp"
#include "dockhand/core/errors.hpp"

#include <filesystem>
#include <fstream>

using namespace dockhand;

TEST(ConfigTest, AdapterDefaults) {
    core::AdapterConfig config;
    EXPECT_EQ(config.namespace_name, "utopia");
    EXPECT_EQ(config.cpus, 0);
    EXPECT_EQ(config.memory, 0);
    EXPECT_EQ(config.swap, 0);
}

TEST(ConfigTest, BuilderChains) {
    auto config = core::AdapterConfigBuilder()
        .WithNamespace("ci")
        .WithCpus(4)
        .WithMemory(2048)
        .WithSwap(4096)
        .Build();

    EXPECT_EQ(config.namespace_name, "ci");
    EXPECT_EQ(config.cpus, 4);
    EXPECT_EQ(config.memory, 2048);
    EXPECT_EQ(config.swap, 4096);
}

TEST(ConfigTest, BackendNames) {
    EXPECT_EQ(core::ParseBackend("cli"), core::Backend::CLI);
    EXPECT_EQ(core::ParseBackend("API"), core::Backend::API);
    EXPECT_EQ(core::BackendToString(core::Backend::API), "api");
    EXPECT_THROW(core::ParseBackend("podman"), core::ConfigError);
}

TEST(ConfigTest, ParseFullDocument) {
    auto config = core::ParseConfig(R"({
        "backend": "api",
        "socket": "/run/user/1000/docker.sock",
        "docker": "/usr/local/bin/docker",
        "namespace": "ci",
        "cpus": 2,
        "memory": 1024,
        "swap": 2048,
        "credentials": {"username": "bot", "password": "secret", "email": "bot@example.com"}
    })");

    EXPECT_EQ(config.backend, core::Backend::API);
    EXPECT_EQ(config.socket_path, "/run/user/1000/docker.sock");
    EXPECT_EQ(config.docker_binary, "/usr/local/bin/docker");
    EXPECT_EQ(config.adapter.namespace_name, "ci");
    EXPECT_EQ(config.adapter.cpus, 2);
    EXPECT_EQ(config.adapter.memory, 1024);
    EXPECT_EQ(config.adapter.swap, 2048);
    ASSERT_TRUE(config.credentials.has_value());
    EXPECT_EQ(config.credentials->username, "bot");
    EXPECT_EQ(config.credentials->email, "bot@example.com");
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    auto config = core::ParseConfig("{}");
    EXPECT_EQ(config.backend, core::Backend::CLI);
    EXPECT_EQ(config.docker_binary, "docker");
    EXPECT_EQ(config.socket_path, "/var/run/docker.sock");
    EXPECT_EQ(config.adapter.namespace_name, "utopia");
    EXPECT_FALSE(config.credentials.has_value());
}

TEST(ConfigTest, InvalidDocumentsRaiseConfigError) {
    EXPECT_THROW(core::ParseConfig("not json"), core::ConfigError);
    EXPECT_THROW(core::ParseConfig("[1, 2]"), core::ConfigError);
    EXPECT_THROW(core::ParseConfig(R"({"cpus": "two"})"), core::ConfigError);
    EXPECT_THROW(core::ParseConfig(R"({"backend": "lxc"})"), core::ConfigError);
    EXPECT_THROW(core::ParseConfig(R"({"credentials": {"username": "bot"}})"), core::ConfigError);
}

TEST(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "dockhand_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"backend": "cli", "namespace": "file"})";
    }

    auto config = core::LoadConfigFile(path);
    EXPECT_EQ(config.backend, core::Backend::CLI);
    EXPECT_EQ(config.adapter.namespace_name, "file");

    std::filesystem::remove(path);
}

TEST(ConfigTest, MissingFileRaises) {
    EXPECT_THROW(core::LoadConfigFile("/nonexistent/dockhand.json"), core::ConfigError);
}
