#include <gtest/gtest.h>

#include "dockhand/adapters/docker_cli.hpp"
#include "dockhand/builders/argument_builder.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/string_utils.hpp"
#include "fakes.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace dockhand;
using adapters::DockerCli;
using fakes::FakeCommandRunner;

namespace {

struct CliFixture {
    std::shared_ptr<FakeCommandRunner> runner = std::make_shared<FakeCommandRunner>();

    std::unique_ptr<DockerCli> Make(core::AdapterConfig config = {}) {
        return std::make_unique<DockerCli>(config, "docker", std::nullopt, runner);
    }
};

} // namespace

TEST(DockerCliTest, RunReturnsTrimmedId) {
    CliFixture fx;
    auto cli = fx.Make(core::AdapterConfigBuilder().WithCpus(1).Build());
    fx.runner->Push(0, "f00dfeed\n");

    auto id = cli->Run(core::RunSpecBuilder("alpine", "job").WithCommand({"true"}).Build());

    EXPECT_EQ(id, "f00dfeed");
    ASSERT_EQ(fx.runner->calls.size(), 1u);
    const auto& argv = fx.runner->calls[0].argv;
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");
    EXPECT_EQ(argv[3], "--cpus=1");
    EXPECT_EQ(argv.back(), "true");
}

TEST(DockerCliTest, RunFailureCarriesStderr) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(125, "", "Unable to find image 'nope:latest' locally\n");

    try {
        cli->Run(core::RunSpecBuilder("nope", "job").Build());
        FAIL() << "expected BackendInvocationError";
    }
    catch (const core::BackendInvocationError& e) {
        EXPECT_EQ(e.code(), 125);
        EXPECT_EQ(e.diagnostic(), "Unable to find image 'nope:latest' locally");
    }
}

TEST(DockerCliTest, RemoveRequiresNameInOutput) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0, "something-else\n");

    try {
        cli->Remove("x");
        FAIL() << "expected BackendInvocationError";
    }
    catch (const core::BackendInvocationError& e) {
        EXPECT_EQ(e.code(), 0);
        EXPECT_EQ(e.diagnostic(), "something-else");
    }
}

TEST(DockerCliTest, RemoveSucceedsWhenEchoed) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0, "web\n");

    EXPECT_NO_THROW(cli->Remove("web", true));
    EXPECT_EQ(fx.runner->calls[0].argv,
              (std::vector<std::string>{"docker", "rm", "--force", "web"}));
}

TEST(DockerCliTest, ExecuteWrapsTimeout) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0, "hi\n", "");

    auto result = cli->Execute("job", {"echo", "hi"}, {}, std::chrono::seconds(5));

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hi\n");
    EXPECT_EQ(fx.runner->calls[0].argv,
              (std::vector<std::string>{"timeout", "5", "docker", "exec", "job", "echo", "hi"}));
}

TEST(DockerCliTest, ExecuteExitCode124IsTimeout) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(124);

    EXPECT_THROW(cli->Execute("job", {"sleep", "100"}, {}, std::chrono::seconds(1)),
                 core::TimeoutError);
}

TEST(DockerCliTest, ExecuteFailureIsBackendError) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(1, "", "Error: No such container: job\n");

    EXPECT_THROW(cli->Execute("job", {"true"}), core::BackendInvocationError);
}

TEST(DockerCliTest, StatsForOneContainer) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0,
        R"({"ID":"abc","Name":"web","CPUPerc":"45.00%","MemPerc":"bad",)"
        R"("BlockIO":"0B / 0B","MemUsage":"1MiB / 1GiB","NetIO":"1kB / 2kB"})" "\n");

    auto stats = cli->GetStats(std::string("web"));

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_DOUBLE_EQ(stats[0].cpu_usage, 0.45);
    EXPECT_FALSE(stats[0].memory_usage_valid);
    EXPECT_DOUBLE_EQ(stats[0].network_io.out, 2000.0);
    EXPECT_EQ(fx.runner->calls[0].argv.back(), "web");
}

TEST(DockerCliTest, StatsWithUnmatchedFiltersIsEmpty) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0, "");

    auto stats = cli->GetStats(std::nullopt, {{"label", "tier=none"}});

    EXPECT_TRUE(stats.empty());
    ASSERT_EQ(fx.runner->calls.size(), 1u);
    EXPECT_EQ(fx.runner->calls[0].argv[1], "ps");
}

TEST(DockerCliTest, StatsListsMatchingContainersFirst) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0, R"({"ID":"abc","Names":"web","Status":"Up","Labels":"tier=web"})" "\n");
    fx.runner->Push(0, R"({"ID":"abc","Name":"web","CPUPerc":"1%","MemPerc":"2%"})" "\n");

    auto stats = cli->GetStats(std::nullopt, {{"label", "tier=web"}});

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_EQ(stats[0].container_id, "abc");
    ASSERT_EQ(fx.runner->calls.size(), 2u);
    EXPECT_EQ(fx.runner->calls[1].argv.back(), "abc");
}

TEST(DockerCliTest, ListParsesContainers) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0,
        R"({"ID":"1","Names":"a","Status":"Up","Labels":"utopia-created=1"})" "\n"
        R"json({"ID":"2","Names":"b","Status":"Exited (0)","Labels":""})json" "\n");

    auto containers = cli->List();

    ASSERT_EQ(containers.size(), 2u);
    EXPECT_EQ(containers[0].labels.at("utopia-created"), "1");
    EXPECT_EQ(containers[1].status, "Exited (0)");
}

TEST(DockerCliTest, NetworkOperations) {
    CliFixture fx;
    auto cli = fx.Make();
    fx.runner->Push(0);
    fx.runner->Push(0, "n1 jobs bridge local\n");
    fx.runner->Push(1, "", "network jobs not found");

    cli->CreateNetwork("jobs", true);
    auto networks = cli->ListNetworks();
    EXPECT_THROW(cli->RemoveNetwork("jobs"), core::BackendInvocationError);

    EXPECT_EQ(fx.runner->calls[0].argv,
              (std::vector<std::string>{"docker", "network", "create", "jobs", "--internal"}));
    ASSERT_EQ(networks.size(), 1u);
    EXPECT_EQ(networks[0].name, "jobs");
}

TEST(DockerCliTest, LoginPassesPasswordOnStdin) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->Push(0, "Login Succeeded\n");

    core::Credentials credentials{"bot", "s3cret", ""};
    DockerCli cli(core::AdapterConfig{}, "docker", credentials, runner);

    ASSERT_EQ(runner->calls.size(), 1u);
    EXPECT_EQ(runner->calls[0].argv,
              (std::vector<std::string>{"docker", "login", "--username", "bot", "--password-stdin"}));
    EXPECT_EQ(runner->calls[0].stdin_data, "s3cret");
}

TEST(DockerCliTest, FailedLoginDoesNotThrow) {
    auto runner = std::make_shared<FakeCommandRunner>();
    runner->Push(1, "", "unauthorized");

    core::Credentials credentials{"bot", "wrong", ""};
    EXPECT_NO_THROW(DockerCli(core::AdapterConfig{}, "docker", credentials, runner));
}

TEST(ProcessRunnerTest, ShellCapturesBothStreams) {
    utils::ShellCommandRunner runner;
    auto result = runner.Run({"echo", "out;", "echo", "err", "1>&2;", "exit", "3"});

    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessRunnerTest, ShellFeedsStdin) {
    utils::ShellCommandRunner runner;
    auto result = runner.Run({"cat"}, "piped input");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "piped input");
}

TEST(ProcessRunnerTest, ShellPreservesSingleQuotes) {
    utils::ShellCommandRunner runner;
    auto env = builders::CliArgumentBuilder::BuildEnvironment({{"MSG", "it's here"}});
    ASSERT_EQ(env.size(), 2u);

    std::vector<std::string> argv = {"printf", "'%s\\n'", env[1],
                                     utils::StringUtils::QuoteIfWhitespace("echo don't stop"),
                                     utils::StringUtils::QuoteIfWhitespace("don't")};
    auto result = runner.Run(argv);

    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "MSG=it's here\necho don't stop\ndon't\n");
}

TEST(ProcessRunnerTest, ConcurrentChildrenDoNotHoldOtherPipes) {
    utils::ShellCommandRunner runner;
    auto start = std::chrono::steady_clock::now();

    auto quick = std::async(std::launch::async, [&runner]() {
        return runner.Run({"sleep", "0.5;", "echo", "done"});
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto slow = std::async(std::launch::async, [&runner]() {
        return runner.Run({"sleep", "3"});
    });

    auto result = quick.get();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.stdout_output, "done\n");
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(slow.get().exit_code, 0);
}
