#include "container/lifecycle_manager.hpp"

#include <gtest/gtest.h>

#include "fake_container_client.hpp"
#include "sandbox/errors.hpp"

namespace {

using socrates::container::ContainerClientError;
using socrates::container::ContainerLifecycleManager;
using socrates::testing::FakeContainerClient;

socrates::config::ExecutionSpec FastSpec() {
    socrates::config::ExecutionSpec spec;
    spec.compile_timeout = std::chrono::milliseconds(100);
    spec.run_timeout = std::chrono::milliseconds(100);
    return spec;
}

TEST(LifecycleManagerTest, SuccessfulRunIsDemultiplexedAndTornDown) {
    FakeContainerClient client;
    client.logs = "Hello, World!\nEXIT_CODE:0\n";
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "Hello, World!");
    EXPECT_EQ(result.errors, "");
    EXPECT_FALSE(result.timed_out);
    EXPECT_GE(result.execution_time_ms, 0);
    EXPECT_EQ(client.run_calls, 1);
    EXPECT_EQ(client.create_calls, 1);
    EXPECT_EQ(client.remove_calls, 1);
    EXPECT_TRUE(client.last_remove_forced);
    EXPECT_EQ(client.kill_calls, 0);
}

TEST(LifecycleManagerTest, ImageIsPulledOnceAndMemoized) {
    FakeContainerClient client;
    client.image_present = false;
    client.logs = "EXIT_CODE:0\n";
    ContainerLifecycleManager manager(client, FastSpec());

    manager.Run("/tmp/socrates-ws");
    manager.Run("/tmp/socrates-ws");

    EXPECT_EQ(client.pull_calls, 1);
    EXPECT_EQ(client.has_image_calls, 1);
    EXPECT_EQ(client.create_calls, 2);
}

TEST(LifecycleManagerTest, PullFailureIsDockerUnavailable) {
    FakeContainerClient client;
    client.image_present = false;
    client.pull_error = ContainerClientError(404, "manifest unknown");
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_THROW(manager.Run("/tmp/socrates-ws"), socrates::sandbox::DockerUnavailable);
    EXPECT_EQ(client.create_calls, 0);
}

TEST(LifecycleManagerTest, CreateFailureIsDockerUnavailable) {
    FakeContainerClient client;
    client.create_error = ContainerClientError(0, "connection refused");
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_THROW(manager.Run("/tmp/socrates-ws"), socrates::sandbox::DockerUnavailable);
    EXPECT_EQ(client.remove_calls, 0);
}

TEST(LifecycleManagerTest, StartFailureStillTearsDown) {
    FakeContainerClient client;
    client.run_error = ContainerClientError(500, "start container failed: cannot start");
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_THROW(manager.Run("/tmp/socrates-ws"), socrates::sandbox::DockerUnavailable);
    EXPECT_EQ(client.remove_calls, 1);
}

TEST(LifecycleManagerTest, ExternalTimeoutKillsAndReportsSyntheticResult) {
    FakeContainerClient client;
    client.run_delay = std::chrono::seconds(5);
    client.logs = "partial output\n";
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.errors, "Execution timed out. Your program took too long to run.");
    EXPECT_EQ(result.output, "partial output");
    EXPECT_TRUE(result.parsed_errors.empty());
    EXPECT_EQ(client.kill_calls, 1);
    EXPECT_EQ(client.remove_calls, 1);
}

TEST(LifecycleManagerTest, KillFailureOnTimeoutIsSwallowed) {
    FakeContainerClient client;
    client.run_delay = std::chrono::milliseconds(400);
    client.kill_error = ContainerClientError(409, "is not running");
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
}

TEST(LifecycleManagerTest, ScriptTimeoutMarkerIsReportedAsTimeout) {
    FakeContainerClient client;
    client.logs = "still working\n\nTIMED_OUT\nEXIT_CODE:124\n";
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.errors, socrates::container::kTimeoutMessage);
}

TEST(LifecycleManagerTest, ProgramExiting124IsNotATimeout) {
    FakeContainerClient client;
    client.logs = "done\nEXIT_CODE:124\n";
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 124);
    EXPECT_EQ(result.output, "done");
    EXPECT_NE(result.errors, socrates::container::kTimeoutMessage);
}

TEST(LifecycleManagerTest, MissingSentinelFallsBackToContainerStatus) {
    FakeContainerClient client;
    client.logs = "Segmentation fault\n";
    client.exit_status = 139;
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_EQ(manager.Run("/tmp/socrates-ws").exit_code, 139);
}

TEST(LifecycleManagerTest, AutoRemovedContainerIsNotAnError) {
    FakeContainerClient client;
    client.logs = "ok\nEXIT_CODE:0\n";
    client.exit_status = std::nullopt;
    client.inspect_error = ContainerClientError(404, "No such container");
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "ok");
    EXPECT_EQ(client.remove_calls, 0);
}

TEST(LifecycleManagerTest, TeardownSkipsContainersAlreadyBeingRemoved) {
    FakeContainerClient client;
    client.logs = "EXIT_CODE:0\n";
    client.inspect_status = "removing";
    ContainerLifecycleManager manager(client, FastSpec());

    manager.Run("/tmp/socrates-ws");

    EXPECT_EQ(client.remove_calls, 0);
}

TEST(LifecycleManagerTest, TeardownFailuresNeverPropagate) {
    FakeContainerClient client;
    client.logs = "EXIT_CODE:0\n";
    client.remove_error = ContainerClientError(500, "driver failed");
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_NO_THROW(manager.Run("/tmp/socrates-ws"));
    EXPECT_EQ(client.remove_calls, 1);
}

TEST(LifecycleManagerTest, DaemonLossDuringRunIsDockerUnavailable) {
    FakeContainerClient client;
    client.run_error = ContainerClientError(0, "connection reset");
    ContainerLifecycleManager manager(client, FastSpec());

    EXPECT_THROW(manager.Run("/tmp/socrates-ws"), socrates::sandbox::DockerUnavailable);
    EXPECT_EQ(client.remove_calls, 1);
}

TEST(LifecycleManagerTest, CompileFailureComesBackAsResult) {
    FakeContainerClient client;
    client.logs =
        "main.cpp: In function 'int main()':\n"
        "main.cpp:1:20: error: expected ';' before '}' token\n"
        "EXIT_CODE:1\n";
    ContainerLifecycleManager manager(client, FastSpec());

    const auto result = manager.Run("/tmp/socrates-ws");

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.timed_out);
    EXPECT_NE(result.errors.find("expected ';'"), std::string::npos);
    ASSERT_EQ(result.parsed_errors.size(), 1u);
    EXPECT_EQ(result.parsed_errors[0].type, socrates::sandbox::ErrorKind::kSyntax);
}

}  // namespace
