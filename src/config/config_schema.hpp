#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace socrates::config {

// Process-wide limits applied to every execution. Immutable once loaded.
struct ExecutionSpec {
    std::string image = "gcc:latest";
    double cpus = 1.0;
    std::int64_t memory_bytes = 128LL * 1024 * 1024;
    std::chrono::milliseconds compile_timeout{5000};
    std::chrono::milliseconds run_timeout{10000};
    std::size_t max_code_size = 10 * 1024;
    int pids_limit = 64;
    std::string compile_command = "g++ -std=c++17 -Wall -Wextra";
};

enum class ContainerClientKind {
    kEngine,
    kCli
};

struct DockerConfig {
    ContainerClientKind client = ContainerClientKind::kEngine;
    std::string socket_path = "/var/run/docker.sock";
    std::string api_version = "v1.41";
    std::string cli_path = "docker";
};

struct WorkspaceConfig {
    // Empty means <temp>/socrates.
    std::string root;
};

struct Config {
    ExecutionSpec execution;
    DockerConfig docker;
    WorkspaceConfig workspace;
};

}  // namespace socrates::config
