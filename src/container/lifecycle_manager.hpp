#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"
#include "container/container_client.hpp"
#include "sandbox/types.hpp"

namespace socrates::container {

inline constexpr int kTimeoutExitCode = 124;
inline constexpr const char* kTimeoutMessage = "Execution timed out. Your program took too long to run.";

ContainerSpec BuildContainerSpec(const config::ExecutionSpec& spec, const std::filesystem::path& workspace_path);

// Runs one compile+execute cycle per call in a fresh container. The client
// is owned by the caller and must outlive the manager.
class ContainerLifecycleManager {
public:
    ContainerLifecycleManager(ContainerClient& client, config::ExecutionSpec spec);

    // Throws DockerUnavailable when the runtime or the image cannot be
    // reached. Everything the submitted code does, including running past
    // the deadline, comes back as a result.
    sandbox::ExecutionResult Run(const std::filesystem::path& workspace_path);

    // Pulls the image on first use; later calls return immediately.
    void EnsureImage();

    std::chrono::milliseconds ExternalTimeout() const {
        return spec_.compile_timeout + spec_.run_timeout;
    }

private:
    friend class ContainerGuard;

    void Teardown(const std::string& id) noexcept;

    ContainerClient& client_;
    const config::ExecutionSpec spec_;
    std::mutex image_mutex_;
    bool image_ready_ = false;
};

}  // namespace socrates::container
