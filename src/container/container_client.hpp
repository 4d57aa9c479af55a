#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace socrates::container {

// Runtime-neutral description of one sandbox container.
struct ContainerSpec {
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;
    std::string bind_source;
    std::string bind_target;
    bool bind_read_only = true;
    std::string scratch_path;
    std::string scratch_options;
    std::int64_t cpu_period = 100000;
    std::int64_t cpu_quota = 100000;
    std::int64_t memory_bytes = 0;
    std::int64_t memory_swap_bytes = 0;
    int pids_limit = 0;
    bool network_disabled = true;
    bool auto_remove = true;
};

struct ContainerState {
    std::string status;
    bool running = false;
    int exit_code = 0;
};

struct AttachedRun {
    std::string output;
    // Empty when the runtime had already discarded the container.
    std::optional<int> exit_status;
};

// status mirrors the Docker Engine HTTP status; 0 means the runtime could not
// be reached at all.
class ContainerClientError : public std::runtime_error {
public:
    ContainerClientError(int status, const std::string& message)
        : std::runtime_error(message)
        , status_(status) {}

    int Status() const { return status_; }
    bool NotFound() const { return status_ == 404; }
    bool Conflict() const { return status_ == 409; }

private:
    int status_;
};

class ContainerClient {
public:
    virtual ~ContainerClient() = default;

    virtual bool HasImage(const std::string& image) = 0;
    virtual void PullImage(const std::string& image) = 0;
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    // Attaches to the container's combined output, then starts it, and
    // blocks until the output closes. Attaching first means an auto-removed
    // container cannot take its output with it.
    virtual AttachedRun RunAttached(const std::string& id) = 0;
    virtual void KillContainer(const std::string& id) = 0;
    virtual ContainerState InspectContainer(const std::string& id) = 0;
    virtual void RemoveContainer(const std::string& id, bool force) = 0;
};

std::unique_ptr<ContainerClient> CreateContainerClient(const config::Config& config);

}  // namespace socrates::container
