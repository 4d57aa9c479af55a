#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "container/container_client.hpp"
#include "container/process_runner.hpp"

namespace socrates::container {

// Drives the docker (or a compatible) command-line binary.
class DockerCliClient : public ContainerClient {
public:
    DockerCliClient(std::string cli_path, std::chrono::milliseconds command_timeout);

    bool HasImage(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    AttachedRun RunAttached(const std::string& id) override;
    void KillContainer(const std::string& id) override;
    ContainerState InspectContainer(const std::string& id) override;
    void RemoveContainer(const std::string& id, bool force) override;

private:
    ProcessResult Invoke(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const;
    ProcessResult Expect(const std::string& what, const std::vector<std::string>& args) const;

    std::string cli_path_;
    std::chrono::milliseconds command_timeout_;
};

std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec);

}  // namespace socrates::container
