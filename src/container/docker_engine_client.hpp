#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "container/container_client.hpp"

namespace socrates::container {

// Docker Engine REST API spoken over the daemon's UNIX socket.
class DockerEngineClient : public ContainerClient {
public:
    DockerEngineClient(std::string socket_path,
                       std::string api_version,
                       std::chrono::seconds request_timeout);

    bool HasImage(const std::string& image) override;
    void PullImage(const std::string& image) override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    AttachedRun RunAttached(const std::string& id) override;
    void KillContainer(const std::string& id) override;
    ContainerState InspectContainer(const std::string& id) override;
    void RemoveContainer(const std::string& id, bool force) override;

private:
    std::string Path(const std::string& endpoint) const;
    void StartContainer(const std::string& id);
    std::optional<int> ExitStatus(const std::string& id);

    std::string socket_path_;
    std::string api_version_;
    std::chrono::seconds request_timeout_;
};

std::string BuildCreateBody(const ContainerSpec& spec);

}  // namespace socrates::container
