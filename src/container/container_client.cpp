#include "container/container_client.hpp"

#include "container/docker_cli_client.hpp"
#include "container/docker_engine_client.hpp"

namespace socrates::container {

std::unique_ptr<ContainerClient> CreateContainerClient(const config::Config& config) {
    const auto request_timeout = config.execution.compile_timeout + config.execution.run_timeout +
        std::chrono::seconds(30);
    if (config.docker.client == config::ContainerClientKind::kCli) {
        return std::make_unique<DockerCliClient>(config.docker.cli_path, request_timeout);
    }
    return std::make_unique<DockerEngineClient>(
        config.docker.socket_path,
        config.docker.api_version,
        std::chrono::duration_cast<std::chrono::seconds>(request_timeout));
}

}  // namespace socrates::container
