#include "container/docker_cli_client.hpp"

#include <iostream>
#include <sstream>

#include "utils/common.hpp"

namespace socrates::container {
namespace {

// The CLI has no status codes; map its well-known messages onto the
// Engine API ones so callers can treat both clients alike.
int StatusFromStderr(const std::string& error) {
    const auto lowered = utils::ToLower(error);
    if (utils::Contains(lowered, "no such container") || utils::Contains(lowered, "no such image") ||
        utils::Contains(lowered, "no such object")) {
        return 404;
    }
    if (utils::Contains(lowered, "already in progress") || utils::Contains(lowered, "is not running") ||
        utils::Contains(lowered, "conflict")) {
        return 409;
    }
    if (utils::Contains(lowered, "cannot connect to the docker daemon") ||
        utils::Contains(lowered, "is the docker daemon running")) {
        return 0;
    }
    return 500;
}

// Errors the CLI itself prints, as opposed to output from the container.
bool IsRuntimeFailure(const std::string& error) {
    const auto lowered = utils::ToLower(utils::Trim(error));
    return utils::StartsWith(lowered, "error response from daemon") ||
           utils::StartsWith(lowered, "error: ") ||
           utils::Contains(lowered, "cannot connect to the docker daemon");
}

}  // namespace

std::vector<std::string> BuildCreateArgs(const ContainerSpec& spec) {
    std::vector<std::string> args = {
        "create",
        "--cpu-period", std::to_string(spec.cpu_period),
        "--cpu-quota", std::to_string(spec.cpu_quota),
        "--memory", std::to_string(spec.memory_bytes) + "b",
        "--memory-swap", std::to_string(spec.memory_swap_bytes) + "b",
        "--volume", spec.bind_source + ":" + spec.bind_target + (spec.bind_read_only ? ":ro" : ""),
        "--workdir", spec.working_dir
    };
    if (spec.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    if (spec.pids_limit > 0) {
        args.insert(args.end(), {"--pids-limit", std::to_string(spec.pids_limit)});
    }
    if (!spec.scratch_path.empty()) {
        args.insert(args.end(), {"--tmpfs", spec.scratch_path + ":" + spec.scratch_options});
    }
    if (spec.auto_remove) {
        args.push_back("--rm");
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

DockerCliClient::DockerCliClient(std::string cli_path, std::chrono::milliseconds command_timeout)
    : cli_path_(std::move(cli_path))
    , command_timeout_(command_timeout) {}

ProcessResult DockerCliClient::Invoke(const std::vector<std::string>& args,
                                      std::chrono::milliseconds timeout) const {
    auto result = ProcessRunner::Run(cli_path_, args, timeout);
    if (result.launch_failed) {
        throw ContainerClientError(0, cli_path_ + " " + (args.empty() ? "" : args.front()) + " failed: " + result.error);
    }
    if (result.timed_out) {
        throw ContainerClientError(0, cli_path_ + " " + (args.empty() ? "" : args.front()) + " timed out");
    }
    return result;
}

ProcessResult DockerCliClient::Expect(const std::string& what, const std::vector<std::string>& args) const {
    auto result = Invoke(args, command_timeout_);
    if (result.exit_code != 0) {
        const auto message = utils::Trim(result.error.empty() ? result.output : result.error);
        throw ContainerClientError(StatusFromStderr(message), what + " failed: " + message);
    }
    return result;
}

bool DockerCliClient::HasImage(const std::string& image) {
    const auto result = Invoke({"image", "inspect", "--format", "{{.Id}}", image}, command_timeout_);
    if (result.exit_code == 0) {
        return true;
    }
    if (StatusFromStderr(result.error) == 404) {
        return false;
    }
    throw ContainerClientError(StatusFromStderr(result.error),
                               "inspect image " + image + " failed: " + utils::Trim(result.error));
}

void DockerCliClient::PullImage(const std::string& image) {
    std::cerr << "[docker] pulling image=" << image << std::endl;
    const auto result = Invoke({"pull", "--quiet", image}, std::chrono::minutes(10));
    if (result.exit_code != 0) {
        throw ContainerClientError(StatusFromStderr(result.error),
                                   "pull image " + image + " failed: " + utils::Trim(result.error));
    }
    std::cerr << "[docker] pulled image=" << image << std::endl;
}

std::string DockerCliClient::CreateContainer(const ContainerSpec& spec) {
    const auto result = Expect("create container", BuildCreateArgs(spec));
    const auto id = utils::Trim(result.output);
    if (id.empty()) {
        throw ContainerClientError(500, "create container failed: no container id returned");
    }
    return id;
}

AttachedRun DockerCliClient::RunAttached(const std::string& id) {
    // `start --attach` hooks up the output streams before the container
    // runs and exits with the container's own status.
    const auto result = Invoke({"start", "--attach", id}, command_timeout_);
    if (result.exit_code != 0 && IsRuntimeFailure(result.error)) {
        const auto message = utils::Trim(result.error);
        throw ContainerClientError(StatusFromStderr(message), "start container failed: " + message);
    }
    AttachedRun run;
    // The run script folds stderr into stdout; anything here came from the runtime.
    run.output = result.output + result.error;
    run.exit_status = result.exit_code;
    return run;
}

void DockerCliClient::KillContainer(const std::string& id) {
    Expect("kill container", {"kill", id});
}

ContainerState DockerCliClient::InspectContainer(const std::string& id) {
    const auto result = Expect(
        "inspect container",
        {"inspect", "--format", "{{.State.Status}} {{.State.Running}} {{.State.ExitCode}}", id});
    ContainerState state{};
    std::istringstream stream(utils::Trim(result.output));
    std::string running;
    stream >> state.status >> running >> state.exit_code;
    state.running = running == "true";
    return state;
}

void DockerCliClient::RemoveContainer(const std::string& id, bool force) {
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(id);
    Expect("remove container", args);
}

}  // namespace socrates::container
