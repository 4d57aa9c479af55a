#include "container/lifecycle_manager.hpp"

#include <cmath>
#include <future>
#include <iostream>

#include "container/run_script.hpp"
#include "output/output_demuxer.hpp"
#include "sandbox/errors.hpp"

namespace socrates::container {

// Removes the container when the run leaves scope, whichever way it leaves.
class ContainerGuard {
public:
    ContainerGuard(ContainerLifecycleManager& manager, std::string id)
        : manager_(manager)
        , id_(std::move(id)) {}
    ~ContainerGuard() { manager_.Teardown(id_); }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    ContainerLifecycleManager& manager_;
    std::string id_;
};

namespace {

std::string ShortId(const std::string& id) {
    return id.substr(0, 12);
}

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
}

}  // namespace

ContainerSpec BuildContainerSpec(const config::ExecutionSpec& spec, const std::filesystem::path& workspace_path) {
    std::error_code ec;
    auto host_path = std::filesystem::absolute(workspace_path, ec);
    if (ec) {
        host_path = workspace_path;
    }

    ContainerSpec container{};
    container.image = spec.image;
    container.command = {"sh", "-c", RunScript::Render(RunScript::SlotsFor(spec))};
    container.working_dir = kWorkspaceMount;
    container.bind_source = host_path.string();
    container.bind_target = kWorkspaceMount;
    container.bind_read_only = true;
    container.scratch_path = kScratchPath;
    container.scratch_options = "rw,exec,nosuid,size=64m";
    container.cpu_period = 100000;
    container.cpu_quota = static_cast<std::int64_t>(std::llround(spec.cpus * 100000.0));
    container.memory_bytes = spec.memory_bytes;
    container.memory_swap_bytes = spec.memory_bytes;
    container.pids_limit = spec.pids_limit;
    container.network_disabled = true;
    container.auto_remove = true;
    return container;
}

ContainerLifecycleManager::ContainerLifecycleManager(ContainerClient& client, config::ExecutionSpec spec)
    : client_(client)
    , spec_(std::move(spec)) {}

void ContainerLifecycleManager::EnsureImage() {
    std::lock_guard<std::mutex> lock(image_mutex_);
    if (image_ready_) {
        return;
    }
    try {
        if (!client_.HasImage(spec_.image)) {
            client_.PullImage(spec_.image);
        }
    } catch (const ContainerClientError& ex) {
        throw sandbox::DockerUnavailable("Docker image " + spec_.image + " is unavailable: " + ex.what());
    }
    image_ready_ = true;
}

sandbox::ExecutionResult ContainerLifecycleManager::Run(const std::filesystem::path& workspace_path) {
    const auto started = std::chrono::steady_clock::now();
    EnsureImage();

    std::string id;
    try {
        id = client_.CreateContainer(BuildContainerSpec(spec_, workspace_path));
    } catch (const ContainerClientError& ex) {
        throw sandbox::DockerUnavailable(std::string("Failed to create container: ") + ex.what());
    }
    ContainerGuard guard(*this, id);

    std::cerr << "[container] running id=" << ShortId(id) << " image=" << spec_.image << std::endl;
    auto run = std::async(std::launch::async, [this, id] { return client_.RunAttached(id); });

    bool timed_out = false;
    if (run.wait_for(ExternalTimeout()) == std::future_status::timeout) {
        timed_out = true;
        std::cerr << "[container] timeout id=" << ShortId(id)
                  << " limit_ms=" << ExternalTimeout().count() << ", killing" << std::endl;
        try {
            client_.KillContainer(id);
        } catch (const ContainerClientError& ex) {
            std::cerr << "[container] kill skipped id=" << ShortId(id) << " reason=" << ex.what() << std::endl;
        }
    }

    AttachedRun attached;
    try {
        attached = run.get();
    } catch (const ContainerClientError& ex) {
        if (!timed_out && !ex.NotFound()) {
            throw sandbox::DockerUnavailable(std::string("Failed to run container: ") + ex.what());
        }
        std::cerr << "[container] output unavailable id=" << ShortId(id) << " reason=" << ex.what() << std::endl;
    }

    auto result = output::Demultiplex(attached.output, attached.exit_status.value_or(-1));
    result.execution_time_ms = ElapsedMs(started);

    if (timed_out || result.timed_out) {
        result.timed_out = true;
        result.exit_code = kTimeoutExitCode;
        result.errors = kTimeoutMessage;
        result.parsed_errors.clear();
    }

    std::cerr << "[container] finished id=" << ShortId(id)
              << " exit=" << result.exit_code
              << " time_ms=" << result.execution_time_ms
              << (result.timed_out ? " timed_out=true" : "") << std::endl;
    return result;
}

void ContainerLifecycleManager::Teardown(const std::string& id) noexcept {
    try {
        const auto state = client_.InspectContainer(id);
        if (state.status == "removing") {
            return;
        }
        client_.RemoveContainer(id, true);
    } catch (const ContainerClientError& ex) {
        if (ex.NotFound() || ex.Conflict()) {
            return;
        }
        std::cerr << "[container] failed to remove id=" << ShortId(id) << " error=" << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[container] failed to remove id=" << ShortId(id) << " error=" << ex.what() << std::endl;
    }
}

}  // namespace socrates::container
