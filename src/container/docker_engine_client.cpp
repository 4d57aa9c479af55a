#include "container/docker_engine_client.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/socket.h>

#include "httplib.h"
#include "nlohmann/json.hpp"

namespace socrates::container {
namespace {

std::string HttpLibErrorToString(httplib::Error err) {
    return httplib::to_string(err);
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (const unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// "gcc:latest" -> {"gcc", "latest"}; registry ports and digests stay in the name.
std::pair<std::string, std::string> SplitImageReference(const std::string& image) {
    if (image.find('@') != std::string::npos) {
        return {image, ""};
    }
    const auto colon = image.rfind(':');
    const auto slash = image.rfind('/');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

std::string ExtractMessage(const std::string& body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return body;
}

class Connection {
public:
    Connection(const std::string& socket_path, std::chrono::seconds read_timeout)
        : client_(socket_path) {
        client_.set_address_family(AF_UNIX);
        client_.set_connection_timeout(5, 0);
        client_.set_read_timeout(static_cast<time_t>(read_timeout.count()), 0);
        client_.set_write_timeout(30, 0);
    }

    httplib::Client& Get() { return client_; }

private:
    httplib::Client client_;
};

// Throws for transport failures and for any status not in the accepted set.
const httplib::Response& Expect(const httplib::Result& response,
                                const std::string& what,
                                std::initializer_list<int> accepted) {
    if (!response) {
        const auto err = response.error();
        throw ContainerClientError(
            0,
            what + " failed: cannot reach Docker daemon (httplib error=" +
                std::to_string(static_cast<int>(err)) + ", " + HttpLibErrorToString(err) + ")");
    }
    for (const int status : accepted) {
        if (response->status == status) {
            return *response;
        }
    }
    throw ContainerClientError(
        response->status,
        what + " failed: HTTP " + std::to_string(response->status) + " " + ExtractMessage(response->body));
}

}  // namespace

std::string BuildCreateBody(const ContainerSpec& spec) {
    nlohmann::json host_config = {
        {"Binds", nlohmann::json::array({
            spec.bind_source + ":" + spec.bind_target + (spec.bind_read_only ? ":ro" : "")})},
        {"Memory", spec.memory_bytes},
        {"MemorySwap", spec.memory_swap_bytes},
        {"CpuPeriod", spec.cpu_period},
        {"CpuQuota", spec.cpu_quota},
        {"AutoRemove", spec.auto_remove}
    };
    if (spec.network_disabled) {
        host_config["NetworkMode"] = "none";
    }
    if (spec.pids_limit > 0) {
        host_config["PidsLimit"] = spec.pids_limit;
    }
    if (!spec.scratch_path.empty()) {
        host_config["Tmpfs"] = {{spec.scratch_path, spec.scratch_options}};
    }

    nlohmann::json body = {
        {"Image", spec.image},
        {"Cmd", spec.command},
        {"WorkingDir", spec.working_dir},
        {"AttachStdout", true},
        {"AttachStderr", true},
        {"AttachStdin", false},
        {"OpenStdin", false},
        {"Tty", false},
        {"NetworkDisabled", spec.network_disabled},
        {"HostConfig", host_config}
    };
    return body.dump();
}

DockerEngineClient::DockerEngineClient(std::string socket_path,
                                       std::string api_version,
                                       std::chrono::seconds request_timeout)
    : socket_path_(std::move(socket_path))
    , api_version_(std::move(api_version))
    , request_timeout_(request_timeout) {}

std::string DockerEngineClient::Path(const std::string& endpoint) const {
    if (api_version_.empty()) {
        return endpoint;
    }
    return "/" + api_version_ + endpoint;
}

bool DockerEngineClient::HasImage(const std::string& image) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Get(Path("/images/" + image + "/json"));
    const auto& ok = Expect(response, "inspect image " + image, {200, 404});
    return ok.status == 200;
}

void DockerEngineClient::PullImage(const std::string& image) {
    const auto [name, tag] = SplitImageReference(image);
    std::string query = "?fromImage=" + UrlEncode(name);
    if (!tag.empty()) {
        query += "&tag=" + UrlEncode(tag);
    }
    std::cerr << "[docker] pulling image=" << image << std::endl;

    // Pulls can take minutes on a cold host.
    Connection connection(socket_path_, std::chrono::seconds(600));
    const auto response = connection.Get().Post(Path("/images/create" + query), "", "application/json");
    const auto& ok = Expect(response, "pull image " + image, {200});

    // Progress is streamed as JSON lines; a failed pull still answers 200.
    std::istringstream stream(ok.body);
    std::string line;
    while (std::getline(stream, line)) {
        const auto event = nlohmann::json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            continue;
        }
        if (event.contains("error")) {
            const auto message = event["error"].is_string() ? event["error"].get<std::string>() : event["error"].dump();
            throw ContainerClientError(500, "pull image " + image + " failed: " + message);
        }
    }
    std::cerr << "[docker] pulled image=" << image << std::endl;
}

std::string DockerEngineClient::CreateContainer(const ContainerSpec& spec) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Post(Path("/containers/create"), BuildCreateBody(spec), "application/json");
    const auto& ok = Expect(response, "create container", {201});
    const auto parsed = nlohmann::json::parse(ok.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("Id") || !parsed["Id"].is_string()) {
        throw ContainerClientError(500, "create container failed: unexpected response " + ok.body);
    }
    return parsed["Id"].get<std::string>();
}

void DockerEngineClient::StartContainer(const std::string& id) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Post(Path("/containers/" + id + "/start"), "", "application/json");
    Expect(response, "start container", {204, 304});
}

std::optional<int> DockerEngineClient::ExitStatus(const std::string& id) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Post(
        Path("/containers/" + id + "/wait?condition=not-running"), "", "application/json");
    // Auto-remove may already have taken the container.
    if (response && (response->status == 404 || response->status == 409)) {
        return std::nullopt;
    }
    const auto& ok = Expect(response, "wait container", {200});
    const auto parsed = nlohmann::json::parse(ok.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("StatusCode") || !parsed["StatusCode"].is_number_integer()) {
        throw ContainerClientError(500, "wait container failed: unexpected response " + ok.body);
    }
    return parsed["StatusCode"].get<int>();
}

AttachedRun DockerEngineClient::RunAttached(const std::string& id) {
    Connection connection(socket_path_, request_timeout_);

    // Without an Upgrade header the daemon answers 200 and then streams the
    // raw multiplexed output until the container exits.
    httplib::Request request;
    request.method = "POST";
    request.path = Path("/containers/" + id + "/attach?logs=1&stream=1&stdout=1&stderr=1");

    AttachedRun run;
    int attach_status = 0;
    std::optional<ContainerClientError> start_error;
    request.response_handler = [&](const httplib::Response& response) {
        attach_status = response.status;
        if (response.status != 200 && response.status != 101) {
            return false;
        }
        try {
            StartContainer(id);
        } catch (const ContainerClientError& ex) {
            start_error = ex;
            return false;
        }
        return true;
    };
    request.content_receiver = [&run](const char* data, std::size_t length, std::uint64_t, std::uint64_t) {
        run.output.append(data, length);
        return true;
    };

    const auto response = connection.Get().send(request);
    if (start_error) {
        throw *start_error;
    }
    if (attach_status != 0 && attach_status != 200 && attach_status != 101) {
        throw ContainerClientError(attach_status, "attach container failed: HTTP " + std::to_string(attach_status));
    }
    if (!response) {
        const auto err = response.error();
        throw ContainerClientError(
            0,
            "attach container failed: cannot reach Docker daemon (httplib error=" +
                std::to_string(static_cast<int>(err)) + ", " + HttpLibErrorToString(err) + ")");
    }

    run.exit_status = ExitStatus(id);
    return run;
}

void DockerEngineClient::KillContainer(const std::string& id) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Post(Path("/containers/" + id + "/kill"), "", "application/json");
    Expect(response, "kill container", {204});
}

ContainerState DockerEngineClient::InspectContainer(const std::string& id) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Get(Path("/containers/" + id + "/json"));
    const auto& ok = Expect(response, "inspect container", {200});
    const auto parsed = nlohmann::json::parse(ok.body, nullptr, false);
    ContainerState state{};
    if (parsed.is_discarded() || !parsed.contains("State") || !parsed["State"].is_object()) {
        return state;
    }
    const auto& json_state = parsed["State"];
    if (json_state.contains("Status") && json_state["Status"].is_string()) {
        state.status = json_state["Status"].get<std::string>();
    }
    if (json_state.contains("Running") && json_state["Running"].is_boolean()) {
        state.running = json_state["Running"].get<bool>();
    }
    if (json_state.contains("ExitCode") && json_state["ExitCode"].is_number_integer()) {
        state.exit_code = json_state["ExitCode"].get<int>();
    }
    return state;
}

void DockerEngineClient::RemoveContainer(const std::string& id, bool force) {
    Connection connection(socket_path_, request_timeout_);
    const auto response = connection.Get().Delete(Path("/containers/" + id + (force ? "?force=1" : "")));
    Expect(response, "remove container", {204});
}

}  // namespace socrates::container
