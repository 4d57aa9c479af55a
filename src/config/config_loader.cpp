#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "utils/common.hpp"

namespace socrates::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::int64_t ParseInt64(const std::string& value, std::int64_t fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

bool ParseClientKind(const std::string& value, ContainerClientKind& kind) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "engine" || lowered == "api") {
        kind = ContainerClientKind::kEngine;
        return true;
    }
    if (lowered == "cli") {
        kind = ContainerClientKind::kCli;
        return true;
    }
    return false;
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".socrates" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ApplyString(execution, "image", config.execution.image);
        ApplyString(execution, "compileCommand", config.execution.compile_command);
        if (execution.contains("cpus") && execution["cpus"].is_number()) {
            config.execution.cpus = execution["cpus"].get<double>();
        }
        if (execution.contains("memoryMb") && execution["memoryMb"].is_number_integer()) {
            config.execution.memory_bytes = execution["memoryMb"].get<std::int64_t>() * 1024 * 1024;
        }
        if (execution.contains("compileTimeoutS") && execution["compileTimeoutS"].is_number()) {
            config.execution.compile_timeout = std::chrono::milliseconds(
                static_cast<std::int64_t>(execution["compileTimeoutS"].get<double>() * 1000));
        }
        if (execution.contains("runTimeoutS") && execution["runTimeoutS"].is_number()) {
            config.execution.run_timeout = std::chrono::milliseconds(
                static_cast<std::int64_t>(execution["runTimeoutS"].get<double>() * 1000));
        }
        if (execution.contains("maxCodeSize") && execution["maxCodeSize"].is_number_unsigned()) {
            config.execution.max_code_size = execution["maxCodeSize"].get<std::size_t>();
        }
        if (execution.contains("pidsLimit") && execution["pidsLimit"].is_number_integer()) {
            config.execution.pids_limit = execution["pidsLimit"].get<int>();
        }
    }

    if (data.contains("docker") && data["docker"].is_object()) {
        const auto& docker = data["docker"];
        if (docker.contains("client") && docker["client"].is_string()) {
            if (!ParseClientKind(docker["client"].get<std::string>(), config.docker.client)) {
                std::cerr << "[config] unknown docker.client=" << docker["client"].get<std::string>()
                          << ", keeping default" << std::endl;
            }
        }
        ApplyString(docker, "socketPath", config.docker.socket_path);
        ApplyString(docker, "apiVersion", config.docker.api_version);
        ApplyString(docker, "cliPath", config.docker.cli_path);
    }

    if (data.contains("workspace") && data["workspace"].is_object()) {
        ApplyString(data["workspace"], "root", config.workspace.root);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto image = GetEnvFallback(
        "SOCRATES_EXECUTION__IMAGE",
        "SOCRATES_EXECUTION_IMAGE");
    if (!image.empty()) {
        config.execution.image = image;
    }

    const auto compile_command = GetEnvFallback(
        "SOCRATES_EXECUTION__COMPILE_COMMAND",
        "SOCRATES_EXECUTION_COMPILE_COMMAND");
    if (!compile_command.empty()) {
        config.execution.compile_command = compile_command;
    }

    const auto cpus = GetEnvFallback(
        "SOCRATES_EXECUTION__CPUS",
        "SOCRATES_EXECUTION_CPUS");
    if (!cpus.empty()) {
        config.execution.cpus = ParseDouble(cpus, config.execution.cpus);
    }

    const auto memory_mb = GetEnvFallback(
        "SOCRATES_EXECUTION__MEMORY_MB",
        "SOCRATES_EXECUTION_MEMORY_MB");
    if (!memory_mb.empty()) {
        config.execution.memory_bytes =
            ParseInt64(memory_mb, config.execution.memory_bytes / (1024 * 1024)) * 1024 * 1024;
    }

    const auto compile_timeout = GetEnvFallback(
        "SOCRATES_EXECUTION__COMPILE_TIMEOUT_S",
        "SOCRATES_EXECUTION_COMPILE_TIMEOUT_S");
    if (!compile_timeout.empty()) {
        const auto seconds = ParseDouble(compile_timeout, config.execution.compile_timeout.count() / 1000.0);
        config.execution.compile_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000));
    }

    const auto run_timeout = GetEnvFallback(
        "SOCRATES_EXECUTION__RUN_TIMEOUT_S",
        "SOCRATES_EXECUTION_RUN_TIMEOUT_S");
    if (!run_timeout.empty()) {
        const auto seconds = ParseDouble(run_timeout, config.execution.run_timeout.count() / 1000.0);
        config.execution.run_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000));
    }

    const auto max_code_size = GetEnvFallback(
        "SOCRATES_EXECUTION__MAX_CODE_SIZE",
        "SOCRATES_EXECUTION_MAX_CODE_SIZE");
    if (!max_code_size.empty()) {
        const auto value = ParseInt64(max_code_size, static_cast<std::int64_t>(config.execution.max_code_size));
        if (value >= 0) {
            config.execution.max_code_size = static_cast<std::size_t>(value);
        }
    }

    const auto pids_limit = GetEnvFallback(
        "SOCRATES_EXECUTION__PIDS_LIMIT",
        "SOCRATES_EXECUTION_PIDS_LIMIT");
    if (!pids_limit.empty()) {
        config.execution.pids_limit = static_cast<int>(ParseInt64(pids_limit, config.execution.pids_limit));
    }

    const auto client = GetEnvFallback(
        "SOCRATES_DOCKER__CLIENT",
        "SOCRATES_DOCKER_CLIENT");
    if (!client.empty() && !ParseClientKind(client, config.docker.client)) {
        std::cerr << "[config] unknown SOCRATES_DOCKER__CLIENT=" << client << ", keeping default" << std::endl;
    }

    const auto socket_path = GetEnvFallback(
        "SOCRATES_DOCKER__SOCKET_PATH",
        "SOCRATES_DOCKER_SOCKET_PATH");
    if (!socket_path.empty()) {
        config.docker.socket_path = socket_path;
    }

    const auto api_version = GetEnvFallback(
        "SOCRATES_DOCKER__API_VERSION",
        "SOCRATES_DOCKER_API_VERSION");
    if (!api_version.empty()) {
        config.docker.api_version = api_version;
    }

    const auto cli_path = GetEnvFallback(
        "SOCRATES_DOCKER__CLI_PATH",
        "SOCRATES_DOCKER_CLI_PATH");
    if (!cli_path.empty()) {
        config.docker.cli_path = cli_path;
    }

    const auto workspace_root = GetEnvFallback(
        "SOCRATES_WORKSPACE__ROOT",
        "SOCRATES_WORKSPACE_ROOT");
    if (!workspace_root.empty()) {
        config.workspace.root = workspace_root;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            std::cerr << "[config] failed to parse " << path.string() << ", using defaults" << std::endl;
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace socrates::config
