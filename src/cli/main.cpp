#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include "config/config_loader.hpp"
#include "harness/harness_generator.hpp"
#include "nlohmann/json.hpp"
#include "runner/code_runner.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/result_json.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage: socrates_run run <file|-> [--test N] | socrates_run classify <file|->" << std::endl;
}

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<int> ParseTestIndex(int argc, char** argv) {
    for (int i = 3; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--test") {
            return std::stoi(argv[i + 1]);
        }
    }
    return std::nullopt;
}

int PrintError(const std::string& kind, const std::string& message) {
    nlohmann::json json{{"error", kind}, {"message", message}};
    std::cout << json.dump(2) << std::endl;
    return 2;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command != "run" && command != "classify") {
        PrintUsage();
        return 1;
    }

    const auto source = ReadSource(argv[2]);
    if (!source.has_value()) {
        std::cerr << "[cli] cannot read " << argv[2] << std::endl;
        return 1;
    }

    std::optional<int> test_index;
    try {
        test_index = ParseTestIndex(argc, argv);
    } catch (const std::exception&) {
        std::cerr << "[cli] --test expects an integer" << std::endl;
        return 1;
    }

    const auto config = socrates::config::LoadConfig();
    socrates::runner::CodeRunner runner(config);

    if (command == "classify") {
        std::cout << socrates::sandbox::ToJson(runner.Classify(*source)).dump(2) << std::endl;
        return 0;
    }

    try {
        const auto result = runner.Execute(*source, test_index);
        auto json = socrates::sandbox::ToJson(result);
        if (test_index.has_value()) {
            const auto single = socrates::harness::ParseSingleTestOutput(result.output);
            json["singleTest"] = {
                {"console", single.console},
                {"returnValue", single.return_value ? nlohmann::json(*single.return_value) : nlohmann::json(nullptr)},
                {"exception", single.exception ? nlohmann::json(*single.exception) : nlohmann::json(nullptr)},
                {"complete", single.complete}
            };
        }
        std::cout << json.dump(2) << std::endl;
        return result.exit_code == 0 ? 0 : 3;
    } catch (const socrates::sandbox::CodeTooLarge& ex) {
        return PrintError("CodeTooLarge", ex.what());
    } catch (const socrates::sandbox::InvalidTestIndex& ex) {
        return PrintError("InvalidTestIndex", ex.what());
    } catch (const socrates::sandbox::DockerUnavailable& ex) {
        return PrintError("DockerUnavailable", ex.what());
    } catch (const socrates::sandbox::SandboxError& ex) {
        return PrintError("SandboxError", ex.what());
    }
}
