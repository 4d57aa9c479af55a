#include "sandbox/result_json.hpp"

namespace socrates::sandbox {

nlohmann::json ToJson(const ParsedError& error) {
    nlohmann::json json = {
        {"file", error.file},
        {"line", error.line},
        {"type", ToString(error.type)},
        {"severity", error.severity},
        {"message", error.message},
        {"rawError", error.raw_error}
    };
    if (error.column) {
        json["column"] = *error.column;
    }
    if (error.code_snippet) {
        json["codeSnippet"] = *error.code_snippet;
    }
    return json;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json parsed = nlohmann::json::array();
    for (const auto& error : result.parsed_errors) {
        parsed.push_back(ToJson(error));
    }
    nlohmann::json json = {
        {"output", result.output},
        {"errors", result.errors},
        {"parsedErrors", parsed},
        {"exitCode", result.exit_code},
        {"executionTime", result.execution_time_ms},
        {"timedOut", result.timed_out}
    };
    if (!result.warnings.empty()) {
        json["warnings"] = result.warnings;
    }
    return json;
}

nlohmann::json ToJson(const TestExecutionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["category"] = ToString(result.category);
    if (result.compilation_errors) {
        json["compilationErrors"] = *result.compilation_errors;
    }
    if (result.runtime_errors) {
        json["runtimeErrors"] = *result.runtime_errors;
    }
    if (result.test_results) {
        nlohmann::json failures = nlohmann::json::array();
        for (const auto& failure : result.test_results->failures) {
            nlohmann::json entry = {
                {"testIndex", failure.test_index},
                {"input", failure.input},
                {"expected", failure.expected},
                {"actual", failure.actual}
            };
            if (failure.error) {
                entry["error"] = *failure.error;
            }
            failures.push_back(entry);
        }
        json["testResults"] = {
            {"passed", result.test_results->passed},
            {"total", result.test_results->total},
            {"failures", failures}
        };
    }
    if (result.output) {
        json["output"] = *result.output;
    }
    if (result.exit_code) {
        json["exitCode"] = *result.exit_code;
    }
    return json;
}

}  // namespace socrates::sandbox
