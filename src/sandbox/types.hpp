#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace socrates::sandbox {

enum class ErrorKind {
    kSyntax,
    kType,
    kUndefined,
    kLinker,
    kOther
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kSyntax: return "syntax";
        case ErrorKind::kType: return "type";
        case ErrorKind::kUndefined: return "undefined";
        case ErrorKind::kLinker: return "linker";
        case ErrorKind::kOther: return "other";
    }
    return "other";
}

struct ParsedError {
    std::string file;
    int line = 0;
    std::optional<int> column;
    ErrorKind type = ErrorKind::kOther;
    std::string severity = "error";
    std::string message;
    std::string raw_error;
    std::optional<std::string> code_snippet;
};

struct PreparedCode {
    std::string main_file_path;
    std::map<std::string, std::string> files_for_errors;
    bool used_harness = false;
};

struct ExecutionResult {
    std::string output;
    std::string errors;
    std::string warnings;
    std::vector<ParsedError> parsed_errors;
    int exit_code = 0;
    std::int64_t execution_time_ms = 0;
    bool timed_out = false;
};

enum class TestResultCategory {
    kSyntaxError,
    kRuntimeError,
    kWrongAnswer,
    kNoIssues
};

inline const char* ToString(TestResultCategory category) {
    switch (category) {
        case TestResultCategory::kSyntaxError: return "SYNTAX_ERROR";
        case TestResultCategory::kRuntimeError: return "RUNTIME_ERROR";
        case TestResultCategory::kWrongAnswer: return "WRONG_ANSWER";
        case TestResultCategory::kNoIssues: return "NO_ISSUES";
    }
    return "NO_ISSUES";
}

struct TestFailure {
    int test_index = 0;
    std::string input;
    std::string expected;
    std::string actual;
    std::optional<std::string> error;
};

struct TestSummary {
    int passed = 0;
    int total = 0;
    std::vector<TestFailure> failures;
};

struct TestExecutionResult {
    TestResultCategory category = TestResultCategory::kNoIssues;
    std::optional<std::string> compilation_errors;
    std::optional<std::string> runtime_errors;
    std::optional<TestSummary> test_results;
    std::optional<std::string> output;
    std::optional<int> exit_code;
};

}  // namespace socrates::sandbox
