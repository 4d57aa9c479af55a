#include "classifier/test_classifier.hpp"

#include <algorithm>
#include <iostream>
#include <regex>
#include <vector>

#include "output/output_demuxer.hpp"
#include "utils/common.hpp"

namespace socrates::classifier {

namespace {

const std::vector<int>& CrashExitCodes() {
    static const std::vector<int> kCodes = {139, 11, 134, 136};
    return kCodes;
}

const std::vector<std::string>& CrashIndicators() {
    static const std::vector<std::string> kIndicators = {
        "segmentation fault",
        "segfault",
        "terminate called",
        "exception",
        "abort",
        "signal",
        "floating point exception",
        "double free",
        "corruption"
    };
    return kIndicators;
}

// Printed by the harness's per-case catch blocks.
const std::vector<std::string>& ExceptionMarkers() {
    static const std::vector<std::string> kMarkers = {
        "exception:",
        "failed (exception",
        "terminate called",
        "std::exception"
    };
    return kMarkers;
}

bool ContainsAny(const std::string& lower, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&lower](const std::string& needle) {
        return utils::Contains(lower, needle);
    });
}

bool HasSummaryLine(const std::string& output) {
    static const std::regex kSummary(R"(Summary:\s*\d{1,9}/\d{1,9} tests passed)");
    return std::regex_search(output, kSummary);
}

bool IsRuntimeFailure(const sandbox::ExecutionResult& result) {
    if (result.timed_out) {
        return true;
    }
    const auto& codes = CrashExitCodes();
    if (std::find(codes.begin(), codes.end(), result.exit_code) != codes.end()) {
        return true;
    }
    const auto output = utils::ToLower(result.output);
    if (result.exit_code != 0 && ContainsAny(utils::ToLower(result.errors) + "\n" + output, CrashIndicators())) {
        return true;
    }
    if (ContainsAny(output, ExceptionMarkers())) {
        return true;
    }
    return result.exit_code != 0 && !HasSummaryLine(result.output) &&
           !utils::IsBlank(result.output) && !utils::Contains(output, "test case");
}

std::string AfterLabel(const std::string& line, const std::string& label) {
    return utils::Trim(line.substr(line.find(label) + label.size()));
}

}  // namespace

std::optional<sandbox::TestSummary> ParseTestOutput(const std::string& output) {
    static const std::regex kSummary(R"(Summary:\s*(\d{1,9})/(\d{1,9}) tests passed)");
    static const std::regex kCase(R"(^Test Case (\d{1,9})\b.*:\s*(PASSED|FAILED)(?:\s*\((.*)\))?\s*$)");

    sandbox::TestSummary summary;
    bool has_summary = false;
    sandbox::TestFailure* current = nullptr;

    for (const auto& raw_line : utils::SplitLines(output)) {
        const auto line = utils::Trim(raw_line);
        std::smatch match;
        if (std::regex_search(line, match, kSummary)) {
            summary.passed = std::stoi(match[1].str());
            summary.total = std::stoi(match[2].str());
            has_summary = true;
            current = nullptr;
            continue;
        }
        if (std::regex_match(line, match, kCase)) {
            current = nullptr;
            if (match[2].str() == "FAILED") {
                sandbox::TestFailure failure;
                failure.test_index = std::stoi(match[1].str()) - 1;
                if (match[3].matched) {
                    auto error = utils::Trim(match[3].str());
                    if (utils::StartsWith(error, "exception:")) {
                        error = utils::Trim(error.substr(std::string("exception:").size()));
                    }
                    failure.error = error;
                }
                summary.failures.push_back(std::move(failure));
                current = &summary.failures.back();
            }
            continue;
        }
        if (current == nullptr) {
            continue;
        }
        if (utils::StartsWith(line, "Input:")) {
            current->input = AfterLabel(line, "Input:");
        } else if (utils::StartsWith(line, "Expected:")) {
            current->expected = AfterLabel(line, "Expected:");
        } else if (utils::StartsWith(line, "Output:")) {
            current->actual = AfterLabel(line, "Output:");
        } else if (utils::StartsWith(line, "---")) {
            current = nullptr;
        }
    }

    if (!has_summary) {
        if (summary.failures.empty()) {
            return std::nullopt;
        }
        int highest = 0;
        for (const auto& failure : summary.failures) {
            highest = std::max(highest, failure.test_index);
        }
        summary.total = highest + 1;
        summary.passed = summary.total - static_cast<int>(summary.failures.size());
    }
    return summary;
}

sandbox::TestExecutionResult ClassifyExecution(const sandbox::ExecutionResult& result) {
    sandbox::TestExecutionResult classified;
    classified.output = result.output;
    classified.exit_code = result.exit_code;

    if (!utils::IsBlank(result.errors) && output::HasCompilerSignature(result.errors)) {
        classified.category = sandbox::TestResultCategory::kSyntaxError;
        classified.compilation_errors = result.errors;
        return classified;
    }

    const auto summary = ParseTestOutput(result.output);
    if (IsRuntimeFailure(result)) {
        classified.category = sandbox::TestResultCategory::kRuntimeError;
        classified.runtime_errors = utils::IsBlank(result.errors) ? result.output : result.errors;
        classified.test_results = summary;
        return classified;
    }

    if (!summary.has_value()) {
        classified.category = sandbox::TestResultCategory::kNoIssues;
        return classified;
    }
    classified.test_results = summary;
    if (summary->total > 0 && summary->passed == summary->total) {
        classified.category = sandbox::TestResultCategory::kNoIssues;
    } else if (!summary->failures.empty() || summary->passed < summary->total) {
        classified.category = sandbox::TestResultCategory::kWrongAnswer;
    } else {
        classified.category = sandbox::TestResultCategory::kNoIssues;
    }
    return classified;
}

TestResultClassifier::TestResultClassifier(const workspace::WorkspaceManager& workspaces,
                                           const harness::HarnessGenerator& harness,
                                           container::ContainerLifecycleManager& lifecycle)
    : workspaces_(workspaces)
    , harness_(harness)
    , lifecycle_(lifecycle) {}

sandbox::TestExecutionResult TestResultClassifier::Classify(const std::string& source) {
    try {
        workspace::ScopedWorkspace workspace(workspaces_);
        harness_.Prepare(workspace.Get(), source, std::nullopt);
        const auto execution = lifecycle_.Run(workspace.Get().path);
        auto classified = ClassifyExecution(execution);
        std::cerr << "[classifier] category=" << sandbox::ToString(classified.category)
                  << " exit=" << execution.exit_code << std::endl;
        return classified;
    } catch (const std::exception& ex) {
        std::cerr << "[classifier] classification failed error=" << ex.what() << std::endl;
        sandbox::TestExecutionResult failed;
        failed.category = sandbox::TestResultCategory::kSyntaxError;
        failed.compilation_errors = ex.what();
        return failed;
    }
}

}  // namespace socrates::classifier
