#pragma once

#include <optional>
#include <string>

#include "container/lifecycle_manager.hpp"
#include "harness/harness_generator.hpp"
#include "sandbox/types.hpp"
#include "workspace/workspace_manager.hpp"

namespace socrates::classifier {

// Reads the "Test Case n - label: PASSED|FAILED" blocks and the closing
// "Summary: p/t tests passed." line of a suite run. Returns nullopt when
// neither a summary nor a failure could be found.
std::optional<sandbox::TestSummary> ParseTestOutput(const std::string& output);

// Fixed-priority verdict over one full-suite run: syntax, then runtime, then
// the parsed test outcome.
sandbox::TestExecutionResult ClassifyExecution(const sandbox::ExecutionResult& result);

class TestResultClassifier {
public:
    TestResultClassifier(const workspace::WorkspaceManager& workspaces,
                         const harness::HarnessGenerator& harness,
                         container::ContainerLifecycleManager& lifecycle);

    // Never throws. Request and infrastructure failures come back as
    // SYNTAX_ERROR carrying the failure message.
    sandbox::TestExecutionResult Classify(const std::string& source);

private:
    const workspace::WorkspaceManager& workspaces_;
    const harness::HarnessGenerator& harness_;
    container::ContainerLifecycleManager& lifecycle_;
};

}  // namespace socrates::classifier
