#pragma once

#include <memory>
#include <optional>
#include <string>

#include "classifier/test_classifier.hpp"
#include "config/config_schema.hpp"
#include "container/container_client.hpp"
#include "container/lifecycle_manager.hpp"
#include "harness/harness_generator.hpp"
#include "sandbox/types.hpp"
#include "workspace/workspace_manager.hpp"

namespace socrates::runner {

// Entry point wiring workspace, harness, container and classifier together.
class CodeRunner {
public:
    explicit CodeRunner(const config::Config& config);
    // Uses a caller-provided client, which must outlive the runner.
    CodeRunner(const config::Config& config, container::ContainerClient& client);

    // Compiles and runs one submission. Throws CodeTooLarge,
    // InvalidTestIndex or DockerUnavailable; whatever the submitted code
    // does is reported in the result.
    sandbox::ExecutionResult Execute(const std::string& source, std::optional<int> test_index = std::nullopt);

    sandbox::TestExecutionResult Classify(const std::string& source);

    const workspace::WorkspaceManager& Workspaces() const { return workspaces_; }

private:
    config::ExecutionSpec spec_;
    std::unique_ptr<container::ContainerClient> owned_client_;
    container::ContainerClient& client_;
    workspace::WorkspaceManager workspaces_;
    harness::HarnessGenerator harness_;
    container::ContainerLifecycleManager lifecycle_;
    classifier::TestResultClassifier classifier_;
};

}  // namespace socrates::runner
