#include "runner/code_runner.hpp"

#include <filesystem>
#include <iostream>

#include "diagnostics/error_parser.hpp"
#include "diagnostics/gcc_formatter.hpp"

namespace socrates::runner {

namespace {

std::filesystem::path ResolveWorkspaceRoot(const config::Config& config) {
    if (config.workspace.root.empty()) {
        return workspace::DefaultWorkspaceRoot();
    }
    return config.workspace.root;
}

// Fills missing snippets from the files that were actually compiled.
void AttachCodeContext(sandbox::ExecutionResult& result, const sandbox::PreparedCode& prepared) {
    for (auto& error : result.parsed_errors) {
        if (error.code_snippet.has_value() || error.line <= 0) {
            continue;
        }
        auto it = prepared.files_for_errors.find(error.file);
        if (it == prepared.files_for_errors.end()) {
            it = prepared.files_for_errors.find(std::filesystem::path(error.file).filename().string());
        }
        if (it == prepared.files_for_errors.end()) {
            continue;
        }
        auto context = diagnostics::GetCodeContext(it->second, error.line);
        if (!context.empty()) {
            error.code_snippet = std::move(context);
        }
    }
}

}  // namespace

CodeRunner::CodeRunner(const config::Config& config)
    : spec_(config.execution)
    , owned_client_(container::CreateContainerClient(config))
    , client_(*owned_client_)
    , workspaces_(ResolveWorkspaceRoot(config))
    , harness_(workspaces_, spec_.max_code_size)
    , lifecycle_(client_, spec_)
    , classifier_(workspaces_, harness_, lifecycle_) {}

CodeRunner::CodeRunner(const config::Config& config, container::ContainerClient& client)
    : spec_(config.execution)
    , client_(client)
    , workspaces_(ResolveWorkspaceRoot(config))
    , harness_(workspaces_, spec_.max_code_size)
    , lifecycle_(client_, spec_)
    , classifier_(workspaces_, harness_, lifecycle_) {}

sandbox::ExecutionResult CodeRunner::Execute(const std::string& source, std::optional<int> test_index) {
    workspace::WorkspaceManager::ValidateSize(source, spec_.max_code_size);

    workspace::ScopedWorkspace workspace(workspaces_);
    const auto prepared = harness_.Prepare(workspace.Get(), source, test_index);
    auto result = lifecycle_.Run(workspace.Get().path);

    if (!result.timed_out && !result.errors.empty()) {
        result.errors = diagnostics::FormatErrorGccStyle(result.errors, prepared.files_for_errors);
    }
    AttachCodeContext(result, prepared);

    std::cerr << "[runner] executed harness=" << (prepared.used_harness ? "true" : "false")
              << " exit=" << result.exit_code
              << " parsed_errors=" << result.parsed_errors.size() << std::endl;
    return result;
}

sandbox::TestExecutionResult CodeRunner::Classify(const std::string& source) {
    return classifier_.Classify(source);
}

}  // namespace socrates::runner
