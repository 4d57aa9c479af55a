#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "harness/test_table.hpp"
#include "sandbox/types.hpp"
#include "workspace/workspace_manager.hpp"

namespace socrates::harness {

inline constexpr const char* kMainFile = "main.cpp";
inline constexpr const char* kSolutionFile = "solution.hpp";

inline constexpr const char* kConsoleStart = "CONSOLE_START";
inline constexpr const char* kConsoleEnd = "CONSOLE_END";
inline constexpr const char* kReturnValuePrefix = "RETURN_VALUE:";
inline constexpr const char* kExceptionPrefix = "EXCEPTION:";

// Decoded sentinel regions of a single-test run.
struct SingleTestOutput {
    std::string console;
    std::optional<std::string> return_value;
    std::optional<std::string> exception;
    // Both CONSOLE_START and CONSOLE_END were seen.
    bool complete = false;
};

class HarnessGenerator {
public:
    HarnessGenerator(const workspace::WorkspaceManager& workspaces, std::size_t max_code_size);

    // Writes main.cpp (and solution.hpp for class-only sources) into the
    // workspace. Throws CodeTooLarge before touching the workspace, and
    // InvalidTestIndex for an index outside the built-in table.
    sandbox::PreparedCode Prepare(const workspace::Workspace& workspace,
                                  const std::string& source,
                                  std::optional<int> test_index) const;

private:
    const workspace::WorkspaceManager& workspaces_;
    std::size_t max_code_size_;
};

bool HasEntryPoint(const std::string& source);
std::string BuildSuiteHarness();
std::string BuildSingleTestHarness(const TestCase& test_case);
SingleTestOutput ParseSingleTestOutput(const std::string& output);

}  // namespace socrates::harness
