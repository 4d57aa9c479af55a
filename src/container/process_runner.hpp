#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace socrates::container {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool launch_failed = false;
    std::string output;
    std::string error;
};

class ProcessRunner {
public:
    // Runs program (looked up on PATH unless it contains a slash) with args.
    // The child is killed at the deadline and reported with exit code 124.
    static ProcessResult Run(const std::string& program,
                             const std::vector<std::string>& args,
                             std::chrono::milliseconds timeout);
};

}  // namespace socrates::container
