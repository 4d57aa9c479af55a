#pragma once

#include <chrono>
#include <map>
#include <string>

#include "config/config_schema.hpp"

namespace socrates::container {

inline constexpr const char* kWorkspaceMount = "/workspace";
inline constexpr const char* kScratchPath = "/tmp";
inline constexpr const char* kExitCodeSentinel = "EXIT_CODE:";
// Printed on its own line just before the exit sentinel when a phase hit its
// timeout, so a program that merely exits 124 is not mistaken for one.
inline constexpr const char* kTimedOutSentinel = "TIMED_OUT";

// Two-phase compile-then-run protocol executed by `sh -c` inside the
// container. Slots are written as {{name}}. The script always ends with
// one EXIT_CODE:<n> line from the phase that decided the outcome. The run
// phase's stderr goes to the program's stdout, while timeout's own
// --verbose notice lands in timeout_log and marks the cutoff.
class RunScript {
public:
    static constexpr int kVersion = 3;

    static const std::string& Template();

    // Throws std::invalid_argument when a slot in the template has no value
    // or a value names a slot the template does not have.
    static std::string Render(const std::map<std::string, std::string>& slots);

    static std::map<std::string, std::string> SlotsFor(const config::ExecutionSpec& spec);
};

// "10s", "0.250s": the duration syntax coreutils timeout accepts.
std::string FormatTimeout(std::chrono::milliseconds timeout);

}  // namespace socrates::container
