#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sandbox/types.hpp"

namespace socrates::output {

inline constexpr const char* kNoErrorMessage = "Compilation or execution failed with no error message";

// Lowercase substrings that mark a compiler or linker failure line.
const std::vector<std::string>& CompilerSignatures();
bool HasCompilerSignature(const std::string& text);

// Unwraps Docker's multiplexed log framing. Input that is not a well-formed
// frame sequence is returned unchanged.
std::string DecodeFrames(const std::string& raw);

// Drops control and non-ASCII bytes and repairs digits glued in front of
// "<file>.cpp:" / "<file>.hpp:" diagnostics.
std::string CleanLogText(const std::string& text);

struct ExitCodeSplit {
    std::string text;
    std::optional<int> exit_code;
};

// Finds the last EXIT_CODE:<n> sentinel and cuts the text there.
ExitCodeSplit ExtractExitCode(const std::string& text);

struct StreamSplit {
    std::vector<std::string> output;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

// Line classifier for the combined compiler + program stream.
StreamSplit SplitStreams(const std::string& text);

// Full pipeline from raw container logs to a result. fallback_exit_code is
// the container's own status, used when the sentinel is missing. timed_out
// is set when the script reports its own cutoff; the caller owns the message.
sandbox::ExecutionResult Demultiplex(const std::string& raw, int fallback_exit_code);

}  // namespace socrates::output
