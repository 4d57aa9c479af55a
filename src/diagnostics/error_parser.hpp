#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sandbox/types.hpp"

namespace socrates::diagnostics {

struct DiagnosticLine {
    std::string file;
    int line = 0;
    std::optional<int> column;
    std::string severity;
    std::string message;
};

// Matches "<file>.cpp:<line>[:<col>]: error|warning: <message>", tolerating
// digits glued in front of the file name.
std::optional<DiagnosticLine> MatchDiagnosticLine(const std::string& line);

// Extracts located diagnostics from compiler output. Linker failures that
// carry no source location are reported with file "linker" and line 0.
std::vector<sandbox::ParsedError> ParseCompilerError(const std::string& text);

sandbox::ErrorKind Categorize(const std::string& message);

// Window of `radius` lines on each side of a 1-indexed line. The target is
// marked ">>> n: " and the others "    n: ". Empty when the line is out of range.
std::string GetCodeContext(const std::string& code, int line, int radius = 3);

}  // namespace socrates::diagnostics
