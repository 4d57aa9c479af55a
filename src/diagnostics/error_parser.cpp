#include "diagnostics/error_parser.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

#include "utils/common.hpp"

namespace socrates::diagnostics {

namespace {

constexpr std::size_t kSnippetLookahead = 2;

// First match wins, so the order of the rows matters.
const std::vector<std::pair<sandbox::ErrorKind, std::vector<std::string>>>& CategoryTable() {
    static const std::vector<std::pair<sandbox::ErrorKind, std::vector<std::string>>> kTable = {
        {sandbox::ErrorKind::kSyntax, {"expected", "missing", "before", "after", "syntax"}},
        {sandbox::ErrorKind::kUndefined, {"not declared", "undefined"}},
        {sandbox::ErrorKind::kType, {"does not name a type", "cannot convert", "invalid conversion",
                                     "no match for", "cannot initialize", "incompatible types"}},
        {sandbox::ErrorKind::kLinker, {"undefined reference", "linker", "ld returned"}},
    };
    return kTable;
}

bool IsLinkerLine(const std::string& lower) {
    return utils::Contains(lower, "undefined reference") ||
           utils::Contains(lower, "collect2:") ||
           utils::Contains(lower, "ld returned");
}

bool IsSnippetLine(const std::string& trimmed, int line) {
    if (trimmed.empty() || MatchDiagnosticLine(trimmed).has_value()) {
        return false;
    }
    return utils::Contains(trimmed, std::to_string(line)) ||
           utils::Contains(trimmed, "^") ||
           utils::Contains(trimmed, "|");
}

}  // namespace

std::optional<DiagnosticLine> MatchDiagnosticLine(const std::string& line) {
    static const std::regex kPattern(
        R"(^\d*([A-Za-z_./][\w./\-]*\.(?:cpp|hpp|h|cc)):(\d+)(?::(\d+))?:\s*(fatal error|error|warning):\s*(.*)$)");
    std::smatch match;
    if (!std::regex_match(line, match, kPattern)) {
        return std::nullopt;
    }
    DiagnosticLine diagnostic;
    diagnostic.file = match[1].str();
    diagnostic.line = std::stoi(match[2].str());
    if (match[3].matched) {
        diagnostic.column = std::stoi(match[3].str());
    }
    diagnostic.severity = match[4].str() == "warning" ? "warning" : "error";
    diagnostic.message = utils::Trim(match[5].str());
    return diagnostic;
}

std::vector<sandbox::ParsedError> ParseCompilerError(const std::string& text) {
    std::vector<sandbox::ParsedError> errors;
    const auto lines = utils::SplitLines(text);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto trimmed = utils::Trim(lines[i]);
        if (trimmed.empty()) {
            continue;
        }

        if (const auto diagnostic = MatchDiagnosticLine(trimmed)) {
            sandbox::ParsedError error;
            error.file = diagnostic->file;
            error.line = diagnostic->line;
            error.column = diagnostic->column;
            error.severity = diagnostic->severity;
            error.message = diagnostic->message;
            error.type = Categorize(diagnostic->message);
            error.raw_error = trimmed;
            for (std::size_t j = i + 1; j < lines.size() && j <= i + kSnippetLookahead; ++j) {
                const auto candidate = utils::Trim(lines[j]);
                if (IsSnippetLine(candidate, diagnostic->line)) {
                    error.code_snippet = candidate;
                    break;
                }
            }
            errors.push_back(std::move(error));
            continue;
        }

        if (IsLinkerLine(utils::ToLower(trimmed))) {
            sandbox::ParsedError error;
            error.file = "linker";
            error.line = 0;
            error.type = sandbox::ErrorKind::kLinker;
            error.message = trimmed;
            error.raw_error = trimmed;
            errors.push_back(std::move(error));
        }
    }
    return errors;
}

sandbox::ErrorKind Categorize(const std::string& message) {
    const auto lower = utils::ToLower(message);
    for (const auto& [kind, needles] : CategoryTable()) {
        for (const auto& needle : needles) {
            if (utils::Contains(lower, needle)) {
                return kind;
            }
        }
    }
    return sandbox::ErrorKind::kOther;
}

std::string GetCodeContext(const std::string& code, int line, int radius) {
    const auto lines = utils::SplitLines(code);
    const int count = static_cast<int>(lines.size());
    if (line < 1 || line > count) {
        return {};
    }
    if (radius < 0) {
        radius = 0;
    }
    const int first = std::max(1, line - radius);
    const int last = std::min(count, line + radius);

    std::ostringstream oss;
    for (int n = first; n <= last; ++n) {
        if (n > first) {
            oss << "\n";
        }
        oss << (n == line ? ">>> " : "    ") << n << ": " << lines[static_cast<std::size_t>(n - 1)];
    }
    return oss.str();
}

}  // namespace socrates::diagnostics
