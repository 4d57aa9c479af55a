#include "output/output_demuxer.hpp"

#include <cctype>
#include <cstdint>
#include <regex>

#include "container/run_script.hpp"
#include "diagnostics/error_parser.hpp"
#include "utils/common.hpp"

namespace socrates::output {

namespace {

constexpr std::size_t kFrameHeaderSize = 8;
constexpr int kScriptTimeoutExitCode = 124;

bool IsKeptControl(unsigned char c) {
    return c == '\n' || c == '\t';
}

// Glued stream ids and size bytes that survived as digits, e.g. "1main.cpp:3:5: ...".
const std::regex& GluedDigitsPattern() {
    static const std::regex kPattern(R"(^\d+([A-Za-z_][\w.\-]*\.(?:cpp|hpp):))");
    return kPattern;
}

const std::regex& WarningDiagnosticPattern() {
    static const std::regex kPattern(R"(^\S+:\d+(?::\d+)?:\s*warning:)", std::regex::icase);
    return kPattern;
}

const std::regex& NotePattern() {
    static const std::regex kPattern(R"(^\S+:\d+(?::\d+)?:\s*note:)", std::regex::icase);
    return kPattern;
}

const std::regex& GutterPattern() {
    static const std::regex kPattern(R"(^\s*\d*\s*\|)");
    return kPattern;
}

const std::regex& CaretPattern() {
    static const std::regex kPattern(R"(^\s*\^)");
    return kPattern;
}

const std::regex& SourcePrefixPattern() {
    static const std::regex kPattern(R"(^[\w./\-]*\.cpp:)", std::regex::icase);
    return kPattern;
}

bool IsContextLine(const std::string& line) {
    static const std::regex kFunctionContext(R"(^[\w./\-]+\.(?:cpp|hpp|h|cc): (?:In |At global scope))");
    static const std::regex kIncludeChain(R"(^\s+from \S+:\d+)");
    static const std::regex kLinkerPrefix(R"(^\S*\bld: )");
    return utils::StartsWith(line, "In file included from ") ||
           std::regex_search(line, kFunctionContext) ||
           std::regex_search(line, kIncludeChain) ||
           std::regex_search(line, kLinkerPrefix);
}

bool IsWarningContinuation(const std::string& line) {
    return std::regex_search(line, GutterPattern()) ||
           std::regex_search(line, CaretPattern()) ||
           std::regex_search(line, NotePattern());
}

bool IsErrorLine(const std::string& line, const std::string& lower) {
    if (HasCompilerSignature(lower)) {
        return true;
    }
    return std::regex_search(line, SourcePrefixPattern()) && !utils::Contains(lower, "warning:");
}

}  // namespace

const std::vector<std::string>& CompilerSignatures() {
    static const std::vector<std::string> kSignatures = {
        "error:",
        "undefined reference",
        "collect2:",
        "ld returned",
        "cannot find",
        "no such file",
        "multiple definition"
    };
    return kSignatures;
}

bool HasCompilerSignature(const std::string& text) {
    const auto lower = utils::ToLower(text);
    for (const auto& signature : CompilerSignatures()) {
        if (utils::Contains(lower, signature)) {
            return true;
        }
    }
    return false;
}

std::string DecodeFrames(const std::string& raw) {
    std::string payload;
    payload.reserve(raw.size());
    std::size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < kFrameHeaderSize) {
            return raw;
        }
        const auto stream = static_cast<unsigned char>(raw[pos]);
        if (stream > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) {
            return raw;
        }
        std::uint32_t length = 0;
        for (std::size_t i = 4; i < kFrameHeaderSize; ++i) {
            length = (length << 8) | static_cast<unsigned char>(raw[pos + i]);
        }
        if (length > raw.size() - pos - kFrameHeaderSize) {
            return raw;
        }
        payload.append(raw, pos + kFrameHeaderSize, length);
        pos += kFrameHeaderSize + length;
    }
    return payload;
}

std::string CleanLogText(const std::string& text) {
    // Framing bytes \x01 and \x02 are control bytes, so this pass removes
    // them at line boundaries along with everything else non-printable.
    std::string printable;
    printable.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80 || c == 0x7f) {
            continue;
        }
        if (c < 0x20 && !IsKeptControl(c)) {
            continue;
        }
        printable.push_back(ch);
    }

    std::vector<std::string> lines;
    for (const auto& line : utils::SplitLines(printable)) {
        lines.push_back(std::regex_replace(line, GluedDigitsPattern(), "$1",
                                           std::regex_constants::format_first_only));
    }
    auto cleaned = utils::Join(lines, "\n");
    if (!printable.empty() && printable.back() == '\n') {
        cleaned.push_back('\n');
    }
    return cleaned;
}

ExitCodeSplit ExtractExitCode(const std::string& text) {
    const std::string sentinel = container::kExitCodeSentinel;
    auto pos = text.rfind(sentinel);
    while (pos != std::string::npos) {
        const auto value_start = pos + sentinel.size();
        std::size_t end = value_start;
        if (end < text.size() && text[end] == '-') {
            ++end;
        }
        const auto number_start = end;
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        if (end > number_start && end - number_start <= 9) {
            ExitCodeSplit split;
            split.text = text.substr(0, pos);
            split.exit_code = std::stoi(text.substr(value_start, end - value_start));
            return split;
        }
        if (pos == 0) {
            break;
        }
        pos = text.rfind(sentinel, pos - 1);
    }
    return {text, std::nullopt};
}

StreamSplit SplitStreams(const std::string& text) {
    enum class Section { kOutput, kError, kWarning };

    StreamSplit split;
    Section section = Section::kOutput;
    std::vector<std::string> pending_context;

    auto flush_context = [&pending_context](std::vector<std::string>& target) {
        target.insert(target.end(), pending_context.begin(), pending_context.end());
        pending_context.clear();
    };

    for (const auto& line : utils::SplitLines(text)) {
        const auto lower = utils::ToLower(line);

        if (IsContextLine(line)) {
            pending_context.push_back(line);
            continue;
        }
        if (std::regex_search(line, WarningDiagnosticPattern())) {
            flush_context(split.warnings);
            split.warnings.push_back(line);
            section = Section::kWarning;
            continue;
        }
        if (IsErrorLine(line, lower)) {
            flush_context(split.errors);
            split.errors.push_back(line);
            section = Section::kError;
            continue;
        }
        if (!pending_context.empty()) {
            // Context lines belong to a diagnostic only when one follows them.
            if (section == Section::kError) {
                flush_context(split.errors);
            } else {
                flush_context(split.output);
                section = Section::kOutput;
            }
        }
        if (section == Section::kError) {
            if (!utils::Contains(lower, "warning:")) {
                split.errors.push_back(line);
                continue;
            }
            section = Section::kOutput;
        }
        if (section == Section::kWarning) {
            if (IsWarningContinuation(line)) {
                split.warnings.push_back(line);
                continue;
            }
            section = Section::kOutput;
        }
        split.output.push_back(line);
    }
    flush_context(section == Section::kError ? split.errors : split.output);
    return split;
}

sandbox::ExecutionResult Demultiplex(const std::string& raw, int fallback_exit_code) {
    const auto cleaned = CleanLogText(DecodeFrames(raw));
    auto extracted = ExtractExitCode(cleaned);

    sandbox::ExecutionResult result;
    if (extracted.exit_code.has_value()) {
        result.exit_code = *extracted.exit_code;
    } else {
        result.exit_code = fallback_exit_code < 0 ? 1 : fallback_exit_code;
    }

    // The marker only counts when the script also reported timeout's status.
    const std::string marker = container::kTimedOutSentinel;
    const auto tail = utils::TrimRight(extracted.text);
    if (extracted.exit_code == kScriptTimeoutExitCode && tail.size() >= marker.size() &&
        tail.compare(tail.size() - marker.size(), marker.size(), marker) == 0) {
        result.timed_out = true;
        extracted.text = tail.substr(0, tail.size() - marker.size());
    }
    const auto split = SplitStreams(extracted.text);

    result.output = utils::TrimRight(utils::Join(split.output, "\n"));
    result.warnings = utils::TrimRight(utils::Join(split.warnings, "\n"));

    if (!split.errors.empty()) {
        result.errors = utils::TrimRight(utils::Join(split.errors, "\n"));
    } else if (result.exit_code != 0) {
        const auto payload = utils::TrimRight(extracted.text);
        result.errors = utils::IsBlank(payload) ? std::string(kNoErrorMessage) : payload;
    }

    if (!result.errors.empty()) {
        result.parsed_errors = diagnostics::ParseCompilerError(result.errors);
    }
    return result;
}

}  // namespace socrates::output
