#include "diagnostics/gcc_formatter.hpp"

#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>
#include <vector>

#include "diagnostics/error_parser.hpp"
#include "output/output_demuxer.hpp"
#include "utils/common.hpp"

namespace socrates::diagnostics {

namespace {

constexpr int kTabStop = 4;
constexpr int kGutterWidth = 5;

std::string ExpandTabs(const std::string& line) {
    std::string expanded;
    for (const char ch : line) {
        if (ch == '\t') {
            expanded.append(static_cast<std::size_t>(kTabStop - static_cast<int>(expanded.size()) % kTabStop), ' ');
        } else {
            expanded.push_back(ch);
        }
    }
    return expanded;
}

bool HasSourceExcerpt(const std::string& text) {
    static const std::regex kGutter(R"((^|\n)\s*\d+\s\|)");
    return std::regex_search(text, kGutter);
}

bool HasFunctionContext(const std::string& text) {
    static const std::regex kContext(R"((^|\n)\S+: (?:In |At global scope))");
    return std::regex_search(text, kContext);
}

const std::string* FindSource(const std::map<std::string, std::string>& sources, const std::string& file) {
    auto it = sources.find(file);
    if (it == sources.end()) {
        it = sources.find(std::filesystem::path(file).filename().string());
    }
    return it == sources.end() ? nullptr : &it->second;
}

bool IsFunctionHeader(const std::string& line) {
    static const std::regex kHeader(
        R"(^\s*(?:[\w:<>,*&~]+\s+)*[*&]?~?[\w:]+\s*\([^;{}]*\)\s*(?:const)?\s*(?:noexcept)?\s*(?:override)?\s*\{?\s*$)");
    static const std::vector<std::string> kKeywords = {
        "if", "for", "while", "switch", "catch", "else", "return", "do"
    };
    const auto trimmed = utils::Trim(line);
    for (const auto& keyword : kKeywords) {
        if (trimmed == keyword || utils::StartsWith(trimmed, keyword + " ") ||
            utils::StartsWith(trimmed, keyword + "(")) {
            return false;
        }
    }
    return std::regex_match(line, kHeader);
}

std::string HeaderSignature(const std::string& line) {
    auto signature = utils::Trim(line);
    if (!signature.empty() && signature.back() == '{') {
        signature.pop_back();
    }
    return utils::Trim(signature);
}

// Name of the function whose body contains the given 1-indexed line, or
// empty at namespace or class scope. Braces inside literals are counted too.
std::string EnclosingFunction(const std::vector<std::string>& lines, int target) {
    std::vector<std::pair<int, std::string>> functions;
    std::string pending;
    int depth = 0;
    for (int n = 1; n < target && n <= static_cast<int>(lines.size()); ++n) {
        const auto& line = lines[static_cast<std::size_t>(n - 1)];
        if (IsFunctionHeader(line)) {
            pending = HeaderSignature(line);
        }
        for (const char ch : line) {
            if (ch == '{') {
                ++depth;
                if (!pending.empty()) {
                    functions.emplace_back(depth, pending);
                    pending.clear();
                }
            } else if (ch == '}') {
                if (!functions.empty() && functions.back().first == depth) {
                    functions.pop_back();
                }
                depth = depth > 0 ? depth - 1 : 0;
            } else if (ch == ';' && !pending.empty()) {
                pending.clear();
            }
        }
    }
    return functions.empty() ? std::string() : functions.back().second;
}

std::string GutterBlank() {
    return std::string(kGutterWidth + 1, ' ') + "|";
}

}  // namespace

int ExpandedColumn(const std::string& line, int column) {
    int visual = 0;
    for (int i = 0; i < column - 1 && i < static_cast<int>(line.size()); ++i) {
        if (line[static_cast<std::size_t>(i)] == '\t') {
            visual += kTabStop - visual % kTabStop;
        } else {
            ++visual;
        }
    }
    return visual + 1;
}

std::string FormatErrorGccStyle(const std::string& text,
                                const std::map<std::string, std::string>& source_by_file) {
    const auto cleaned = utils::TrimRight(output::CleanLogText(text));
    if (HasSourceExcerpt(cleaned)) {
        return cleaned;
    }

    const bool emit_context = !HasFunctionContext(cleaned);
    std::vector<std::string> rendered;
    std::string last_context;
    for (const auto& raw_line : utils::SplitLines(cleaned)) {
        const auto line = utils::Trim(raw_line);
        const auto diagnostic = MatchDiagnosticLine(line);
        const std::string* source = diagnostic ? FindSource(source_by_file, diagnostic->file) : nullptr;
        if (source == nullptr) {
            rendered.push_back(raw_line);
            continue;
        }
        const auto source_lines = utils::SplitLines(*source);
        if (diagnostic->line < 1 || diagnostic->line > static_cast<int>(source_lines.size())) {
            rendered.push_back(raw_line);
            continue;
        }

        const auto function = EnclosingFunction(source_lines, diagnostic->line);
        const auto context = function.empty()
            ? diagnostic->file + ": At global scope:"
            : diagnostic->file + ": In function '" + function + "':";
        if (emit_context && context != last_context) {
            rendered.push_back(context);
            last_context = context;
        }
        rendered.push_back(line);

        const auto& offending = source_lines[static_cast<std::size_t>(diagnostic->line - 1)];
        std::ostringstream gutter;
        gutter << std::setw(kGutterWidth) << diagnostic->line << " | " << ExpandTabs(offending);
        rendered.push_back(gutter.str());

        int column = 0;
        if (diagnostic->column.has_value()) {
            column = ExpandedColumn(offending, *diagnostic->column);
        } else {
            const auto first = offending.find_first_not_of(" \t");
            column = ExpandedColumn(offending, first == std::string::npos ? 1 : static_cast<int>(first) + 1);
        }
        const std::string indent(static_cast<std::size_t>(column - 1), ' ');
        rendered.push_back(GutterBlank() + " " + indent + "^");

        if (utils::Contains(diagnostic->message, "expected ';'")) {
            rendered.push_back(GutterBlank() + " " + indent + ";");
        }
    }
    return utils::Join(rendered, "\n");
}

}  // namespace socrates::diagnostics
