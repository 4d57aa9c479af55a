#include "harness/harness_generator.hpp"

#include <regex>
#include <sstream>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"

namespace socrates::harness {
namespace {

const char* kSuiteTemplate = R"CPP(#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

#include "solution.hpp"

struct TestCase {
  vector<int> nums;
  int target;
  vector<int> expected;
  string label;
};

static vector<TestCase> builtinTestCases() {
  return {
{{TEST_CASES}}
  };
}

static string renderList(const vector<int>& values) {
  ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << values[i];
  }
  oss << "]";
  return oss.str();
}

static string formatInput(const vector<int>& nums, int target) {
  ostringstream oss;
  oss << "nums = " << renderList(nums) << ", target = " << target;
  return oss.str();
}

static bool sameElements(vector<int> a, vector<int> b) {
  if (a.size() != b.size()) {
    return false;
  }
  sort(a.begin(), a.end());
  sort(b.begin(), b.end());
  return a == b;
}

int main() {
  const vector<TestCase> testCases = builtinTestCases();
  Solution solution;
  size_t passed = 0;

  for (size_t i = 0; i < testCases.size(); ++i) {
    const TestCase& test = testCases[i];
    vector<int> nums = test.nums;
    vector<int> actual;
    bool executed = false;
    bool passedCase = false;
    cout << "Test Case " << (i + 1) << " - " << test.label << ": " << flush;

    try {
      actual = solution.twoSum(nums, test.target);
      executed = true;
      passedCase = sameElements(actual, test.expected);
      cout << (passedCase ? "PASSED" : "FAILED") << "\n";
    } catch (const exception& ex) {
      cout << "FAILED (exception: " << ex.what() << ")\n";
    } catch (...) {
      cout << "FAILED (unknown exception)\n";
    }

    cout << "  Input:     " << formatInput(test.nums, test.target) << "\n";
    cout << "  Expected:  " << renderList(test.expected) << "\n";
    if (executed) {
      cout << "  Output:    " << renderList(actual) << "\n";
    }
    cout << "-----------------------------" << endl;

    if (passedCase) {
      ++passed;
    }
  }

  cout << "Summary: " << passed << "/" << testCases.size() << " tests passed." << endl;
  if (passed == testCases.size()) {
    cout << "All tests passed!" << endl;
    return 0;
  }
  cout << "Some tests failed." << endl;
  return 1;
}
)CPP";

const char* kSingleTestTemplate = R"CPP(#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

#include "solution.hpp"

static string renderValue(const vector<int>& values) {
  ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      oss << ",";
    }
    oss << values[i];
  }
  oss << "]";
  return oss.str();
}

int main() {
  vector<int> nums = {{NUMS}};
  int target = {{TARGET}};
  Solution solution;
  vector<int> result;

  cout << "{{CONSOLE_START}}" << endl;
  try {
    result = solution.twoSum(nums, target);
  } catch (const exception& ex) {
    cout << endl << "{{CONSOLE_END}}" << endl;
    cout << "{{EXCEPTION}}" << ex.what() << endl;
    return 1;
  } catch (...) {
    cout << endl << "{{CONSOLE_END}}" << endl;
    cout << "{{EXCEPTION}}unknown exception" << endl;
    return 1;
  }
  cout << endl << "{{CONSOLE_END}}" << endl;
  cout << "{{RETURN_VALUE}}" << renderValue(result) << endl;
  return 0;
}
)CPP";

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::string::size_type pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string EscapeCppString(const std::string& value) {
    std::string escaped;
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

// Blanks out comments so a commented-out main() is not mistaken for one.
// String and character literals are skipped over untouched.
std::string StripComments(const std::string& source) {
    enum class State { kCode, kLineComment, kBlockComment, kString, kChar };
    State state = State::kCode;
    std::string out;
    out.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        const char next = i + 1 < source.size() ? source[i + 1] : '\0';
        switch (state) {
            case State::kCode:
                if (c == '/' && next == '/') {
                    state = State::kLineComment;
                    ++i;
                    out += "  ";
                } else if (c == '/' && next == '*') {
                    state = State::kBlockComment;
                    ++i;
                    out += "  ";
                } else {
                    if (c == '"') {
                        state = State::kString;
                    } else if (c == '\'') {
                        state = State::kChar;
                    }
                    out.push_back(c);
                }
                break;
            case State::kLineComment:
                if (c == '\n') {
                    state = State::kCode;
                    out.push_back(c);
                } else {
                    out.push_back(' ');
                }
                break;
            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    state = State::kCode;
                    ++i;
                    out += "  ";
                } else {
                    out.push_back(c == '\n' ? '\n' : ' ');
                }
                break;
            case State::kString:
            case State::kChar:
                out.push_back(c);
                if (c == '\\' && i + 1 < source.size()) {
                    out.push_back(source[++i]);
                } else if ((state == State::kString && c == '"') ||
                           (state == State::kChar && c == '\'') ||
                           c == '\n') {
                    state = State::kCode;
                }
                break;
        }
    }
    return out;
}

}  // namespace

HarnessGenerator::HarnessGenerator(const workspace::WorkspaceManager& workspaces, std::size_t max_code_size)
    : workspaces_(workspaces)
    , max_code_size_(max_code_size) {}

sandbox::PreparedCode HarnessGenerator::Prepare(const workspace::Workspace& workspace,
                                                const std::string& source,
                                                std::optional<int> test_index) const {
    workspace::WorkspaceManager::ValidateSize(source, max_code_size_);

    sandbox::PreparedCode prepared{};
    if (HasEntryPoint(source)) {
        prepared.main_file_path = workspaces_.Write(workspace, kMainFile, source).string();
        prepared.files_for_errors.emplace(kMainFile, source);
        prepared.used_harness = false;
        return prepared;
    }

    const auto& cases = BuiltinTestCases();
    if (test_index && (*test_index < 0 || static_cast<std::size_t>(*test_index) >= cases.size())) {
        throw sandbox::InvalidTestIndex(*test_index, cases.size());
    }

    const auto trimmed = utils::Trim(source);
    const std::string solution = trimmed.empty() ? std::string() : trimmed + "\n";
    const std::string main_source = test_index
        ? BuildSingleTestHarness(cases[static_cast<std::size_t>(*test_index)])
        : BuildSuiteHarness();

    workspaces_.Write(workspace, kSolutionFile, solution);
    prepared.main_file_path = workspaces_.Write(workspace, kMainFile, main_source).string();
    prepared.files_for_errors.emplace(kSolutionFile, solution);
    prepared.files_for_errors.emplace(kMainFile, main_source);
    prepared.used_harness = true;
    return prepared;
}

bool HasEntryPoint(const std::string& source) {
    static const std::regex kMainPattern(R"(\bint\s+main\s*\()");
    const auto code = StripComments(source);
    return std::regex_search(code, kMainPattern);
}

std::string BuildSuiteHarness() {
    std::vector<std::string> rows;
    for (const auto& test_case : BuiltinTestCases()) {
        std::ostringstream row;
        row << "    {" << RenderInitializer(test_case.nums) << ", " << test_case.target << ", "
            << RenderInitializer(test_case.expected) << ", \"" << EscapeCppString(test_case.label) << "\"}";
        rows.push_back(row.str());
    }
    std::string source = kSuiteTemplate;
    ReplaceAll(source, "{{TEST_CASES}}", utils::Join(rows, ",\n"));
    return source;
}

std::string BuildSingleTestHarness(const TestCase& test_case) {
    std::string source = kSingleTestTemplate;
    ReplaceAll(source, "{{NUMS}}", RenderInitializer(test_case.nums));
    ReplaceAll(source, "{{TARGET}}", std::to_string(test_case.target));
    ReplaceAll(source, "{{CONSOLE_START}}", kConsoleStart);
    ReplaceAll(source, "{{CONSOLE_END}}", kConsoleEnd);
    ReplaceAll(source, "{{EXCEPTION}}", kExceptionPrefix);
    ReplaceAll(source, "{{RETURN_VALUE}}", kReturnValuePrefix);
    return source;
}

SingleTestOutput ParseSingleTestOutput(const std::string& output) {
    SingleTestOutput parsed{};
    const auto lines = utils::SplitLines(output);

    std::size_t start = lines.size();
    std::size_t end = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (start == lines.size() && utils::Trim(lines[i]) == kConsoleStart) {
            start = i;
        }
    }
    // The harness prints CONSOLE_END last, so the final occurrence wins even
    // if the student printed the marker text themselves.
    for (std::size_t i = lines.size(); i > 0; --i) {
        if (utils::Trim(lines[i - 1]) == kConsoleEnd) {
            end = i - 1;
            break;
        }
    }

    if (start < lines.size() && end < lines.size() && start < end) {
        parsed.complete = true;
        std::vector<std::string> console(lines.begin() + static_cast<std::ptrdiff_t>(start) + 1,
                                         lines.begin() + static_cast<std::ptrdiff_t>(end));
        // Drop the separator newline the harness writes before CONSOLE_END.
        if (!console.empty() && console.back().empty()) {
            console.pop_back();
        }
        parsed.console = utils::Join(console, "\n");
    } else if (start < lines.size()) {
        std::vector<std::string> console(lines.begin() + static_cast<std::ptrdiff_t>(start) + 1, lines.end());
        parsed.console = utils::Join(console, "\n");
        return parsed;
    } else {
        parsed.console = output;
        return parsed;
    }

    for (std::size_t i = end + 1; i < lines.size(); ++i) {
        const auto line = utils::Trim(lines[i]);
        if (utils::StartsWith(line, kReturnValuePrefix)) {
            parsed.return_value = line.substr(std::string(kReturnValuePrefix).size());
        } else if (utils::StartsWith(line, kExceptionPrefix)) {
            parsed.exception = line.substr(std::string(kExceptionPrefix).size());
        }
    }
    return parsed;
}

}  // namespace socrates::harness
