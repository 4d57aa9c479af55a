#include "diagnostics/gcc_formatter.hpp"

#include <gtest/gtest.h>

#include "utils/common.hpp"

namespace {

using socrates::diagnostics::ExpandedColumn;
using socrates::diagnostics::FormatErrorGccStyle;

TEST(GccFormatterTest, RebuildsExcerptWithFunctionContextAndFixIt) {
    const std::map<std::string, std::string> sources = {
        {"main.cpp", "#include <iostream>\nint main() {\n    return 0\n}\n"}
    };
    const auto formatted = FormatErrorGccStyle("main.cpp:3:13: error: expected ';' before '}' token", sources);

    EXPECT_EQ(formatted,
              "main.cpp: In function 'int main()':\n"
              "main.cpp:3:13: error: expected ';' before '}' token\n"
              "    3 |     return 0\n"
              "      |             ^\n"
              "      |             ;");
}

TEST(GccFormatterTest, ReportsGlobalScopeOutsideFunctions) {
    const std::map<std::string, std::string> sources = {
        {"solution.hpp", "class Solution {\npublic:\n    strin name;\n};\n"}
    };
    const auto formatted = FormatErrorGccStyle("solution.hpp:3:5: error: 'strin' does not name a type", sources);

    EXPECT_EQ(formatted,
              "solution.hpp: At global scope:\n"
              "solution.hpp:3:5: error: 'strin' does not name a type\n"
              "    3 |     strin name;\n"
              "      |     ^");
}

TEST(GccFormatterTest, FindsEnclosingMemberFunction) {
    const std::map<std::string, std::string> sources = {
        {"solution.hpp",
         "class Solution {\n"
         "public:\n"
         "    vector<int> twoSum(vector<int>& nums, int target) {\n"
         "        return undefinedThing;\n"
         "    }\n"
         "};\n"}
    };
    const auto formatted = FormatErrorGccStyle(
        "solution.hpp:4:16: error: 'undefinedThing' was not declared in this scope", sources);

    EXPECT_EQ(formatted.rfind("solution.hpp: In function 'vector<int> twoSum(vector<int>& nums, int target)':", 0), 0u);
}

TEST(GccFormatterTest, ExpandsTabsToFourColumnStops) {
    EXPECT_EQ(ExpandedColumn("\tx", 2), 5);
    EXPECT_EQ(ExpandedColumn("ab\tx", 4), 5);
    EXPECT_EQ(ExpandedColumn("abcd", 3), 3);

    const std::map<std::string, std::string> sources = {
        {"main.cpp", "int main() {\n\tfoo();\n}\n"}
    };
    const auto formatted = FormatErrorGccStyle("main.cpp:2:2: error: 'foo' was not declared in this scope", sources);
    EXPECT_NE(formatted.find("    2 |     foo();\n      |     ^"), std::string::npos);
}

TEST(GccFormatterTest, AlreadyFormattedTextPassesThrough) {
    const std::string text =
        "main.cpp: In function 'int main()':\n"
        "main.cpp:3:13: error: expected ';' before '}' token\n"
        "    3 |     return 0\n"
        "      |             ^\n";
    EXPECT_EQ(FormatErrorGccStyle(text, {{"main.cpp", "x"}}), socrates::utils::TrimRight(text));
}

TEST(GccFormatterTest, UnknownFilesAndOtherLinesPassThrough) {
    const std::string text =
        "collect2: error: ld returned 1 exit status\n"
        "other.cpp:1:1: error: something";
    EXPECT_EQ(FormatErrorGccStyle(text, {}), text);
}

}  // namespace
