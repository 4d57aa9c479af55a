#pragma once

#include <map>
#include <string>

namespace socrates::diagnostics {

// Rebuilds GCC's excerpt layout (function context, gutter, caret, fix-it)
// for bare "<file>:<line>:<col>: error: ..." lines, using the sources that
// were actually compiled. Text that already carries excerpts comes back
// cleaned but otherwise untouched.
std::string FormatErrorGccStyle(const std::string& text,
                                const std::map<std::string, std::string>& source_by_file);

// Visual column of a 1-indexed byte column with tabs at 4-space stops.
int ExpandedColumn(const std::string& line, int column);

}  // namespace socrates::diagnostics
