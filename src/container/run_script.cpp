#include "container/run_script.hpp"

#include <set>
#include <sstream>
#include <stdexcept>

namespace socrates::container {

const std::string& RunScript::Template() {
    static const std::string kTemplate =
        "cd {{workdir}}\n"
        "timeout {{compile_timeout}} {{compile_command}} -o {{binary}} {{source}} 2>&1\n"
        "COMPILE_EXIT=$?\n"
        "if [ $COMPILE_EXIT -eq 0 ]; then\n"
        "  timeout --verbose {{run_timeout}} sh -c 'exec \"$0\" 2>&1' {{binary}} 2>{{timeout_log}}\n"
        "  RUN_EXIT=$?\n"
        "  if [ -s {{timeout_log}} ]; then echo; echo \"TIMED_OUT\"; fi\n"
        "  echo \"EXIT_CODE:$RUN_EXIT\"\n"
        "else\n"
        "  if [ $COMPILE_EXIT -eq 124 ]; then echo; echo \"TIMED_OUT\"; fi\n"
        "  echo \"EXIT_CODE:$COMPILE_EXIT\"\n"
        "fi";
    return kTemplate;
}

std::string RunScript::Render(const std::map<std::string, std::string>& slots) {
    const auto& source = Template();
    std::ostringstream out;
    std::set<std::string> used;
    std::string::size_type pos = 0;
    while (true) {
        const auto open = source.find("{{", pos);
        if (open == std::string::npos) {
            out << source.substr(pos);
            break;
        }
        const auto close = source.find("}}", open);
        if (close == std::string::npos) {
            throw std::invalid_argument("run script template has an unterminated slot");
        }
        const auto name = source.substr(open + 2, close - open - 2);
        const auto it = slots.find(name);
        if (it == slots.end()) {
            throw std::invalid_argument("run script slot has no value: " + name);
        }
        out << source.substr(pos, open - pos) << it->second;
        used.insert(name);
        pos = close + 2;
    }
    for (const auto& [name, _] : slots) {
        if (used.find(name) == used.end()) {
            throw std::invalid_argument("run script has no slot named " + name);
        }
    }
    return out.str();
}

std::map<std::string, std::string> RunScript::SlotsFor(const config::ExecutionSpec& spec) {
    return {
        {"workdir", kWorkspaceMount},
        {"compile_command", spec.compile_command},
        {"source", "main.cpp"},
        {"binary", std::string(kScratchPath) + "/main"},
        {"timeout_log", std::string(kScratchPath) + "/timeout.log"},
        {"compile_timeout", FormatTimeout(spec.compile_timeout)},
        {"run_timeout", FormatTimeout(spec.run_timeout)}
    };
}

std::string FormatTimeout(std::chrono::milliseconds timeout) {
    const auto millis = timeout.count() < 1 ? 1 : timeout.count();
    if (millis % 1000 == 0) {
        return std::to_string(millis / 1000) + "s";
    }
    std::ostringstream oss;
    oss << millis / 1000 << ".";
    const auto fraction = std::to_string(millis % 1000);
    oss << std::string(3 - fraction.size(), '0') << fraction << "s";
    return oss.str();
}

}  // namespace socrates::container
