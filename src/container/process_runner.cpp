#include "container/process_runner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>
#include <system_error>
#include <sys/wait.h>

namespace socrates::container {
namespace bp = boost::process;
namespace {

boost::filesystem::path ResolveProgram(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return boost::filesystem::path(program);
    }
    return bp::search_path(program);
}

int DecodeStatus(int native_status) {
    if (WIFEXITED(native_status)) {
        return WEXITSTATUS(native_status);
    }
    if (WIFSIGNALED(native_status)) {
        return 128 + WTERMSIG(native_status);
    }
    return -1;
}

}  // namespace

ProcessResult ProcessRunner::Run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    ProcessResult result{};
    const auto executable = ResolveProgram(program);
    if (executable.empty()) {
        result.launch_failed = true;
        result.error = "Error: executable not found: " + program;
        return result;
    }

    // The pipes close when the child exits, so draining them on a worker
    // thread doubles as the wait. The deadline is enforced on that drain.
    boost::asio::io_context io;
    std::future<std::string> output;
    std::future<std::string> error;

    try {
        bp::child child_process(
            executable,
            bp::args(args),
            bp::std_in.close(),
            bp::std_out > output,
            bp::std_err > error,
            io);

        auto drain = std::async(std::launch::async, [&io] { io.run(); });
        if (drain.wait_for(timeout) == std::future_status::timeout) {
            result.timed_out = true;
            std::error_code kill_error;
            child_process.terminate(kill_error);
        }
        drain.get();

        std::error_code wait_error;
        child_process.wait(wait_error);
        result.exit_code = result.timed_out ? 124 : DecodeStatus(child_process.native_exit_code());
        result.output = output.get();
        result.error = error.get();
    } catch (const bp::process_error& ex) {
        result.launch_failed = true;
        result.exit_code = -1;
        result.error = std::string("Error: exec failed: ") + ex.what();
    }
    return result;
}

}  // namespace socrates::container
