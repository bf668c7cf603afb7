#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"

namespace pysandbox::sandbox {
namespace bp = boost::process;

namespace {

// Polls until the child is reaped or the deadline passes.
bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status,
               std::chrono::milliseconds interval) {
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(interval);
    }
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

boost::filesystem::path ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return boost::filesystem::path(name);
    }
    return bp::search_path(name);
}

}  // namespace

ProcessResult ProcessRunner::Run(const ProcessOptions& options) {
    ProcessResult result{};
    if (options.argv.empty()) {
        result.error = "exec failed: empty command";
        return result;
    }
    const auto executable = ResolveExecutable(options.argv.front());
    if (executable.empty()) {
        result.error = "exec failed: " + options.argv.front() + " not found";
        return result;
    }

    const auto stamp = utils::NewId();
    const auto stdout_path = std::filesystem::temp_directory_path() / ("pysandbox_stdout_" + stamp + ".log");
    const auto stderr_path = std::filesystem::temp_directory_path() / ("pysandbox_stderr_" + stamp + ".log");
    const std::vector<std::string> args(options.argv.begin() + 1, options.argv.end());
    const auto working_dir = options.working_dir.empty()
        ? std::filesystem::current_path().string()
        : options.working_dir;

    try {
        bp::child child_process(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = working_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string());
        result.launched = true;

        const pid_t pid = child_process.id();
        int status = 0;
        bool finished = WaitUntil(pid, std::chrono::steady_clock::now() + options.timeout, status,
                                  std::chrono::milliseconds(20));
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            finished = WaitUntil(pid, std::chrono::steady_clock::now() + options.grace, status,
                                 std::chrono::milliseconds(20));
            if (!finished) {
                ::kill(pid, SIGKILL);
                finished = ::waitpid(pid, &status, 0) == pid;
            }
        }

        if (finished && !result.timed_out) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        }
        child_process.detach();
    } catch (const bp::process_error& ex) {
        result.launched = false;
        result.error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadFile(stdout_path);
    const auto captured_error = ReadFile(stderr_path);
    if (result.launched) {
        result.error = captured_error;
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace pysandbox::sandbox
