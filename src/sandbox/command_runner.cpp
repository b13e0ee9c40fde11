#include "sandbox/command_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agentrun::sandbox {
namespace bp = boost::process;

namespace {

std::filesystem::path CaptureFilePath(const char* stream) {
    static std::atomic<unsigned long long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) +
        "_" + std::to_string(counter.fetch_add(1));
    return std::filesystem::temp_directory_path() /
        ("agentrun_" + std::string(stream) + "_" + std::to_string(::getpid()) + "_" + stamp + ".log");
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

CommandResult ProcessCommandRunner::Run(const CommandRequest& request) {
    CommandResult result{};
    if (request.argv.empty()) {
        result.launch_failed = true;
        result.error = "empty command";
        return result;
    }

    auto executable = bp::search_path(request.argv.front());
    if (executable.empty()) {
        result.launch_failed = true;
        result.error = "executable not found: " + request.argv.front();
        return result;
    }
    const std::vector<std::string> args(request.argv.begin() + 1, request.argv.end());

    const auto stdout_path = CaptureFilePath("stdout");
    const auto stderr_path = CaptureFilePath("stderr");

    try {
        bp::child child_process = request.merge_output
            ? bp::child(
                bp::exe = executable,
                bp::args = args,
                (bp::std_out & bp::std_err) > stdout_path.string(),
                bp::std_in < bp::null)
            : bp::child(
                bp::exe = executable,
                bp::args = args,
                bp::std_out > stdout_path.string(),
                bp::std_err > stderr_path.string(),
                bp::std_in < bp::null);

        const auto deadline = std::chrono::steady_clock::now() + request.timeout;
        bool finished = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (std::chrono::steady_clock::now() < deadline) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < grace_deadline) {
                const auto waited = ::waitpid(pid, &status, WNOHANG);
                if (waited == pid) {
                    finished = true;
                    break;
                }
                if (waited < 0) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!finished) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        child_process.detach();

        if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        }
        if (result.timed_out && result.exit_code == -1) {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        result.launch_failed = true;
        result.exit_code = -1;
        result.error = std::string("exec failed: ") + ex.what();
    }

    if (!result.launch_failed) {
        result.output = ReadFile(stdout_path);
        if (!request.merge_output) {
            result.error = ReadFile(stderr_path);
        }
    }

    std::error_code ec;
    std::filesystem::remove(stdout_path, ec);
    std::filesystem::remove(stderr_path, ec);
    return result;
}

}  // namespace agentrun::sandbox
