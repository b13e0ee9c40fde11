#include "sandbox/docker_runtime.hpp"

#include <cmath>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentrun::sandbox {
namespace {

constexpr long kCpuPeriod = 100000;

std::string FirstLine(const std::string& text) {
    const auto trimmed = agentrun::utils::Trim(text);
    const auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

}  // namespace

DockerRuntime::DockerRuntime(CommandRunner& runner,
                             std::string docker_binary,
                             std::chrono::seconds command_timeout)
    : runner_(runner)
    , docker_binary_(std::move(docker_binary))
    , command_timeout_(command_timeout) {}

std::vector<std::string> DockerRuntime::BuildRunArguments(const ContainerSpec& spec) const {
    std::vector<std::string> args = {"run", "--detach"};
    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    args.insert(args.end(), {"--workdir", spec.mount_point});
    args.insert(args.end(), {"--volume", spec.workspace_dir + ":" + spec.mount_point + ":rw"});
    if (!spec.memory_limit.empty()) {
        args.insert(args.end(), {"--memory", spec.memory_limit});
    }
    if (spec.cpu_limit > 0.0) {
        const auto quota = static_cast<long>(std::llround(spec.cpu_limit * kCpuPeriod));
        args.insert(args.end(), {"--cpu-period", std::to_string(kCpuPeriod)});
        args.insert(args.end(), {"--cpu-quota", std::to_string(quota)});
    }
    if (!spec.network.empty()) {
        args.insert(args.end(), {"--network", spec.network});
    }
    for (const auto& [key, value] : spec.environment) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }
    args.push_back(spec.image);
    args.insert(args.end(), {"bash", "-c", spec.command});
    return args;
}

LaunchResult DockerRuntime::Launch(const ContainerSpec& spec) {
    LaunchResult launch{};
    const auto result = Docker(BuildRunArguments(spec));
    if (result.launch_failed || result.timed_out || result.exit_code != 0) {
        std::ostringstream message;
        message << "docker run failed";
        if (result.timed_out) {
            message << " (timed out)";
        } else {
            message << " (exit " << result.exit_code << ")";
        }
        const auto detail = agentrun::utils::Trim(result.error);
        if (!detail.empty()) {
            message << ": " << detail;
        }
        launch.error = agentrun::errors::MakeError(agentrun::errors::ErrorKind::kExecution, message.str());
        return launch;
    }
    launch.container_id = FirstLine(result.output);
    if (launch.container_id.empty()) {
        launch.error = agentrun::errors::MakeError(
            agentrun::errors::ErrorKind::kExecution, "docker run returned no container id");
    }
    return launch;
}

ContainerStatus DockerRuntime::Inspect(const std::string& container_id) {
    ContainerStatus status{};
    const auto result = Docker({"inspect", "--format", "{{.State.Status}} {{.State.ExitCode}}", container_id});
    if (result.exit_code != 0) {
        if (result.error.find("No such") != std::string::npos) {
            status.state = ContainerState::kMissing;
        }
        return status;
    }
    std::istringstream stream(FirstLine(result.output));
    std::string state;
    int exit_code = -1;
    stream >> state >> exit_code;
    status.state = ParseState(state);
    status.exit_code = exit_code;
    return status;
}

std::string DockerRuntime::Logs(const std::string& container_id) {
    const auto result = Docker({"logs", container_id}, true);
    if (result.exit_code != 0) {
        agentrun::utils::LogWarn("sandbox", "docker logs failed for " + container_id);
    }
    return result.output;
}

bool DockerRuntime::Stop(const std::string& container_id) {
    return Docker({"stop", "--time", "5", container_id}).exit_code == 0;
}

bool DockerRuntime::Remove(const std::string& container_id) {
    return Docker({"rm", "--force", container_id}).exit_code == 0;
}

agentrun::errors::Error DockerRuntime::CheckNetwork(const std::string& network) {
    const auto result = Docker({"network", "inspect", "--format", "{{.Internal}}", network});
    if (result.launch_failed || result.timed_out || result.exit_code != 0) {
        return agentrun::errors::MakeError(
            agentrun::errors::ErrorKind::kExecution,
            "docker network " + network + " is not available: " + agentrun::utils::Trim(result.error));
    }
    if (FirstLine(result.output) != "true") {
        return agentrun::errors::MakeError(
            agentrun::errors::ErrorKind::kExecution,
            "docker network " + network + " is not internal; create it with `docker network create --internal`");
    }
    return {};
}

ContainerState DockerRuntime::ParseState(const std::string& value) {
    if (value == "created") {
        return ContainerState::kCreated;
    }
    if (value == "running" || value == "restarting" || value == "paused") {
        return ContainerState::kRunning;
    }
    if (value == "exited") {
        return ContainerState::kExited;
    }
    if (value == "dead") {
        return ContainerState::kDead;
    }
    return ContainerState::kUnknown;
}

CommandResult DockerRuntime::Docker(std::vector<std::string> args, bool merge_output) {
    CommandRequest request{};
    request.argv.reserve(args.size() + 1);
    request.argv.push_back(docker_binary_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.timeout = command_timeout_;
    request.merge_output = merge_output;
    return runner_.Run(request);
}

}  // namespace agentrun::sandbox
