#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/command_runner.hpp"
#include "sandbox/container_runtime.hpp"

namespace agentrun::sandbox {

// Drives containers through the docker CLI.
class DockerRuntime : public ContainerRuntime {
public:
    DockerRuntime(CommandRunner& runner,
                  std::string docker_binary,
                  std::chrono::seconds command_timeout);

    LaunchResult Launch(const ContainerSpec& spec) override;
    ContainerStatus Inspect(const std::string& container_id) override;
    std::string Logs(const std::string& container_id) override;
    bool Stop(const std::string& container_id) override;
    bool Remove(const std::string& container_id) override;
    agentrun::errors::Error CheckNetwork(const std::string& network) override;

    std::vector<std::string> BuildRunArguments(const ContainerSpec& spec) const;
    static ContainerState ParseState(const std::string& value);

private:
    CommandResult Docker(std::vector<std::string> args, bool merge_output = false);

    CommandRunner& runner_;
    std::string docker_binary_;
    std::chrono::seconds command_timeout_;
};

}  // namespace agentrun::sandbox
