#pragma once

#include <map>
#include <optional>
#include <string>

#include "errors/errors.hpp"

namespace agentrun::sandbox {

struct ContainerSpec {
    std::string name;
    std::string image;
    std::string command;
    std::string workspace_dir;
    std::string mount_point = "/workspace";
    std::string memory_limit;
    double cpu_limit = 1.0;
    std::string network;
    std::map<std::string, std::string> environment;
};

enum class ContainerState {
    kCreated,
    kRunning,
    kExited,
    kDead,
    kMissing,
    kUnknown
};

struct ContainerStatus {
    ContainerState state = ContainerState::kUnknown;
    int exit_code = -1;
};

inline bool IsFinished(ContainerState state) {
    return state == ContainerState::kExited ||
        state == ContainerState::kDead ||
        state == ContainerState::kMissing;
}

struct LaunchResult {
    std::string container_id;
    agentrun::errors::Error error;
};

// Execution-unit backend used by the sandbox manager.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;
    virtual LaunchResult Launch(const ContainerSpec& spec) = 0;
    virtual ContainerStatus Inspect(const std::string& container_id) = 0;
    // Combined stdout and stderr of the container.
    virtual std::string Logs(const std::string& container_id) = 0;
    virtual bool Stop(const std::string& container_id) = 0;
    // Force-removes the container, killing it if it is still running.
    virtual bool Remove(const std::string& container_id) = 0;
    // Error unless the network exists and is internal (no external route).
    virtual agentrun::errors::Error CheckNetwork(const std::string& network) = 0;
};

}  // namespace agentrun::sandbox
