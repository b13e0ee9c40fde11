#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace agentrun::sandbox {

struct CommandRequest {
    std::vector<std::string> argv;
    std::chrono::seconds timeout{60};
    // Send stderr into the same stream as stdout, preserving interleaving.
    bool merge_output = false;
};

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    bool launch_failed = false;
    std::string output;
    std::string error;
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult Run(const CommandRequest& request) = 0;
};

// Runs argv directly (no shell) and kills it once the timeout expires.
class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult Run(const CommandRequest& request) override;
};

}  // namespace agentrun::sandbox
