#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace agentrun::sandbox {

struct BootstrapOptions {
    std::string mount_point = "/workspace";
    bool has_files = false;
};

// Python entry script executed inside the container. It loads agent.py,
// checks for agent_main, runs it, derives the patch and always writes
// output.json before exiting 0.
std::string BuildBootstrapScript(const BootstrapOptions& options);

// Contents of input.json read by the bootstrap script.
nlohmann::json BuildInputDocument(const std::string& problem_statement,
                                  const std::string& run_id,
                                  const std::string& proxy_url);

// Dependency manifest installed before the agent runs.
const std::string& DefaultRequirements();

}  // namespace agentrun::sandbox
