#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "errors/errors.hpp"
#include "nlohmann/json.hpp"
#include "proxy/proxy_client.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/workspace.hpp"

namespace agentrun::sandbox {

struct SandboxSettings {
    std::string image = "agentrun-sandbox:py3.11";
    // Internal docker network shared only with the proxy. Run() refuses an empty one.
    std::string network = "agentrun_sandbox";
    std::string memory_limit = "2g";
    double cpu_limit = 2.0;
    std::chrono::milliseconds timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds poll_interval{1000};
    std::filesystem::path workspace_root;
    std::string setup_command;
    // Proxy address as seen from inside the sandbox network.
    std::string proxy_internal_url;

    static SandboxSettings FromConfig(const agentrun::config::Config& config);
};

struct SandboxRequest {
    std::string run_id;
    std::filesystem::path agent_path;
    std::string problem_statement;
    std::string inference_url;
    std::string api_key;
    FileMap files;
};

enum class SandboxOutcome {
    kCompleted,
    kTimeout,
    kCancelled,
    kError
};

const char* ToString(SandboxOutcome outcome);

struct SandboxResult {
    SandboxOutcome outcome = SandboxOutcome::kError;
    // The execution unit ran to completion with exit code 0.
    bool success = false;
    nlohmann::json output = nlohmann::json::object();
    std::vector<std::string> logs;
    int exit_code = -1;
    double execution_time = 0.0;
    agentrun::errors::Error error;
};

// Runs one container per request and owns its workspace, container handle
// and proxy registration until Run() returns.
class SandboxManager {
public:
    SandboxManager(SandboxSettings settings,
                   ContainerRuntime& runtime,
                   agentrun::proxy::ProxyRegistrar* registrar);

    // Refuses to launch when no sandbox network is configured.
    SandboxResult Run(const SandboxRequest& request);

    // Checks that the configured network exists and has no route out.
    agentrun::errors::Error VerifyIsolation();

    // Force-stops a tracked run. No-op for unknown run ids.
    void Stop(const std::string& run_id);
    // Stops admitting runs; Run() returns kCancelled from then on.
    void Close();
    void CleanupAll();

    std::size_t ActiveCount() const;
    bool IsTracked(const std::string& run_id) const;
    const SandboxSettings& Settings() const { return settings_; }

private:
    struct TrackedUnit {
        std::string container_id;
        std::shared_ptr<std::atomic<bool>> cancelled;
    };

    std::shared_ptr<std::atomic<bool>> Track(const std::string& run_id, SandboxResult& refusal);
    bool AttachContainer(const std::string& run_id, const std::string& container_id);
    void Untrack(const std::string& run_id);

    agentrun::errors::Error PrepareWorkspace(Workspace& workspace, const SandboxRequest& request) const;
    void RegisterWithProxy(const SandboxRequest& request);
    ContainerSpec BuildContainerSpec(const Workspace& workspace, const SandboxRequest& request) const;
    nlohmann::json CollectOutput(const Workspace& workspace, const std::string& logs) const;

    SandboxSettings settings_;
    ContainerRuntime& runtime_;
    agentrun::proxy::ProxyRegistrar* registrar_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, TrackedUnit> tracked_;
    bool closed_ = false;
};

}  // namespace agentrun::sandbox
