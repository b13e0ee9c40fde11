#include "sandbox/sandbox_manager.hpp"

#include <fstream>
#include <functional>
#include <sstream>
#include <thread>
#include <utility>

#include "output/output_extractor.hpp"
#include "sandbox/bootstrap_script.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentrun::sandbox {
namespace {

using agentrun::errors::ErrorKind;
using agentrun::errors::MakeError;

constexpr const char* kTag = "sandbox";

// Runs each registered step on scope exit. A throwing step is logged and the
// remaining steps still run.
class TeardownGuard {
public:
    explicit TeardownGuard(std::string run_id)
        : run_id_(std::move(run_id)) {}

    ~TeardownGuard() {
        for (auto& [name, step] : steps_) {
            try {
                step();
            } catch (const std::exception& ex) {
                agentrun::utils::LogWarn(
                    kTag, "teardown step '" + name + "' failed for run " + run_id_ + ": " + ex.what());
            }
        }
    }

    TeardownGuard(const TeardownGuard&) = delete;
    TeardownGuard& operator=(const TeardownGuard&) = delete;

    void Add(std::string name, std::function<void()> step) {
        steps_.emplace_back(std::move(name), std::move(step));
    }

private:
    std::string run_id_;
    std::vector<std::pair<std::string, std::function<void()>>> steps_;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace

SandboxSettings SandboxSettings::FromConfig(const agentrun::config::Config& config) {
    SandboxSettings settings{};
    settings.image = config.sandbox.image;
    settings.network = config.sandbox.network;
    settings.memory_limit = config.sandbox.memory_limit;
    settings.cpu_limit = config.sandbox.cpu_limit;
    settings.timeout = std::chrono::seconds(config.sandbox.timeout_s);
    settings.poll_interval = std::chrono::milliseconds(config.sandbox.poll_interval_ms);
    settings.workspace_root = config.sandbox.workspace_root;
    settings.setup_command = config.sandbox.setup_command;
    settings.proxy_internal_url = config.proxy.internal_url;
    return settings;
}

const char* ToString(SandboxOutcome outcome) {
    switch (outcome) {
        case SandboxOutcome::kCompleted: return "completed";
        case SandboxOutcome::kTimeout: return "timeout";
        case SandboxOutcome::kCancelled: return "cancelled";
        case SandboxOutcome::kError: return "error";
    }
    return "unknown";
}

SandboxManager::SandboxManager(SandboxSettings settings,
                               ContainerRuntime& runtime,
                               agentrun::proxy::ProxyRegistrar* registrar)
    : settings_(std::move(settings))
    , runtime_(runtime)
    , registrar_(registrar) {}

SandboxResult SandboxManager::Run(const SandboxRequest& request) {
    SandboxResult result{};
    const auto& run_id = request.run_id;

    if (settings_.network.empty()) {
        agentrun::utils::LogError(kTag, "refusing to start run " + run_id + ": no sandbox network configured");
        result.error = MakeError(ErrorKind::kExecution, "sandbox network is not configured");
        return result;
    }

    auto cancelled = Track(run_id, result);
    if (!cancelled) {
        return result;
    }

    // Declared before the guard so the workspace outlives every teardown step.
    std::unique_ptr<Workspace> workspace;
    std::string container_id;
    bool registered = false;

    TeardownGuard teardown(run_id);
    teardown.Add("untrack", [this, &run_id]() { Untrack(run_id); });
    teardown.Add("remove container", [this, &container_id, &run_id]() {
        if (!container_id.empty()) {
            if (!runtime_.Remove(container_id)) {
                agentrun::utils::LogDebug(kTag, "container for run " + run_id + " already gone");
            }
        }
    });
    teardown.Add("unregister proxy", [this, &registered, &run_id]() {
        if (registered && registrar_ != nullptr) {
            registrar_->Unregister(run_id);
        }
    });
    teardown.Add("remove workspace", [&workspace]() {
        if (workspace) {
            workspace->Remove();
        }
    });

    try {
        agentrun::errors::Error error;
        workspace = Workspace::Create(settings_.workspace_root, run_id, error);
        if (!workspace) {
            result.error = error;
            return result;
        }
        agentrun::utils::LogInfo(kTag, "workspace for run " + run_id + ": " + workspace->Path().string());

        error = PrepareWorkspace(*workspace, request);
        if (error) {
            result.error = error;
            return result;
        }

        if (registrar_ != nullptr) {
            RegisterWithProxy(request);
            registered = true;
        }

        if (cancelled->load()) {
            result.outcome = SandboxOutcome::kCancelled;
            result.error = MakeError(ErrorKind::kExecution, "run cancelled before launch");
            return result;
        }

        const auto launch = runtime_.Launch(BuildContainerSpec(*workspace, request));
        if (launch.error) {
            result.error = launch.error;
            return result;
        }
        container_id = launch.container_id;
        if (!AttachContainer(run_id, container_id)) {
            // Stop() ran between launch and attach.
            result.outcome = SandboxOutcome::kCancelled;
            result.error = MakeError(ErrorKind::kExecution, "run cancelled during launch");
            return result;
        }
        agentrun::utils::LogInfo(
            kTag, "container " + container_id.substr(0, 12) + " started for run " + run_id);

        const auto started = std::chrono::steady_clock::now();
        const auto deadline = started + settings_.timeout;
        ContainerStatus status{};
        bool finished = false;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancelled->load()) {
                break;
            }
            status = runtime_.Inspect(container_id);
            if (IsFinished(status.state)) {
                finished = true;
                break;
            }
            std::this_thread::sleep_for(settings_.poll_interval);
        }
        result.execution_time = SecondsSince(started);

        if (cancelled->load()) {
            result.outcome = SandboxOutcome::kCancelled;
            result.error = MakeError(ErrorKind::kExecution, "run cancelled");
            return result;
        }

        if (!finished) {
            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(settings_.timeout).count();
            agentrun::utils::LogError(kTag, "container for run " + run_id + " timed out");
            result.logs = agentrun::utils::SplitLines(runtime_.Logs(container_id));
            runtime_.Remove(container_id);
            result.outcome = SandboxOutcome::kTimeout;
            result.error = MakeError(
                ErrorKind::kExecutionTimeout,
                "Execution timed out after " + std::to_string(seconds) + " seconds");
            return result;
        }

        if (status.state == ContainerState::kMissing) {
            result.error = MakeError(ErrorKind::kExecution, "container disappeared before completion");
            return result;
        }

        const auto logs = runtime_.Logs(container_id);
        agentrun::utils::LogDebug(kTag, "logs preview for " + run_id + ": " + logs.substr(0, 500));
        result.logs = agentrun::utils::SplitLines(logs);
        result.output = CollectOutput(*workspace, logs);
        result.exit_code = status.exit_code;
        result.success = status.exit_code == 0;
        result.outcome = SandboxOutcome::kCompleted;
        if (!result.success) {
            result.error = MakeError(
                ErrorKind::kExecution,
                "container exited with code " + std::to_string(status.exit_code));
        }
        return result;
    } catch (const std::exception& ex) {
        agentrun::utils::LogError(kTag, "error running agent for " + run_id + ": " + ex.what());
        result.outcome = SandboxOutcome::kError;
        result.success = false;
        result.error = MakeError(ErrorKind::kExecution, ex.what());
        return result;
    }
}

void SandboxManager::Stop(const std::string& run_id) {
    std::string container_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tracked_.find(run_id);
        if (it == tracked_.end()) {
            return;
        }
        it->second.cancelled->store(true);
        container_id = it->second.container_id;
        tracked_.erase(it);
    }
    agentrun::utils::LogInfo(kTag, "stopping run " + run_id);
    if (!container_id.empty()) {
        runtime_.Stop(container_id);
        runtime_.Remove(container_id);
    }
}

agentrun::errors::Error SandboxManager::VerifyIsolation() {
    if (settings_.network.empty()) {
        return MakeError(ErrorKind::kExecution, "sandbox network is not configured");
    }
    return runtime_.CheckNetwork(settings_.network);
}

void SandboxManager::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

void SandboxManager::CleanupAll() {
    std::vector<std::string> run_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run_ids.reserve(tracked_.size());
        for (const auto& [run_id, unit] : tracked_) {
            run_ids.push_back(run_id);
        }
    }
    for (const auto& run_id : run_ids) {
        Stop(run_id);
    }
}

std::size_t SandboxManager::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.size();
}

bool SandboxManager::IsTracked(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.find(run_id) != tracked_.end();
}

std::shared_ptr<std::atomic<bool>> SandboxManager::Track(const std::string& run_id, SandboxResult& refusal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        refusal.outcome = SandboxOutcome::kCancelled;
        refusal.error = MakeError(ErrorKind::kExecution, "sandbox manager is shutting down");
        return nullptr;
    }
    if (tracked_.find(run_id) != tracked_.end()) {
        refusal.error = MakeError(ErrorKind::kExecution, "run " + run_id + " is already executing");
        return nullptr;
    }
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    tracked_.emplace(run_id, TrackedUnit{std::string(), cancelled});
    return cancelled;
}

bool SandboxManager::AttachContainer(const std::string& run_id, const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracked_.find(run_id);
    if (it == tracked_.end()) {
        return false;
    }
    it->second.container_id = container_id;
    return true;
}

void SandboxManager::Untrack(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_.erase(run_id);
}

agentrun::errors::Error SandboxManager::PrepareWorkspace(Workspace& workspace,
                                                         const SandboxRequest& request) const {
    auto error = workspace.CopyAgent(request.agent_path);
    if (error) {
        return error;
    }
    error = workspace.WriteFiles(request.files);
    if (error) {
        return error;
    }

    BootstrapOptions options{};
    options.has_files = !request.files.empty();
    error = workspace.WriteText(Workspace::kRunnerFile, BuildBootstrapScript(options));
    if (error) {
        return error;
    }
    const auto input = BuildInputDocument(
        request.problem_statement, request.run_id, settings_.proxy_internal_url);
    error = workspace.WriteText(Workspace::kInputFile, input.dump(2));
    if (error) {
        return error;
    }
    return workspace.WriteText(Workspace::kRequirementsFile, DefaultRequirements());
}

void SandboxManager::RegisterWithProxy(const SandboxRequest& request) {
    try {
        if (!registrar_->Register(request.run_id, request.inference_url, request.api_key)) {
            agentrun::utils::LogWarn(
                kTag, "proxy registration failed for run " + request.run_id + ", continuing with proxy defaults");
        }
    } catch (const std::exception& ex) {
        agentrun::utils::LogWarn(
            kTag, "proxy registration failed for run " + request.run_id + ": " + ex.what());
    }
}

ContainerSpec SandboxManager::BuildContainerSpec(const Workspace& workspace,
                                                 const SandboxRequest& request) const {
    ContainerSpec spec{};
    spec.name = "agentrun_" + request.run_id;
    spec.image = settings_.image;
    spec.command = settings_.setup_command;
    spec.workspace_dir = workspace.Path().string();
    spec.memory_limit = settings_.memory_limit;
    spec.cpu_limit = settings_.cpu_limit;
    spec.network = settings_.network;
    // The inference endpoint stays outside; agents only ever see the proxy.
    spec.environment = {
        {"PYTHONUNBUFFERED", "1"},
        {"AI_PROXY_URL", settings_.proxy_internal_url},
        {"API_KEY", request.api_key}
    };
    return spec;
}

nlohmann::json SandboxManager::CollectOutput(const Workspace& workspace, const std::string& logs) const {
    const auto output_path = workspace.OutputPath();
    std::error_code ec;
    if (std::filesystem::exists(output_path, ec)) {
        auto parsed = nlohmann::json::parse(ReadFile(output_path), nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
        agentrun::utils::LogWarn(kTag, "output document is not valid JSON: " + output_path.string());
    } else {
        agentrun::utils::LogWarn(kTag, "output document missing, extracting from logs");
    }
    return agentrun::output::ExtractOutputFromLogs(logs);
}

}  // namespace agentrun::sandbox
