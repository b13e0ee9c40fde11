#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "catalog/agent_catalog.hpp"
#include "proxy/proxy_client.hpp"
#include "proxy/upstream_client.hpp"
#include "runs/run_registry.hpp"
#include "sandbox/command_runner.hpp"
#include "sandbox/container_runtime.hpp"

namespace agentrun::testing {

// How a fake container behaves once launched.
struct ContainerBehavior {
    int exit_code = 0;
    bool never_finish = false;
    int finish_after_polls = 1;
    std::string logs;
    // Written to <workspace>/output.json at launch when set.
    std::optional<std::string> output_document;
    bool fail_launch = false;
};

class FakeContainerRuntime : public agentrun::sandbox::ContainerRuntime {
public:
    ContainerBehavior default_behavior;
    // Keyed by run id (container name without the "agentrun_" prefix).
    std::map<std::string, ContainerBehavior> behaviors;
    std::function<void(const agentrun::sandbox::ContainerSpec&)> on_launch;
    std::atomic<int> inspect_calls{0};
    std::atomic<bool> remove_throws{false};
    // Stop() blocks this long, like `docker stop --time`.
    std::chrono::milliseconds stop_delay{0};
    // Returned by CheckNetwork.
    agentrun::errors::Error network_error;
    std::vector<std::string> checked_networks;

    agentrun::sandbox::LaunchResult Launch(const agentrun::sandbox::ContainerSpec& spec) override {
        const auto behavior = BehaviorFor(spec.name);
        if (on_launch) {
            on_launch(spec);
        }
        agentrun::sandbox::LaunchResult result{};
        if (behavior.fail_launch) {
            result.error = agentrun::errors::MakeError(agentrun::errors::ErrorKind::kExecution, "launch refused");
            return result;
        }
        if (behavior.output_document.has_value()) {
            std::ofstream output(std::filesystem::path(spec.workspace_dir) / "output.json");
            output << *behavior.output_document;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        result.container_id = "cid-" + spec.name;
        launched_.push_back(spec);
        containers_[result.container_id] = State{behavior, 0, false};
        return result;
    }

    agentrun::sandbox::ContainerStatus Inspect(const std::string& container_id) override {
        inspect_calls.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        agentrun::sandbox::ContainerStatus status{};
        auto it = containers_.find(container_id);
        if (it == containers_.end() || it->second.removed) {
            status.state = agentrun::sandbox::ContainerState::kMissing;
            return status;
        }
        auto& state = it->second;
        ++state.polls;
        if (!state.behavior.never_finish && state.polls >= state.behavior.finish_after_polls) {
            status.state = agentrun::sandbox::ContainerState::kExited;
            status.exit_code = state.behavior.exit_code;
            return status;
        }
        status.state = agentrun::sandbox::ContainerState::kRunning;
        return status;
    }

    std::string Logs(const std::string& container_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        return it == containers_.end() ? std::string() : it->second.behavior.logs;
    }

    bool Stop(const std::string& container_id) override {
        if (stop_delay.count() > 0) {
            std::this_thread::sleep_for(stop_delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.push_back(container_id);
        return true;
    }

    bool Remove(const std::string& container_id) override {
        if (remove_throws.load()) {
            throw std::runtime_error("docker daemon went away");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        removed_.push_back(container_id);
        auto it = containers_.find(container_id);
        if (it == containers_.end() || it->second.removed) {
            return false;
        }
        it->second.removed = true;
        return true;
    }

    agentrun::errors::Error CheckNetwork(const std::string& network) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checked_networks.push_back(network);
        return network_error;
    }

    std::vector<agentrun::sandbox::ContainerSpec> Launched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return launched_;
    }

    std::vector<std::string> Stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    std::vector<std::string> Removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    bool WasRemoved(const std::string& container_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = containers_.find(container_id);
        return it != containers_.end() && it->second.removed;
    }

private:
    struct State {
        ContainerBehavior behavior;
        int polls = 0;
        bool removed = false;
    };

    ContainerBehavior BehaviorFor(const std::string& name) const {
        const std::string prefix = "agentrun_";
        const auto run_id = name.rfind(prefix, 0) == 0 ? name.substr(prefix.size()) : name;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = behaviors.find(run_id);
        return it == behaviors.end() ? default_behavior : it->second;
    }

    mutable std::mutex mutex_;
    std::map<std::string, State> containers_;
    std::vector<agentrun::sandbox::ContainerSpec> launched_;
    std::vector<std::string> stopped_;
    std::vector<std::string> removed_;
};

class FakeRegistrar : public agentrun::proxy::ProxyRegistrar {
public:
    bool fail_register = false;

    bool Register(const std::string& run_id,
                  const std::string& inference_url,
                  const std::string& api_key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        registered_.push_back(run_id);
        last_inference_url_ = inference_url;
        last_api_key_ = api_key;
        return !fail_register;
    }

    bool Unregister(const std::string& run_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        unregistered_.push_back(run_id);
        return true;
    }

    std::vector<std::string> Registered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registered_;
    }

    std::vector<std::string> Unregistered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return unregistered_;
    }

    std::string LastInferenceUrl() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_inference_url_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> registered_;
    std::vector<std::string> unregistered_;
    std::string last_inference_url_;
    std::string last_api_key_;
};

class FakeCatalog : public agentrun::catalog::AgentCatalog {
public:
    std::vector<agentrun::catalog::AgentInfo> agents;
    std::map<std::string, std::filesystem::path> artifacts;
    std::optional<agentrun::errors::Error> fetch_error;
    int last_num_agents = 0;
    // Runs at the start of ResolveArtifact.
    std::function<void(const std::string&)> on_resolve;

    agentrun::catalog::AgentListResult FetchTopAgents(int num_agents) override {
        last_num_agents = num_agents;
        agentrun::catalog::AgentListResult result{};
        if (fetch_error.has_value()) {
            result.error = *fetch_error;
            return result;
        }
        for (const auto& agent : agents) {
            if (static_cast<int>(result.agents.size()) >= num_agents) {
                break;
            }
            result.agents.push_back(agent);
        }
        return result;
    }

    agentrun::catalog::AgentLookupResult GetAgent(const std::string& version_id) override {
        agentrun::catalog::AgentLookupResult result{};
        for (const auto& agent : agents) {
            if (agent.version_id == version_id) {
                result.agent = agent;
                return result;
            }
        }
        result.error = agentrun::errors::MakeError(
            agentrun::errors::ErrorKind::kNotFound, "Agent " + version_id + " not found");
        return result;
    }

    agentrun::catalog::ArtifactResult ResolveArtifact(const std::string& version_id) override {
        if (on_resolve) {
            on_resolve(version_id);
        }
        agentrun::catalog::ArtifactResult result{};
        auto it = artifacts.find(version_id);
        if (it == artifacts.end()) {
            result.error = agentrun::errors::MakeError(
                agentrun::errors::ErrorKind::kUpstreamFetch, "HTTP 404 for " + version_id);
            return result;
        }
        result.path = it->second;
        return result;
    }
};

class FakeUpstream : public agentrun::proxy::UpstreamClient {
public:
    agentrun::proxy::UpstreamResponse response;
    std::string last_url;
    std::map<std::string, std::string> last_headers;
    std::string last_body;
    int calls = 0;

    agentrun::proxy::UpstreamResponse PostJson(const std::string& url,
                                               const std::map<std::string, std::string>& headers,
                                               const std::string& body) override {
        ++calls;
        last_url = url;
        last_headers = headers;
        last_body = body;
        return response;
    }
};

// Records docker invocations and replies from a queue of canned results.
class RecordingCommandRunner : public agentrun::sandbox::CommandRunner {
public:
    std::vector<agentrun::sandbox::CommandRequest> requests;
    std::vector<agentrun::sandbox::CommandResult> replies;

    agentrun::sandbox::CommandResult Run(const agentrun::sandbox::CommandRequest& request) override {
        requests.push_back(request);
        if (replies.empty()) {
            agentrun::sandbox::CommandResult ok{};
            ok.exit_code = 0;
            return ok;
        }
        auto reply = replies.front();
        replies.erase(replies.begin());
        return reply;
    }
};

inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline std::filesystem::path MakeTempDir(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() /
                (name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(path);
    return path;
}

inline void WriteTextFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path);
    output << content;
}

}  // namespace agentrun::testing
