#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "catalog/agent_catalog.hpp"
#include "runs/run_registry.hpp"
#include "runs/work_queue.hpp"
#include "sandbox/sandbox_manager.hpp"

namespace agentrun::runs {

struct SubmitRequest {
    std::string agent_id;
    std::string problem_statement;
    std::string inference_url;
    std::string api_key;
    std::optional<agentrun::sandbox::FileMap> files;
};

// Accepts runs, resolves their agent, and hands them to the worker pool.
// Submission is synchronous up to queueing; execution happens on a worker.
class RunService {
public:
    RunService(RunRegistry& registry,
               agentrun::catalog::AgentCatalog& catalog,
               agentrun::sandbox::SandboxManager& sandbox,
               WorkQueue& queue);

    // Returns the record as it stands after submission: Queued on success,
    // Failed when validation, agent resolution or queueing failed.
    Run Submit(const SubmitRequest& request);

    std::optional<Run> Get(const std::string& run_id) const;
    std::vector<Run> List(std::optional<RunStatus> status, std::size_t limit) const;
    // False when the run does not exist.
    bool Delete(const std::string& run_id);

    // Discards queued runs, stops every sandbox and joins the worker pool.
    void Shutdown();

private:
    void Execute(const agentrun::sandbox::SandboxRequest& request);
    Run FailBeforeExecution(const Run& run, const std::string& error);
    Run Snapshot(const Run& last_known) const;

    RunRegistry& registry_;
    agentrun::catalog::AgentCatalog& catalog_;
    agentrun::sandbox::SandboxManager& sandbox_;
    WorkQueue& queue_;
};

}  // namespace agentrun::runs
