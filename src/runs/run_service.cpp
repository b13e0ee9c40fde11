#include "runs/run_service.hpp"

#include "output/output_extractor.hpp"
#include "sandbox/workspace.hpp"
#include "utils/logging.hpp"

namespace agentrun::runs {
namespace {

constexpr const char* kTag = "runs";

}  // namespace

RunService::RunService(RunRegistry& registry,
                       agentrun::catalog::AgentCatalog& catalog,
                       agentrun::sandbox::SandboxManager& sandbox,
                       WorkQueue& queue)
    : registry_(registry)
    , catalog_(catalog)
    , sandbox_(sandbox)
    , queue_(queue) {}

Run RunService::Submit(const SubmitRequest& request) {
    Run run{};
    run.run_id = agentrun::utils::GenerateUuid();
    run.agent_id = request.agent_id;
    run.problem_statement = request.problem_statement;
    run.created_at = agentrun::utils::Now();
    run.status_history.push_back(RunStatus::Pending);
    registry_.Create(run);
    agentrun::utils::LogInfo(kTag, "run " + run.run_id + " submitted for agent " + run.agent_id);

    agentrun::sandbox::FileMap files;
    if (request.files.has_value()) {
        const auto error = agentrun::sandbox::ValidateFiles(*request.files);
        if (error) {
            return FailBeforeExecution(run, "Invalid files: " + error.message);
        }
        files = *request.files;
        const auto count = files.size();
        registry_.Update(run.run_id, [count](Run& record) { record.files_count = count; });
    }

    const auto artifact = catalog_.ResolveArtifact(request.agent_id);
    if (artifact.error) {
        return FailBeforeExecution(run, "Failed to download agent: " + artifact.error.message);
    }
    const auto agent_path = artifact.path.string();
    registry_.Update(run.run_id, [&agent_path](Run& record) { record.agent_path = agent_path; });

    agentrun::sandbox::SandboxRequest sandbox_request{
        .run_id = run.run_id,
        .agent_path = artifact.path,
        .problem_statement = request.problem_statement,
        .inference_url = request.inference_url,
        .api_key = request.api_key,
        .files = std::move(files)
    };

    const auto& run_id = run.run_id;
    std::optional<Run> queued;
    const bool accepted = queue_.TrySubmit(
        [this, sandbox_request]() { Execute(sandbox_request); },
        [this, &run_id, &queued]() {
            registry_.Transition(run_id, RunStatus::Queued);
            queued = registry_.Get(run_id);
        });
    if (accepted) {
        return queued.has_value() ? *queued : Snapshot(run);
    }
    agentrun::utils::LogWarn(kTag, "run " + run_id + " rejected: work queue full");
    return FailBeforeExecution(
        run, std::string(agentrun::errors::ToString(agentrun::errors::ErrorKind::kQueueFull)) +
                 ": run queue is full, try again later");
}

std::optional<Run> RunService::Get(const std::string& run_id) const {
    return registry_.Get(run_id);
}

std::vector<Run> RunService::List(std::optional<RunStatus> status, std::size_t limit) const {
    return registry_.List(status, limit);
}

bool RunService::Delete(const std::string& run_id) {
    const bool deleted = registry_.Delete(run_id, [this](const std::string& id) { sandbox_.Stop(id); });
    if (deleted) {
        agentrun::utils::LogInfo(kTag, "run " + run_id + " deleted");
    }
    return deleted;
}

void RunService::Shutdown() {
    // Order matters: no worker may pick up or launch a run once cleanup starts.
    const auto discarded = queue_.Close();
    sandbox_.Close();
    sandbox_.CleanupAll();
    queue_.Join();
    if (discarded > 0) {
        agentrun::utils::LogWarn(kTag, "discarded " + std::to_string(discarded) + " queued runs at shutdown");
    }
}

void RunService::Execute(const agentrun::sandbox::SandboxRequest& request) {
    if (!registry_.Transition(request.run_id, RunStatus::Running)) {
        agentrun::utils::LogInfo(kTag, "run " + request.run_id + " no longer runnable, skipping");
        return;
    }

    const auto result = sandbox_.Run(request);
    agentrun::utils::LogInfo(
        kTag, "run " + request.run_id + " sandbox finished: " + agentrun::sandbox::ToString(result.outcome));

    RunOutcome outcome{};
    outcome.logs = result.logs;
    outcome.output = result.output;

    switch (result.outcome) {
        case agentrun::sandbox::SandboxOutcome::kTimeout:
            outcome.error = result.error.message.empty() ? std::string("Agent execution timed out")
                                                         : result.error.message;
            registry_.Finish(request.run_id, RunStatus::Timeout, std::move(outcome));
            return;
        case agentrun::sandbox::SandboxOutcome::kCancelled:
            outcome.error = "Run cancelled";
            registry_.Finish(request.run_id, RunStatus::Cancelled, std::move(outcome));
            return;
        case agentrun::sandbox::SandboxOutcome::kError:
            outcome.error = "Execution error: " + result.error.message;
            registry_.Finish(request.run_id, RunStatus::Failed, std::move(outcome));
            return;
        case agentrun::sandbox::SandboxOutcome::kCompleted:
            break;
    }

    outcome.patch = agentrun::output::ExtractPatch(result.output);
    if (!result.success) {
        outcome.error = result.error.message;
        registry_.Finish(request.run_id, RunStatus::Failed, std::move(outcome));
        return;
    }
    const auto verdict = agentrun::output::ReadVerdict(result.output);
    if (!verdict.success) {
        outcome.error = verdict.error.message;
        registry_.Finish(request.run_id, RunStatus::Failed, std::move(outcome));
        return;
    }
    registry_.Finish(request.run_id, RunStatus::Completed, std::move(outcome));
}

Run RunService::FailBeforeExecution(const Run& run, const std::string& error) {
    agentrun::utils::LogWarn(kTag, "run " + run.run_id + " failed before execution: " + error);
    const auto before = Snapshot(run);
    RunOutcome outcome{};
    outcome.error = error;
    registry_.Finish(run.run_id, RunStatus::Failed, std::move(outcome));
    return Snapshot(before);
}

Run RunService::Snapshot(const Run& last_known) const {
    // A run deleted mid-submission keeps the last state this call observed.
    return registry_.Get(last_known.run_id).value_or(last_known);
}

}  // namespace agentrun::runs
