#include "runs/run_registry.hpp"

#include <algorithm>
#include <exception>

#include "utils/logging.hpp"

namespace agentrun::runs {

bool RunRegistry::Create(Run run) {
    if (run.status_history.empty()) {
        run.status_history.push_back(run.status);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = run.run_id;
    return runs_.emplace(std::move(key), std::move(run)).second;
}

std::optional<Run> RunRegistry::Get(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Run> RunRegistry::List(std::optional<RunStatus> status, std::size_t limit) const {
    std::vector<Run> runs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs.reserve(runs_.size());
        for (const auto& [id, run] : runs_) {
            if (!status.has_value() || run.status == *status) {
                runs.push_back(run);
            }
        }
    }
    std::sort(runs.begin(), runs.end(), [](const Run& a, const Run& b) {
        return a.created_at > b.created_at;
    });
    if (runs.size() > limit) {
        runs.resize(limit);
    }
    return runs;
}

bool RunRegistry::Delete(const std::string& run_id, const StopHandler& stop) {
    std::optional<RunStatus> status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(run_id);
        if (it == runs_.end()) {
            return false;
        }
        status = it->second.status;
    }
    if (IsActive(*status) && stop) {
        try {
            stop(run_id);
        } catch (const std::exception& ex) {
            agentrun::utils::LogWarn("runs", "failed to stop run " + run_id + ": " + ex.what());
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    runs_.erase(run_id);
    return true;
}

bool RunRegistry::Transition(const std::string& run_id, RunStatus to) {
    if (IsTerminal(to)) {
        return Finish(run_id, to, RunOutcome{});
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return false;
    }
    auto& run = it->second;
    if (!CanTransition(run.status, to)) {
        agentrun::utils::LogWarn(
            "runs",
            "rejected transition " + std::string(ToString(run.status)) + " -> " +
                ToString(to) + " for run " + run_id);
        return false;
    }
    ApplyStatus(run, to);
    if (to == RunStatus::Running) {
        run.started_at = agentrun::utils::Now();
    }
    return true;
}

bool RunRegistry::Finish(const std::string& run_id, RunStatus terminal, RunOutcome outcome) {
    if (!IsTerminal(terminal)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return false;
    }
    auto& run = it->second;
    if (!CanTransition(run.status, terminal)) {
        agentrun::utils::LogWarn(
            "runs",
            "rejected transition " + std::string(ToString(run.status)) + " -> " +
                ToString(terminal) + " for run " + run_id);
        return false;
    }
    ApplyStatus(run, terminal);
    run.output = std::move(outcome.output);
    run.patch = std::move(outcome.patch);
    run.error = std::move(outcome.error);
    run.logs = std::move(outcome.logs);
    run.completed_at = agentrun::utils::Now();
    if (run.started_at.has_value()) {
        run.duration_seconds = agentrun::utils::SecondsBetween(*run.started_at, *run.completed_at);
    }
    return true;
}

bool RunRegistry::Update(const std::string& run_id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || IsTerminal(it->second.status)) {
        return false;
    }
    const auto status = it->second.status;
    const auto history = it->second.status_history;
    mutate(it->second);
    // Status is owned by the state machine.
    it->second.status = status;
    it->second.status_history = history;
    return true;
}

std::size_t RunRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

void RunRegistry::ApplyStatus(Run& run, RunStatus to) {
    run.status = to;
    run.status_history.push_back(to);
}

}  // namespace agentrun::runs
