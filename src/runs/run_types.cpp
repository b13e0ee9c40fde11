#include "runs/run_types.hpp"

namespace agentrun::runs {

const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::Pending: return "pending";
        case RunStatus::Queued: return "queued";
        case RunStatus::Running: return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Timeout: return "timeout";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<RunStatus> ParseRunStatus(const std::string& value) {
    static const RunStatus kAll[] = {
        RunStatus::Pending,
        RunStatus::Queued,
        RunStatus::Running,
        RunStatus::Completed,
        RunStatus::Failed,
        RunStatus::Timeout,
        RunStatus::Cancelled
    };
    for (const auto status : kAll) {
        if (value == ToString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

bool IsTerminal(RunStatus status) {
    return status == RunStatus::Completed ||
        status == RunStatus::Failed ||
        status == RunStatus::Timeout ||
        status == RunStatus::Cancelled;
}

bool IsActive(RunStatus status) {
    return status == RunStatus::Queued || status == RunStatus::Running;
}

bool CanTransition(RunStatus from, RunStatus to) {
    switch (from) {
        case RunStatus::Pending:
            return to == RunStatus::Queued || to == RunStatus::Failed;
        case RunStatus::Queued:
            return to == RunStatus::Running;
        case RunStatus::Running:
            return IsTerminal(to);
        case RunStatus::Completed:
        case RunStatus::Failed:
        case RunStatus::Timeout:
        case RunStatus::Cancelled:
            return false;
    }
    return false;
}

nlohmann::json RunToJson(const Run& run) {
    using agentrun::utils::FormatIsoUtc;
    auto optional_time = [](const std::optional<agentrun::utils::TimePoint>& value) {
        return value.has_value() ? nlohmann::json(FormatIsoUtc(*value)) : nlohmann::json(nullptr);
    };
    auto optional_string = [](const std::optional<std::string>& value) {
        return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
    };

    nlohmann::json json = nlohmann::json::object();
    json["run_id"] = run.run_id;
    json["agent_id"] = run.agent_id;
    json["status"] = ToString(run.status);
    json["created_at"] = FormatIsoUtc(run.created_at);
    json["started_at"] = optional_time(run.started_at);
    json["completed_at"] = optional_time(run.completed_at);
    json["duration_seconds"] = run.duration_seconds.has_value()
        ? nlohmann::json(*run.duration_seconds)
        : nlohmann::json(nullptr);
    json["problem_statement"] = run.problem_statement;
    json["output"] = run.output.has_value() ? *run.output : nlohmann::json(nullptr);
    json["patch"] = optional_string(run.patch);
    json["error"] = optional_string(run.error);
    json["logs"] = run.logs.empty() ? nlohmann::json(nullptr) : nlohmann::json(run.logs);
    json["files_count"] = run.files_count.has_value()
        ? nlohmann::json(*run.files_count)
        : nlohmann::json(nullptr);
    json["agent_path"] = optional_string(run.agent_path);
    return json;
}

}  // namespace agentrun::runs
