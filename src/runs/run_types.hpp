#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"

namespace agentrun::runs {

enum class RunStatus {
    Pending,
    Queued,
    Running,
    Completed,
    Failed,
    Timeout,
    Cancelled
};

const char* ToString(RunStatus status);
std::optional<RunStatus> ParseRunStatus(const std::string& value);

bool IsTerminal(RunStatus status);
bool IsActive(RunStatus status);

// Pending -> Queued -> Running -> terminal, or Pending -> Failed.
bool CanTransition(RunStatus from, RunStatus to);

struct Run {
    std::string run_id;
    std::string agent_id;
    RunStatus status = RunStatus::Pending;
    std::vector<RunStatus> status_history;
    agentrun::utils::TimePoint created_at{};
    std::optional<agentrun::utils::TimePoint> started_at;
    std::optional<agentrun::utils::TimePoint> completed_at;
    std::optional<double> duration_seconds;
    std::string problem_statement;
    std::optional<nlohmann::json> output;
    std::optional<std::string> patch;
    std::optional<std::string> error;
    std::vector<std::string> logs;
    std::optional<std::size_t> files_count;
    std::optional<std::string> agent_path;
};

// Result fields written when a run reaches a terminal state.
struct RunOutcome {
    std::optional<nlohmann::json> output;
    std::optional<std::string> patch;
    std::optional<std::string> error;
    std::vector<std::string> logs;
};

nlohmann::json RunToJson(const Run& run);

}  // namespace agentrun::runs
