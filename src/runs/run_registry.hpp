#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "runs/run_types.hpp"

namespace agentrun::runs {

// Owns every run record. All mutation goes through the state machine in
// CanTransition(); a terminal record is never modified again.
class RunRegistry {
public:
    using StopHandler = std::function<void(const std::string&)>;
    using Mutator = std::function<void(Run&)>;

    bool Create(Run run);
    std::optional<Run> Get(const std::string& run_id) const;
    std::vector<Run> List(std::optional<RunStatus> status, std::size_t limit) const;

    // Calls stop for Queued/Running runs before the record is removed.
    // Returns false when the run does not exist.
    bool Delete(const std::string& run_id, const StopHandler& stop);

    // Non-terminal transitions. Entering Running stamps started_at.
    bool Transition(const std::string& run_id, RunStatus to);

    // Terminal transition: stamps completed_at and derives duration_seconds.
    bool Finish(const std::string& run_id, RunStatus terminal, RunOutcome outcome);

    // Edits descriptive fields of a run that has not yet reached a terminal state.
    bool Update(const std::string& run_id, const Mutator& mutate);

    std::size_t Size() const;

private:
    static void ApplyStatus(Run& run, RunStatus to);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Run> runs_;
};

}  // namespace agentrun::runs
