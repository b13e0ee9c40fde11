#include "runs/run_registry.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace agentrun::runs;

namespace {

Run MakeRun(const std::string& id, agentrun::utils::TimePoint created_at = agentrun::utils::Now()) {
    Run run{};
    run.run_id = id;
    run.agent_id = "agent-1";
    run.problem_statement = "fix the bug";
    run.created_at = created_at;
    return run;
}

}  // namespace

TEST(RunTypesTest, TransitionTable) {
    EXPECT_TRUE(CanTransition(RunStatus::Pending, RunStatus::Queued));
    EXPECT_TRUE(CanTransition(RunStatus::Pending, RunStatus::Failed));
    EXPECT_FALSE(CanTransition(RunStatus::Pending, RunStatus::Running));
    EXPECT_FALSE(CanTransition(RunStatus::Pending, RunStatus::Completed));
    EXPECT_TRUE(CanTransition(RunStatus::Queued, RunStatus::Running));
    EXPECT_FALSE(CanTransition(RunStatus::Queued, RunStatus::Failed));
    for (auto terminal : {RunStatus::Completed, RunStatus::Failed, RunStatus::Timeout, RunStatus::Cancelled}) {
        EXPECT_TRUE(CanTransition(RunStatus::Running, terminal));
        EXPECT_TRUE(IsTerminal(terminal));
        EXPECT_FALSE(CanTransition(terminal, RunStatus::Running));
        EXPECT_FALSE(CanTransition(terminal, RunStatus::Completed));
    }
}

TEST(RunTypesTest, StatusNamesRoundTrip) {
    EXPECT_STREQ(ToString(RunStatus::Timeout), "timeout");
    EXPECT_EQ(ParseRunStatus("running").value(), RunStatus::Running);
    EXPECT_FALSE(ParseRunStatus("exploded").has_value());
}

TEST(RunTypesTest, JsonUsesNullForUnsetFields) {
    auto run = MakeRun("r1");
    const auto json = RunToJson(run);
    EXPECT_EQ(json["run_id"], "r1");
    EXPECT_EQ(json["status"], "pending");
    EXPECT_TRUE(json["started_at"].is_null());
    EXPECT_TRUE(json["completed_at"].is_null());
    EXPECT_TRUE(json["duration_seconds"].is_null());
    EXPECT_TRUE(json["patch"].is_null());
    EXPECT_TRUE(json["output"].is_null());
    EXPECT_TRUE(json["created_at"].get<std::string>().back() == 'Z');
}

TEST(RunRegistryTest, CreateAndGet) {
    RunRegistry registry;
    EXPECT_TRUE(registry.Create(MakeRun("r1")));
    EXPECT_FALSE(registry.Create(MakeRun("r1")));

    const auto run = registry.Get("r1");
    ASSERT_TRUE(run.has_value());
    EXPECT_EQ(run->status, RunStatus::Pending);
    ASSERT_EQ(run->status_history.size(), 1u);
    EXPECT_FALSE(registry.Get("missing").has_value());
}

TEST(RunRegistryTest, HappyPathRecordsFullHistoryAndDuration) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    ASSERT_TRUE(registry.Transition("r1", RunStatus::Queued));
    ASSERT_TRUE(registry.Transition("r1", RunStatus::Running));

    auto running = registry.Get("r1");
    ASSERT_TRUE(running->started_at.has_value());
    EXPECT_FALSE(running->completed_at.has_value());

    RunOutcome outcome{};
    outcome.patch = "diff";
    ASSERT_TRUE(registry.Finish("r1", RunStatus::Completed, outcome));

    const auto run = registry.Get("r1");
    const std::vector<RunStatus> expected = {
        RunStatus::Pending, RunStatus::Queued, RunStatus::Running, RunStatus::Completed};
    EXPECT_EQ(run->status_history, expected);
    ASSERT_TRUE(run->completed_at.has_value());
    ASSERT_TRUE(run->duration_seconds.has_value());
    EXPECT_DOUBLE_EQ(*run->duration_seconds,
                     agentrun::utils::SecondsBetween(*run->started_at, *run->completed_at));
    EXPECT_EQ(run->patch.value(), "diff");
}

TEST(RunRegistryTest, PreExecutionFailureSkipsQueuedAndHasNoDuration) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    RunOutcome outcome{};
    outcome.error = "Failed to download agent";
    ASSERT_TRUE(registry.Finish("r1", RunStatus::Failed, outcome));

    const auto run = registry.Get("r1");
    EXPECT_EQ(run->status, RunStatus::Failed);
    EXPECT_TRUE(run->completed_at.has_value());
    EXPECT_FALSE(run->started_at.has_value());
    EXPECT_FALSE(run->duration_seconds.has_value());
    EXPECT_EQ(run->error.value(), "Failed to download agent");
}

TEST(RunRegistryTest, TerminalRecordsAreFinal) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    registry.Transition("r1", RunStatus::Queued);
    registry.Transition("r1", RunStatus::Running);
    registry.Finish("r1", RunStatus::Timeout, RunOutcome{});

    EXPECT_FALSE(registry.Finish("r1", RunStatus::Completed, RunOutcome{}));
    EXPECT_FALSE(registry.Transition("r1", RunStatus::Running));
    EXPECT_FALSE(registry.Update("r1", [](agentrun::runs::Run& run) { run.agent_path = "x"; }));

    const auto run = registry.Get("r1");
    EXPECT_EQ(run->status, RunStatus::Timeout);
    EXPECT_FALSE(run->agent_path.has_value());
    EXPECT_EQ(run->status_history.back(), RunStatus::Timeout);
}

TEST(RunRegistryTest, InvalidTransitionLeavesRecordUnchanged) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    EXPECT_FALSE(registry.Transition("r1", RunStatus::Running));
    EXPECT_FALSE(registry.Finish("r1", RunStatus::Completed, RunOutcome{}));
    const auto run = registry.Get("r1");
    EXPECT_EQ(run->status, RunStatus::Pending);
    EXPECT_EQ(run->status_history.size(), 1u);
}

TEST(RunRegistryTest, UpdateCannotChangeStatus) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    ASSERT_TRUE(registry.Update("r1", [](agentrun::runs::Run& run) {
        run.files_count = 3;
        run.status = RunStatus::Completed;
    }));
    const auto run = registry.Get("r1");
    EXPECT_EQ(run->status, RunStatus::Pending);
    EXPECT_EQ(run->files_count.value(), 3u);
}

TEST(RunRegistryTest, ListSortsNewestFirstAndFilters) {
    RunRegistry registry;
    const auto base = agentrun::utils::Now();
    registry.Create(MakeRun("old", base - std::chrono::seconds(20)));
    registry.Create(MakeRun("mid", base - std::chrono::seconds(10)));
    registry.Create(MakeRun("new", base));
    registry.Transition("mid", RunStatus::Queued);

    const auto all = registry.List(std::nullopt, 50);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].run_id, "new");
    EXPECT_EQ(all[1].run_id, "mid");
    EXPECT_EQ(all[2].run_id, "old");

    const auto limited = registry.List(std::nullopt, 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[1].run_id, "mid");

    const auto pending = registry.List(RunStatus::Pending, 50);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].run_id, "new");
}

TEST(RunRegistryTest, DeleteStopsOnlyActiveRuns) {
    RunRegistry registry;
    registry.Create(MakeRun("queued"));
    registry.Transition("queued", RunStatus::Queued);
    registry.Create(MakeRun("done"));
    registry.Finish("done", RunStatus::Failed, RunOutcome{});

    std::vector<std::string> stopped;
    auto stop = [&stopped](const std::string& id) { stopped.push_back(id); };

    EXPECT_TRUE(registry.Delete("queued", stop));
    EXPECT_TRUE(registry.Delete("done", stop));
    EXPECT_FALSE(registry.Delete("missing", stop));

    ASSERT_EQ(stopped.size(), 1u);
    EXPECT_EQ(stopped[0], "queued");
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(RunRegistryTest, DeleteRemovesRecordEvenWhenStopThrows) {
    RunRegistry registry;
    registry.Create(MakeRun("r1"));
    registry.Transition("r1", RunStatus::Queued);
    registry.Transition("r1", RunStatus::Running);

    bool stop_called = false;
    EXPECT_TRUE(registry.Delete("r1", [&stop_called](const std::string&) {
        stop_called = true;
        throw std::runtime_error("docker unavailable");
    }));
    EXPECT_TRUE(stop_called);
    EXPECT_FALSE(registry.Get("r1").has_value());
}
