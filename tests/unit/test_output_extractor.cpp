#include "output/output_extractor.hpp"

#include <gtest/gtest.h>

using namespace agentrun::output;
using nlohmann::json;

TEST(ExtractPatchTest, PrecedenceOrder) {
    EXPECT_EQ(ExtractPatch(json{{"patch", "P"}}), "P");
    EXPECT_EQ(ExtractPatch(json{{"result", {{"patch", "P2"}}}}), "P2");
    EXPECT_EQ(ExtractPatch(json{{"result", "P3"}}), "P3");
    EXPECT_EQ(ExtractPatch(json{{"result", 42}}), "");
    EXPECT_EQ(ExtractPatch(json::object()), "");
    EXPECT_EQ(ExtractPatch(json::array()), "");
}

TEST(ExtractPatchTest, TopLevelWinsOverResult) {
    const json output = {{"patch", "top"}, {"result", {{"patch", "nested"}}}};
    EXPECT_EQ(ExtractPatch(output), "top");
}

TEST(ExtractPatchTest, EmptyTopLevelFallsThrough) {
    const json output = {{"patch", ""}, {"result", "from-result"}};
    EXPECT_EQ(ExtractPatch(output), "from-result");
}

TEST(ExtractOutputFromLogsTest, PicksLastJsonObjectLine) {
    const std::string logs =
        "Installing requirements\n"
        "{\"step\": 1}\n"
        "noise {not json}\n"
        "  {\"patch\": \"diff\", \"success\": true}  \n"
        "Agent execution completed\n";
    const auto output = ExtractOutputFromLogs(logs);
    EXPECT_EQ(output["patch"], "diff");
    EXPECT_FALSE(output.contains("step"));
}

TEST(ExtractOutputFromLogsTest, WrapsRawTextWhenNoJson) {
    const std::string logs = "Traceback (most recent call last):\nValueError\n";
    const auto output = ExtractOutputFromLogs(logs);
    ASSERT_TRUE(output.contains("logs"));
    EXPECT_EQ(output["logs"], logs);
}

TEST(ReadVerdictTest, MissingFlagCountsAsSuccess) {
    EXPECT_TRUE(ReadVerdict(json{{"result", "x"}}).success);
    EXPECT_TRUE(ReadVerdict(json{{"success", true}}).success);
}

TEST(ReadVerdictTest, FailureCarriesErrorText) {
    const auto verdict = ReadVerdict(json{{"success", false}, {"error", "ValueError: bad input"}});
    EXPECT_FALSE(verdict.success);
    EXPECT_EQ(verdict.error.kind, agentrun::errors::ErrorKind::kExecution);
    EXPECT_EQ(verdict.error.message, "ValueError: bad input");
}

TEST(ReadVerdictTest, UnsupportedAgentIsTyped) {
    const auto verdict = ReadVerdict(json{
        {"success", false},
        {"error", "agent.py does not define agent_main"},
        {"error_type", "unsupported_agent"}});
    EXPECT_FALSE(verdict.success);
    EXPECT_EQ(verdict.error.kind, agentrun::errors::ErrorKind::kUnsupportedAgent);
}

TEST(ReadVerdictTest, FailureWithoutMessageGetsDefault) {
    const auto verdict = ReadVerdict(json{{"success", false}});
    EXPECT_EQ(verdict.error.message, "agent reported failure");
}
