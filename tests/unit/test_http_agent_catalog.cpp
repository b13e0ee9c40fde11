#include "catalog/http_agent_catalog.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <map>
#include <sstream>

#include "unit/test_fakes.hpp"

using namespace agentrun::catalog;
using agentrun::errors::ErrorKind;

namespace {

// Serves canned bodies instead of talking to the platform.
class ScriptedCatalog : public HttpAgentCatalog {
public:
    using HttpAgentCatalog::HttpAgentCatalog;

    std::map<std::string, std::string> bodies;
    std::map<std::string, agentrun::errors::Error> failures;
    std::vector<std::string> requested;

protected:
    agentrun::errors::Error HttpGet(const std::string& target, std::string& body) override {
        requested.push_back(target);
        auto failure = failures.find(target);
        if (failure != failures.end()) {
            return failure->second;
        }
        auto it = bodies.find(target);
        if (it == bodies.end()) {
            return agentrun::errors::MakeError(ErrorKind::kNotFound, "HTTP 404");
        }
        body = it->second;
        return {};
    }
};

const char* kTopAgents = R"([
    {"version_id": "v1", "miner_hotkey": "5Fhot", "version_num": 3, "created_at": "2025-01-02T03:04:05Z",
     "score": 0.91, "block_uploaded": 1200},
    {"version_id": "v2", "miner_hotkey": "5Gkey", "version_num": 1, "created_at": "2025-01-01T00:00:00Z",
     "score": null, "block_uploaded": null},
    {"miner_hotkey": "broken"}
])";

std::string Slurp(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

class HttpAgentCatalogTest : public ::testing::Test {
protected:
    std::filesystem::path cache_dir_;
    agentrun::config::CatalogConfig config_;

    void SetUp() override {
        cache_dir_ = agentrun::testing::MakeTempDir("agentrun_catalog_test");
        config_.cache_dir = cache_dir_.string();
        config_.cache_ttl_s = 300;
    }

    void TearDown() override {
        std::filesystem::remove_all(cache_dir_);
    }
};

TEST_F(HttpAgentCatalogTest, ParsesAgentsAndSkipsMalformedRecords) {
    ScriptedCatalog catalog(config_);
    catalog.bodies["/retrieval/top-agents?num_agents=5"] = kTopAgents;

    const auto listed = catalog.FetchTopAgents(5);
    ASSERT_FALSE(listed.error);
    ASSERT_EQ(listed.agents.size(), 2u);
    EXPECT_EQ(listed.agents[0].version_id, "v1");
    EXPECT_EQ(listed.agents[0].version_num, 3);
    ASSERT_TRUE(listed.agents[0].score.has_value());
    EXPECT_DOUBLE_EQ(*listed.agents[0].score, 0.91);
    EXPECT_FALSE(listed.agents[1].score.has_value());
    EXPECT_FALSE(listed.agents[1].block_uploaded.has_value());

    const auto json = AgentInfoToJson(listed.agents[1]);
    EXPECT_TRUE(json["score"].is_null());
    EXPECT_EQ(json["created_at"], "2025-01-01T00:00:00Z");
}

TEST_F(HttpAgentCatalogTest, MetadataIsCachedWithinTtl) {
    ScriptedCatalog catalog(config_);
    catalog.bodies["/retrieval/top-agents?num_agents=5"] = kTopAgents;

    catalog.FetchTopAgents(5);
    const auto again = catalog.FetchTopAgents(1);
    EXPECT_EQ(catalog.requested.size(), 1u);
    ASSERT_EQ(again.agents.size(), 1u);
    EXPECT_EQ(again.agents[0].version_id, "v1");
}

TEST_F(HttpAgentCatalogTest, ExpiredOrClearedCacheRefetches) {
    config_.cache_ttl_s = 0;
    ScriptedCatalog catalog(config_);
    catalog.bodies["/retrieval/top-agents?num_agents=5"] = kTopAgents;
    catalog.FetchTopAgents(5);
    catalog.FetchTopAgents(5);
    EXPECT_EQ(catalog.requested.size(), 2u);

    catalog.ClearCache();
    EXPECT_EQ(catalog.CachedCount(), 0u);
}

TEST_F(HttpAgentCatalogTest, FetchFailureIsUpstreamError) {
    ScriptedCatalog catalog(config_);
    catalog.failures["/retrieval/top-agents?num_agents=5"] =
        agentrun::errors::MakeError(ErrorKind::kUpstreamFetch, "Connection");
    const auto listed = catalog.FetchTopAgents(5);
    ASSERT_TRUE(listed.error);
    EXPECT_EQ(listed.error.kind, ErrorKind::kUpstreamFetch);
}

TEST_F(HttpAgentCatalogTest, GetAgentUsesCacheThenRefresh) {
    config_.default_num_agents = 5;
    ScriptedCatalog catalog(config_);
    catalog.bodies["/retrieval/top-agents?num_agents=5"] = kTopAgents;

    const auto found = catalog.GetAgent("v2");
    ASSERT_TRUE(found.agent.has_value());
    EXPECT_EQ(found.agent->miner_hotkey, "5Gkey");

    const auto missing = catalog.GetAgent("nope");
    EXPECT_FALSE(missing.agent.has_value());
    EXPECT_EQ(missing.error.kind, ErrorKind::kNotFound);
}

TEST_F(HttpAgentCatalogTest, DownloadsUnwrapJsonStringAndCacheOnDisk) {
    ScriptedCatalog catalog(config_);
    const std::string target = "/retrieval/agent-version-file?version_id=v1&return_as_text=true";
    catalog.bodies[target] = "\"def agent_main(input_dict, repo_dir=None):\\n    return ''\\n\"";

    const auto first = catalog.ResolveArtifact("v1");
    ASSERT_FALSE(first.error);
    EXPECT_EQ(first.path, cache_dir_ / "v1.py");
    EXPECT_EQ(Slurp(first.path), "def agent_main(input_dict, repo_dir=None):\n    return ''\n");

    const auto second = catalog.ResolveArtifact("v1");
    ASSERT_FALSE(second.error);
    EXPECT_EQ(catalog.requested.size(), 1u);
}

TEST_F(HttpAgentCatalogTest, RawSourceIsKeptVerbatim) {
    EXPECT_EQ(HttpAgentCatalog::UnwrapAgentSource("import os\nprint(1)\n"), "import os\nprint(1)\n");
    EXPECT_EQ(HttpAgentCatalog::UnwrapAgentSource("\"x\""), "x");
    EXPECT_EQ(HttpAgentCatalog::UnwrapAgentSource("{\"a\": 1}"), "{\"a\": 1}");
}

TEST_F(HttpAgentCatalogTest, RejectsPathLikeIdsAndReportsMissingAgents) {
    ScriptedCatalog catalog(config_);
    EXPECT_EQ(catalog.ResolveArtifact("../etc/passwd").error.kind, ErrorKind::kValidation);
    EXPECT_TRUE(catalog.requested.empty());

    const auto missing = catalog.ResolveArtifact("unknown");
    EXPECT_EQ(missing.error.kind, ErrorKind::kNotFound);
    EXPECT_FALSE(std::filesystem::exists(cache_dir_ / "unknown.py"));
}

TEST_F(HttpAgentCatalogTest, DownloadTargetEncodesVersionId) {
    ScriptedCatalog catalog(config_);
    const std::string target = "/retrieval/agent-version-file?version_id=agent%20v1%26x&return_as_text=true";
    catalog.bodies[target] = "print(1)\n";

    const auto artifact = catalog.ResolveArtifact("agent v1&x");
    ASSERT_FALSE(artifact.error);
    ASSERT_EQ(catalog.requested.size(), 1u);
    EXPECT_EQ(catalog.requested[0], target);
    EXPECT_EQ(Slurp(artifact.path), "print(1)\n");
}

TEST_F(HttpAgentCatalogTest, PrefetchDownloadsListedAgents) {
    ScriptedCatalog catalog(config_);
    catalog.bodies["/retrieval/top-agents?num_agents=5"] = kTopAgents;
    catalog.bodies["/retrieval/agent-version-file?version_id=v1&return_as_text=true"] = "print('v1')\n";
    catalog.bodies["/retrieval/agent-version-file?version_id=v2&return_as_text=true"] = "print('v2')\n";

    EXPECT_EQ(catalog.Prefetch(5), 2);
    EXPECT_TRUE(std::filesystem::exists(cache_dir_ / "v1.py"));
    EXPECT_TRUE(std::filesystem::exists(cache_dir_ / "v2.py"));
}

TEST_F(HttpAgentCatalogTest, PrefetchSurvivesCatalogOutage) {
    ScriptedCatalog catalog(config_);
    EXPECT_EQ(catalog.Prefetch(5), 0);
}
