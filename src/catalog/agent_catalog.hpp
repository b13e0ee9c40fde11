#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "errors/errors.hpp"
#include "nlohmann/json.hpp"

namespace agentrun::catalog {

struct AgentInfo {
    std::string version_id;
    std::string miner_hotkey;
    int version_num = 0;
    std::string created_at;
    std::optional<double> score;
    std::optional<long long> block_uploaded;
};

nlohmann::json AgentInfoToJson(const AgentInfo& agent);
// Returns nullopt when a required field is missing or mistyped.
std::optional<AgentInfo> AgentInfoFromJson(const nlohmann::json& json);

struct AgentListResult {
    std::vector<AgentInfo> agents;
    agentrun::errors::Error error;
};

struct AgentLookupResult {
    std::optional<AgentInfo> agent;
    agentrun::errors::Error error;
};

struct ArtifactResult {
    std::filesystem::path path;
    agentrun::errors::Error error;
};

// Source of agent metadata and agent source files.
class AgentCatalog {
public:
    virtual ~AgentCatalog() = default;

    virtual AgentListResult FetchTopAgents(int num_agents) = 0;
    // kNotFound when the id is not among the known agents.
    virtual AgentLookupResult GetAgent(const std::string& version_id) = 0;
    // Local path to the agent's source file, downloading it when needed.
    virtual ArtifactResult ResolveArtifact(const std::string& version_id) = 0;
};

}  // namespace agentrun::catalog
