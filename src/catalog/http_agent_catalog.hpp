#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "catalog/agent_catalog.hpp"
#include "config/config_schema.hpp"

namespace agentrun::catalog {

// Agent catalog backed by the platform's retrieval API, with an in-memory
// metadata cache and an on-disk cache of downloaded agent files.
class HttpAgentCatalog : public AgentCatalog {
public:
    explicit HttpAgentCatalog(const agentrun::config::CatalogConfig& config);

    AgentListResult FetchTopAgents(int num_agents) override;
    AgentLookupResult GetAgent(const std::string& version_id) override;
    ArtifactResult ResolveArtifact(const std::string& version_id) override;

    // Downloads the top agents' files ahead of time; returns how many succeeded.
    int Prefetch(int num_agents);
    void ClearCache();
    std::size_t CachedCount() const;

    // The file endpoint returns either raw source or a JSON-encoded string.
    static std::string UnwrapAgentSource(const std::string& body);
    static agentrun::errors::Error ParseAgentList(const std::string& body, std::vector<AgentInfo>& agents);

protected:
    virtual agentrun::errors::Error HttpGet(const std::string& target, std::string& body);

private:
    bool CacheFresh(int num_agents) const;

    agentrun::config::CatalogConfig config_;
    std::filesystem::path cache_dir_;
    mutable std::mutex mutex_;
    std::vector<AgentInfo> cached_;
    int cached_request_size_ = 0;
    std::chrono::steady_clock::time_point last_fetch_{};
    std::mutex download_mutex_;
};

}  // namespace agentrun::catalog
