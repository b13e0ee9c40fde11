#include "catalog/http_agent_catalog.hpp"

#include <algorithm>
#include <fstream>
#include <memory>

#include "httplib.h"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace agentrun::catalog {
namespace {

using agentrun::errors::ErrorKind;
using agentrun::errors::MakeError;

constexpr const char* kTag = "catalog";

httplib::Headers BrowserHeaders() {
    return {
        {"Accept", "*/*"},
        {"Accept-Language", "en-US,en;q=0.9"},
        {"Origin", "https://www.ridges.ai"},
        {"Referer", "https://www.ridges.ai/"},
        {"User-Agent", "agentrun/1.0"}
    };
}

bool IsSafeVersionId(const std::string& version_id) {
    if (version_id.empty() || version_id == "." || version_id == "..") {
        return false;
    }
    return version_id.find('/') == std::string::npos && version_id.find('\\') == std::string::npos;
}

}  // namespace

nlohmann::json AgentInfoToJson(const AgentInfo& agent) {
    return {
        {"version_id", agent.version_id},
        {"miner_hotkey", agent.miner_hotkey},
        {"version_num", agent.version_num},
        {"created_at", agent.created_at},
        {"score", agent.score.has_value() ? nlohmann::json(*agent.score) : nlohmann::json(nullptr)},
        {"block_uploaded", agent.block_uploaded.has_value() ? nlohmann::json(*agent.block_uploaded)
                                                            : nlohmann::json(nullptr)}
    };
}

std::optional<AgentInfo> AgentInfoFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::nullopt;
    }
    if (!json.contains("version_id") || !json["version_id"].is_string() ||
        !json.contains("miner_hotkey") || !json["miner_hotkey"].is_string() ||
        !json.contains("version_num") || !json["version_num"].is_number_integer()) {
        return std::nullopt;
    }
    AgentInfo agent{};
    agent.version_id = json["version_id"].get<std::string>();
    agent.miner_hotkey = json["miner_hotkey"].get<std::string>();
    agent.version_num = json["version_num"].get<int>();
    if (json.contains("created_at") && json["created_at"].is_string()) {
        agent.created_at = json["created_at"].get<std::string>();
    }
    if (json.contains("score") && json["score"].is_number()) {
        agent.score = json["score"].get<double>();
    }
    if (json.contains("block_uploaded") && json["block_uploaded"].is_number_integer()) {
        agent.block_uploaded = json["block_uploaded"].get<long long>();
    }
    return agent;
}

HttpAgentCatalog::HttpAgentCatalog(const agentrun::config::CatalogConfig& config)
    : config_(config)
    , cache_dir_(config.cache_dir) {
    std::error_code ec;
    std::filesystem::create_directories(cache_dir_, ec);
    if (ec) {
        agentrun::utils::LogWarn(kTag, "cannot create cache dir " + cache_dir_.string() + ": " + ec.message());
    }
}

AgentListResult HttpAgentCatalog::FetchTopAgents(int num_agents) {
    AgentListResult result{};
    if (num_agents <= 0) {
        num_agents = config_.default_num_agents;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (CacheFresh(num_agents)) {
            const auto count = std::min<std::size_t>(cached_.size(), static_cast<std::size_t>(num_agents));
            result.agents.assign(cached_.begin(), cached_.begin() + static_cast<std::ptrdiff_t>(count));
            return result;
        }
    }

    std::string body;
    const auto target = "/retrieval/top-agents?num_agents=" + std::to_string(num_agents);
    auto error = HttpGet(target, body);
    if (error) {
        result.error = MakeError(ErrorKind::kUpstreamFetch, "Failed to fetch agents: " + error.message);
        return result;
    }
    std::vector<AgentInfo> agents;
    error = ParseAgentList(body, agents);
    if (error) {
        result.error = error;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cached_ = agents;
        cached_request_size_ = num_agents;
        last_fetch_ = std::chrono::steady_clock::now();
    }
    agentrun::utils::LogInfo(kTag, "fetched " + std::to_string(agents.size()) + " agents");
    result.agents = std::move(agents);
    return result;
}

AgentLookupResult HttpAgentCatalog::GetAgent(const std::string& version_id) {
    AgentLookupResult result{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& agent : cached_) {
            if (agent.version_id == version_id) {
                result.agent = agent;
                return result;
            }
        }
    }
    auto listed = FetchTopAgents(config_.default_num_agents);
    if (listed.error) {
        result.error = listed.error;
        return result;
    }
    for (auto& agent : listed.agents) {
        if (agent.version_id == version_id) {
            result.agent = std::move(agent);
            return result;
        }
    }
    result.error = MakeError(ErrorKind::kNotFound, "Agent " + version_id + " not found");
    return result;
}

ArtifactResult HttpAgentCatalog::ResolveArtifact(const std::string& version_id) {
    ArtifactResult result{};
    if (!IsSafeVersionId(version_id)) {
        result.error = MakeError(ErrorKind::kValidation, "invalid agent id: " + version_id);
        return result;
    }
    const auto path = cache_dir_ / (version_id + ".py");

    // Serializes downloads so two submissions for one agent write the file once.
    std::lock_guard<std::mutex> download_lock(download_mutex_);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        agentrun::utils::LogDebug(kTag, "agent " + version_id + " already cached at " + path.string());
        result.path = path;
        return result;
    }

    std::string body;
    const auto target = "/retrieval/agent-version-file?version_id=" + agentrun::utils::UrlEncode(version_id) +
                        "&return_as_text=true";
    const auto error = HttpGet(target, body);
    if (error) {
        result.error = MakeError(
            error.kind == ErrorKind::kNotFound ? ErrorKind::kNotFound : ErrorKind::kUpstreamFetch,
            "Failed to download agent " + version_id + ": " + error.message);
        return result;
    }

    const auto source = UnwrapAgentSource(body);
    const auto partial = cache_dir_ / (version_id + ".py.part");
    {
        std::ofstream output(partial, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            result.error = MakeError(ErrorKind::kInternal, "Error saving agent " + version_id + ": cannot open " +
                                                               partial.string());
            return result;
        }
        output << source;
    }
    std::filesystem::rename(partial, path, ec);
    if (ec) {
        std::filesystem::remove(partial, ec);
        result.error = MakeError(ErrorKind::kInternal, "Error saving agent " + version_id);
        return result;
    }
    agentrun::utils::LogInfo(kTag, "downloaded agent " + version_id + " to " + path.string());
    result.path = path;
    return result;
}

int HttpAgentCatalog::Prefetch(int num_agents) {
    const auto listed = FetchTopAgents(num_agents);
    if (listed.error) {
        agentrun::utils::LogWarn(kTag, listed.error.message);
        return 0;
    }
    int downloaded = 0;
    for (const auto& agent : listed.agents) {
        const auto artifact = ResolveArtifact(agent.version_id);
        if (artifact.error) {
            agentrun::utils::LogWarn(kTag, artifact.error.message);
            continue;
        }
        ++downloaded;
    }
    agentrun::utils::LogInfo(
        kTag, "pre-downloaded " + std::to_string(downloaded) + "/" + std::to_string(listed.agents.size()) + " agents");
    return downloaded;
}

void HttpAgentCatalog::ClearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.clear();
    cached_request_size_ = 0;
    last_fetch_ = {};
}

std::size_t HttpAgentCatalog::CachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_.size();
}

std::string HttpAgentCatalog::UnwrapAgentSource(const std::string& body) {
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_string()) {
        return parsed.get<std::string>();
    }
    return body;
}

agentrun::errors::Error HttpAgentCatalog::ParseAgentList(const std::string& body, std::vector<AgentInfo>& agents) {
    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return MakeError(ErrorKind::kUpstreamFetch, "Error processing agents data: expected a JSON list");
    }
    agents.clear();
    for (const auto& item : parsed) {
        auto agent = AgentInfoFromJson(item);
        if (!agent.has_value()) {
            agentrun::utils::LogWarn(kTag, "skipping malformed agent record");
            continue;
        }
        agents.push_back(std::move(*agent));
    }
    return {};
}

agentrun::errors::Error HttpAgentCatalog::HttpGet(const std::string& target, std::string& body) {
    const auto parsed = agentrun::utils::ParseUrl(config_.base_url);
    if (parsed.host.empty()) {
        return MakeError(ErrorKind::kUpstreamFetch, "invalid catalog url: " + config_.base_url);
    }
    auto client = std::make_unique<httplib::Client>(parsed.SchemeHostPort());
    client->set_connection_timeout(config_.request_timeout_s);
    client->set_read_timeout(config_.request_timeout_s);
    client->set_follow_location(true);

    const auto route = agentrun::utils::JoinPath(parsed.path, target);
    agentrun::utils::LogDebug(kTag, "GET " + parsed.SchemeHostPort() + route);
    auto response = client->Get(route.c_str(), BrowserHeaders());
    if (!response) {
        return MakeError(ErrorKind::kUpstreamFetch, httplib::to_string(response.error()));
    }
    if (response->status == 404) {
        return MakeError(ErrorKind::kNotFound, "HTTP 404");
    }
    if (response->status < 200 || response->status >= 300) {
        return MakeError(ErrorKind::kUpstreamFetch, "HTTP " + std::to_string(response->status));
    }
    body = response->body;
    return {};
}

bool HttpAgentCatalog::CacheFresh(int num_agents) const {
    if (cached_.empty() || cached_request_size_ < num_agents) {
        return false;
    }
    const auto age = std::chrono::steady_clock::now() - last_fetch_;
    return age < std::chrono::seconds(config_.cache_ttl_s);
}

}  // namespace agentrun::catalog
