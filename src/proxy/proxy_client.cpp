#include "proxy/proxy_client.hpp"

#include <memory>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace agentrun::proxy {
namespace {

std::unique_ptr<httplib::Client> MakeClient(const agentrun::utils::ParsedUrl& parsed,
                                            std::chrono::seconds timeout) {
    auto client = std::make_unique<httplib::Client>(parsed.SchemeHostPort());
    client->set_connection_timeout(timeout.count());
    client->set_read_timeout(timeout.count());
    client->set_write_timeout(timeout.count());
    return client;
}

}  // namespace

HttpProxyClient::HttpProxyClient(std::string control_url, std::chrono::seconds timeout)
    : control_url_(std::move(control_url))
    , timeout_(timeout) {}

bool HttpProxyClient::Register(const std::string& run_id,
                               const std::string& inference_url,
                               const std::string& api_key) {
    const auto parsed = agentrun::utils::ParseUrl(control_url_);
    auto client = MakeClient(parsed, timeout_);
    const nlohmann::json body = {
        {"run_id", run_id},
        {"inference_url", inference_url},
        {"api_key", api_key}
    };
    const auto route = agentrun::utils::JoinPath(parsed.path, "/register_run");
    auto response = client->Post(route.c_str(), body.dump(), "application/json");
    if (!response) {
        agentrun::utils::LogWarn(
            "proxy", "register_run failed for " + run_id + ": " + httplib::to_string(response.error()));
        return false;
    }
    if (response->status != 200) {
        agentrun::utils::LogWarn(
            "proxy", "register_run for " + run_id + " returned HTTP " + std::to_string(response->status));
        return false;
    }
    agentrun::utils::LogInfo(
        "proxy", "registered run " + run_id + " api_key=" + agentrun::utils::MaskKey(api_key));
    return true;
}

bool HttpProxyClient::Unregister(const std::string& run_id) {
    const auto parsed = agentrun::utils::ParseUrl(control_url_);
    auto client = MakeClient(parsed, timeout_);
    const auto route = agentrun::utils::JoinPath(parsed.path, "/unregister_run/" + run_id);
    auto response = client->Delete(route.c_str());
    if (!response) {
        agentrun::utils::LogWarn(
            "proxy", "unregister_run failed for " + run_id + ": " + httplib::to_string(response.error()));
        return false;
    }
    return response->status == 200;
}

}  // namespace agentrun::proxy
