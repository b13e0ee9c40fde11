#pragma once

#include <optional>
#include <string>

#include "errors/errors.hpp"
#include "nlohmann/json.hpp"
#include "proxy/run_config_store.hpp"
#include "proxy/upstream_client.hpp"

namespace agentrun::proxy {

struct InferenceRequest {
    nlohmann::json messages = nlohmann::json::array();
    std::string model;
    double temperature = 0.0;
    std::string run_id;
    int max_tokens = 4096;
};

// Fills request from a JSON body; returns a validation error on missing fields.
agentrun::errors::Error ParseInferenceRequest(const nlohmann::json& body, InferenceRequest& request);

struct ProxyResponse {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
    agentrun::errors::ErrorKind error = agentrun::errors::ErrorKind::kNone;
};

class InferenceProxy {
public:
    InferenceProxy(RunConfigStore& store, RunConfig defaults, UpstreamClient& upstream);

    ProxyResponse HandleInference(const InferenceRequest& request);

    // Registered config for run_id, else the process defaults when they carry a
    // credential, else nothing.
    std::optional<RunConfig> Resolve(const std::string& run_id) const;

    RunConfigStore& Store() { return store_; }

    static std::string NormalizeAuthorization(const std::string& api_key);
    // Relays a "choices" response untouched, otherwise wraps its text field
    // into a single assistant choice.
    static nlohmann::json NormalizeCompletion(const nlohmann::json& provider_body);

private:
    static ProxyResponse Failure(agentrun::errors::ErrorKind kind, int status, const std::string& detail);

    RunConfigStore& store_;
    RunConfig defaults_;
    UpstreamClient& upstream_;
};

}  // namespace agentrun::proxy
