#include "proxy/inference_proxy.hpp"

#include <map>
#include <utility>

#include "utils/logging.hpp"

namespace agentrun::proxy {
namespace {

using agentrun::errors::ErrorKind;
using agentrun::errors::MakeError;

constexpr const char* kTag = "proxy";
constexpr const char* kBearerPrefix = "Bearer ";

}  // namespace

agentrun::errors::Error ParseInferenceRequest(const nlohmann::json& body, InferenceRequest& request) {
    if (!body.is_object()) {
        return MakeError(ErrorKind::kValidation, "request body must be a JSON object");
    }
    if (!body.contains("messages") || !body["messages"].is_array()) {
        return MakeError(ErrorKind::kValidation, "messages must be a list");
    }
    if (!body.contains("model") || !body["model"].is_string()) {
        return MakeError(ErrorKind::kValidation, "model is required");
    }
    if (!body.contains("run_id") || !body["run_id"].is_string()) {
        return MakeError(ErrorKind::kValidation, "run_id is required");
    }
    request.messages = body["messages"];
    request.model = body["model"].get<std::string>();
    request.run_id = body["run_id"].get<std::string>();
    if (body.contains("temperature") && body["temperature"].is_number()) {
        request.temperature = body["temperature"].get<double>();
    }
    if (body.contains("max_tokens") && body["max_tokens"].is_number_integer()) {
        request.max_tokens = body["max_tokens"].get<int>();
    }
    return {};
}

InferenceProxy::InferenceProxy(RunConfigStore& store, RunConfig defaults, UpstreamClient& upstream)
    : store_(store)
    , defaults_(std::move(defaults))
    , upstream_(upstream) {}

std::optional<RunConfig> InferenceProxy::Resolve(const std::string& run_id) const {
    auto config = store_.Find(run_id);
    if (config.has_value()) {
        return config;
    }
    if (defaults_.api_key.empty()) {
        return std::nullopt;
    }
    return defaults_;
}

ProxyResponse InferenceProxy::HandleInference(const InferenceRequest& request) {
    const auto config = Resolve(request.run_id);
    if (!config.has_value()) {
        return Failure(ErrorKind::kProxyAuth, 401, "No API key configured for this run");
    }

    const std::map<std::string, std::string> headers = {
        {"Authorization", NormalizeAuthorization(config->api_key)}
    };
    const nlohmann::json payload = {
        {"messages", request.messages},
        {"model", request.model},
        {"temperature", request.temperature},
        {"max_tokens", request.max_tokens}
    };

    agentrun::utils::LogInfo(
        kTag,
        "inference run=" + request.run_id + " model=" + request.model +
            " api_key=" + agentrun::utils::MaskKey(config->api_key));

    const auto upstream = upstream_.PostJson(config->inference_url, headers, payload.dump());
    switch (upstream.transport_error) {
        case TransportError::kNone:
            break;
        case TransportError::kTimeout:
            return Failure(ErrorKind::kProxyUpstreamTimeout, 504, "Inference request timed out");
        case TransportError::kUnreachable:
            agentrun::utils::LogError(kTag, "request error: " + upstream.transport_message);
            return Failure(
                ErrorKind::kProxyUpstreamUnreachable, 502,
                "Failed to connect to inference provider: " + upstream.transport_message);
        case TransportError::kOther:
            agentrun::utils::LogError(kTag, "unexpected error: " + upstream.transport_message);
            return Failure(ErrorKind::kInternal, 500, "Internal error: " + upstream.transport_message);
    }

    if (upstream.status != 200) {
        agentrun::utils::LogError(
            kTag, "inference error: " + std::to_string(upstream.status) + " - " + upstream.body);
        return Failure(
            ErrorKind::kProxyUpstreamStatus, upstream.status,
            "Inference provider error: " + upstream.body);
    }

    auto body = nlohmann::json::parse(upstream.body, nullptr, false);
    if (body.is_discarded()) {
        return Failure(ErrorKind::kInternal, 500, "Internal error: provider returned invalid JSON");
    }

    ProxyResponse response{};
    response.body = NormalizeCompletion(body);
    return response;
}

std::string InferenceProxy::NormalizeAuthorization(const std::string& api_key) {
    if (api_key.rfind(kBearerPrefix, 0) == 0) {
        return api_key;
    }
    return kBearerPrefix + api_key;
}

nlohmann::json InferenceProxy::NormalizeCompletion(const nlohmann::json& provider_body) {
    if (provider_body.is_object() && provider_body.contains("choices")) {
        return provider_body;
    }
    std::string content;
    if (provider_body.is_object() && provider_body.contains("text")) {
        const auto& text = provider_body["text"];
        content = text.is_string() ? text.get<std::string>() : text.dump();
    } else {
        content = provider_body.dump();
    }
    return {
        {"choices", nlohmann::json::array({
            {{"message", {{"role", "assistant"}, {"content", content}}}}
        })}
    };
}

ProxyResponse InferenceProxy::Failure(ErrorKind kind, int status, const std::string& detail) {
    ProxyResponse response{};
    response.status = status;
    response.error = kind;
    response.body = {
        {"detail", detail},
        {"error", agentrun::errors::ToString(kind)}
    };
    return response;
}

}  // namespace agentrun::proxy
