#include "proxy/proxy_server.hpp"

#include "utils/logging.hpp"

namespace agentrun::proxy {
namespace {

constexpr const char* kTag = "proxy";

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void WriteDetail(httplib::Response& res, int status, const std::string& detail) {
    WriteJson(res, status, {{"detail", detail}});
}

// Query parameter first, then the JSON body.
std::string ReadField(const httplib::Request& req, const nlohmann::json& body, const std::string& name) {
    if (req.has_param(name)) {
        return req.get_param_value(name);
    }
    if (body.is_object() && body.contains(name) && body[name].is_string()) {
        return body[name].get<std::string>();
    }
    return {};
}

}  // namespace

ProxyServer::ProxyServer(InferenceProxy& proxy)
    : proxy_(proxy) {
    RegisterRoutes();
}

bool ProxyServer::Listen(const std::string& host, int port) {
    agentrun::utils::LogInfo(kTag, "listening on " + host + ":" + std::to_string(port));
    return server_.listen(host, port);
}

int ProxyServer::BindToAnyPort(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool ProxyServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void ProxyServer::Stop() {
    server_.stop();
}

void ProxyServer::RegisterRoutes() {
    server_.Post("/register_run", [this](const httplib::Request& req, httplib::Response& res) {
        HandleRegister(req, res);
    });
    server_.Post("/agents/inference", [this](const httplib::Request& req, httplib::Response& res) {
        HandleInference(req, res);
    });
    server_.Delete(R"(/unregister_run/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        HandleUnregister(req, res);
    });
    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        HandleHealth(req, res);
    });
}

void ProxyServer::HandleRegister(const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body = nlohmann::json::object();
    if (!req.body.empty()) {
        body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded()) {
            WriteDetail(res, 400, "invalid JSON body");
            return;
        }
    }
    const auto run_id = ReadField(req, body, "run_id");
    const auto inference_url = ReadField(req, body, "inference_url");
    const auto api_key = ReadField(req, body, "api_key");
    if (run_id.empty() || inference_url.empty() || api_key.empty()) {
        WriteDetail(res, 400, "run_id, inference_url and api_key are required");
        return;
    }
    proxy_.Store().Register(run_id, RunConfig{.inference_url = inference_url, .api_key = api_key});
    agentrun::utils::LogInfo(
        kTag, "register_run " + run_id + " -> " + inference_url +
                  " api_key=" + agentrun::utils::MaskKey(api_key));
    WriteJson(res, 200, {{"status", "registered"}, {"run_id", run_id}});
}

void ProxyServer::HandleInference(const httplib::Request& req, httplib::Response& res) {
    const auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        WriteDetail(res, 400, "invalid JSON body");
        return;
    }
    InferenceRequest request{};
    const auto error = ParseInferenceRequest(body, request);
    if (error) {
        WriteDetail(res, agentrun::errors::HttpStatusFor(error.kind), error.message);
        return;
    }
    try {
        const auto response = proxy_.HandleInference(request);
        WriteJson(res, response.status, response.body);
    } catch (const std::exception& ex) {
        agentrun::utils::LogError(kTag, std::string("unexpected error: ") + ex.what());
        WriteDetail(res, 500, std::string("Internal error: ") + ex.what());
    }
}

void ProxyServer::HandleUnregister(const httplib::Request& req, httplib::Response& res) {
    const std::string run_id = req.matches[1];
    const bool removed = proxy_.Store().Unregister(run_id);
    agentrun::utils::LogDebug(kTag, "unregister_run " + run_id + (removed ? "" : " (not found)"));
    WriteJson(res, 200, {{"status", removed ? "unregistered" : "not_found"}, {"run_id", run_id}});
}

void ProxyServer::HandleHealth(const httplib::Request&, httplib::Response& res) {
    WriteJson(res, 200, {{"status", "healthy"}, {"registered_runs", proxy_.Store().Count()}});
}

}  // namespace agentrun::proxy
