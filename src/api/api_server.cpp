#include "api/api_server.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>

#include "utils/logging.hpp"

namespace agentrun::api {
namespace {

constexpr const char* kTag = "api";
constexpr long long kMaxNumAgents = 1000;

void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void WriteDetail(httplib::Response& res, int status, const std::string& detail) {
    WriteJson(res, status, {{"detail", detail}});
}

std::optional<long long> ParsePositive(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string RequiredString(const nlohmann::json& body, const std::string& name, std::string& missing) {
    if (body.contains(name) && body[name].is_string()) {
        return body[name].get<std::string>();
    }
    if (!missing.empty()) {
        missing += ", ";
    }
    missing += name;
    return {};
}

}  // namespace

ApiServer::ApiServer(agentrun::runs::RunService& runs,
                     agentrun::catalog::AgentCatalog& catalog,
                     ApiOptions options)
    : runs_(runs)
    , catalog_(catalog)
    , options_(options) {
    RegisterRoutes();
}

bool ApiServer::Listen(const std::string& host, int port) {
    agentrun::utils::LogInfo(kTag, "listening on " + host + ":" + std::to_string(port));
    return server_.listen(host, port);
}

int ApiServer::BindToAnyPort(const std::string& host) {
    return server_.bind_to_any_port(host);
}

bool ApiServer::ListenAfterBind() {
    return server_.listen_after_bind();
}

void ApiServer::Stop() {
    server_.stop();
}

void ApiServer::RegisterRoutes() {
    using namespace std::placeholders;
    server_.Get("/", Guarded(std::bind(&ApiServer::HandleRoot, this, _1, _2)));
    server_.Post("/run", Guarded(std::bind(&ApiServer::HandleSubmit, this, _1, _2)));
    server_.Get("/runs", Guarded(std::bind(&ApiServer::HandleListRuns, this, _1, _2)));
    server_.Get(R"(/runs/([^/]+))", Guarded(std::bind(&ApiServer::HandleGetRun, this, _1, _2)));
    server_.Delete(R"(/runs/([^/]+))", Guarded(std::bind(&ApiServer::HandleDeleteRun, this, _1, _2)));
    server_.Get("/agents", Guarded(std::bind(&ApiServer::HandleListAgents, this, _1, _2)));
    server_.Get(R"(/agents/([^/]+))", Guarded(std::bind(&ApiServer::HandleGetAgent, this, _1, _2)));
}

ApiServer::Handler ApiServer::Guarded(Handler handler) const {
    return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& ex) {
            agentrun::utils::LogError(kTag, req.method + " " + req.path + " failed: " + ex.what());
            WriteDetail(res, 500, std::string("Internal error: ") + ex.what());
        }
    };
}

void ApiServer::HandleRoot(const httplib::Request&, httplib::Response& res) {
    WriteJson(res, 200, {
        {"service", "Custom Agent Runner API"},
        {"status", "running"},
        {"endpoints", {
            {"POST /run", "Submit a new agent run"},
            {"GET /runs", "List runs, newest first"},
            {"GET /runs/{run_id}", "Get run status and results"},
            {"DELETE /runs/{run_id}", "Cancel and delete a run"},
            {"GET /agents", "List available agents"},
            {"GET /agents/{version_id}", "Get specific agent info"}
        }}
    });
}

void ApiServer::HandleSubmit(const httplib::Request& req, httplib::Response& res) {
    const auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        WriteDetail(res, 400, "request body must be a JSON object");
        return;
    }
    std::string missing;
    agentrun::runs::SubmitRequest request{};
    request.agent_id = RequiredString(body, "agent_id", missing);
    request.problem_statement = RequiredString(body, "problem_statement", missing);
    request.inference_url = RequiredString(body, "inference_url", missing);
    request.api_key = RequiredString(body, "api_key", missing);
    if (!missing.empty()) {
        WriteDetail(res, 400, "missing or invalid fields: " + missing);
        return;
    }

    if (body.contains("files") && !body["files"].is_null()) {
        const auto& files = body["files"];
        if (!files.is_object()) {
            WriteDetail(res, 400, "files must be an object of relative path to text");
            return;
        }
        agentrun::sandbox::FileMap map;
        for (const auto& [path, content] : files.items()) {
            if (!content.is_string()) {
                WriteDetail(res, 400, "file content must be text: " + path);
                return;
            }
            map[path] = content.get<std::string>();
        }
        request.files = std::move(map);
    }

    const auto run = runs_.Submit(request);
    agentrun::utils::LogInfo(kTag, "POST /run -> " + run.run_id + " " + agentrun::runs::ToString(run.status));
    WriteJson(res, 200, agentrun::runs::RunToJson(run));
}

void ApiServer::HandleGetRun(const httplib::Request& req, httplib::Response& res) {
    const std::string run_id = req.matches[1];
    const auto run = runs_.Get(run_id);
    if (!run.has_value()) {
        WriteDetail(res, 404, "Run " + run_id + " not found");
        return;
    }
    WriteJson(res, 200, agentrun::runs::RunToJson(*run));
}

void ApiServer::HandleListRuns(const httplib::Request& req, httplib::Response& res) {
    std::optional<agentrun::runs::RunStatus> status;
    if (req.has_param("status") && !req.get_param_value("status").empty()) {
        status = agentrun::runs::ParseRunStatus(req.get_param_value("status"));
        if (!status.has_value()) {
            WriteDetail(res, 400, "unknown status: " + req.get_param_value("status"));
            return;
        }
    }
    std::size_t limit = options_.default_list_limit;
    if (req.has_param("limit")) {
        const auto parsed = ParsePositive(req.get_param_value("limit"));
        if (!parsed.has_value()) {
            WriteDetail(res, 400, "limit must be a positive integer");
            return;
        }
        limit = static_cast<std::size_t>(*parsed);
    }
    nlohmann::json json = nlohmann::json::array();
    for (const auto& run : runs_.List(status, limit)) {
        json.push_back(agentrun::runs::RunToJson(run));
    }
    WriteJson(res, 200, json);
}

void ApiServer::HandleDeleteRun(const httplib::Request& req, httplib::Response& res) {
    const std::string run_id = req.matches[1];
    if (!runs_.Delete(run_id)) {
        WriteDetail(res, 404, "Run " + run_id + " not found");
        return;
    }
    WriteJson(res, 200, {{"message", "Run " + run_id + " deleted successfully"}});
}

void ApiServer::HandleListAgents(const httplib::Request& req, httplib::Response& res) {
    int num_agents = options_.default_num_agents;
    if (req.has_param("num_agents")) {
        const auto parsed = ParsePositive(req.get_param_value("num_agents"));
        if (!parsed.has_value()) {
            WriteDetail(res, 400, "num_agents must be a positive integer");
            return;
        }
        num_agents = static_cast<int>(std::min<long long>(*parsed, kMaxNumAgents));
    }
    const auto listed = catalog_.FetchTopAgents(num_agents);
    if (listed.error) {
        WriteDetail(res, agentrun::errors::HttpStatusFor(listed.error.kind), listed.error.message);
        return;
    }
    nlohmann::json json = nlohmann::json::array();
    for (const auto& agent : listed.agents) {
        json.push_back(agentrun::catalog::AgentInfoToJson(agent));
    }
    WriteJson(res, 200, json);
}

void ApiServer::HandleGetAgent(const httplib::Request& req, httplib::Response& res) {
    const std::string version_id = req.matches[1];
    const auto lookup = catalog_.GetAgent(version_id);
    if (lookup.error) {
        WriteDetail(res, agentrun::errors::HttpStatusFor(lookup.error.kind), lookup.error.message);
        return;
    }
    if (!lookup.agent.has_value()) {
        WriteDetail(res, 404, "Agent " + version_id + " not found");
        return;
    }
    WriteJson(res, 200, agentrun::catalog::AgentInfoToJson(*lookup.agent));
}

}  // namespace agentrun::api
