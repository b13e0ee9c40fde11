#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "catalog/agent_catalog.hpp"
#include "httplib.h"
#include "runs/run_service.hpp"

namespace agentrun::api {

struct ApiOptions {
    std::size_t default_list_limit = 50;
    int default_num_agents = 15;
};

// Submission API: run lifecycle plus read-only access to the agent catalog.
class ApiServer {
public:
    ApiServer(agentrun::runs::RunService& runs,
              agentrun::catalog::AgentCatalog& catalog,
              ApiOptions options);

    bool Listen(const std::string& host, int port);
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    void Stop();

private:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    void RegisterRoutes();
    Handler Guarded(Handler handler) const;

    void HandleRoot(const httplib::Request& req, httplib::Response& res);
    void HandleSubmit(const httplib::Request& req, httplib::Response& res);
    void HandleGetRun(const httplib::Request& req, httplib::Response& res);
    void HandleListRuns(const httplib::Request& req, httplib::Response& res);
    void HandleDeleteRun(const httplib::Request& req, httplib::Response& res);
    void HandleListAgents(const httplib::Request& req, httplib::Response& res);
    void HandleGetAgent(const httplib::Request& req, httplib::Response& res);

    agentrun::runs::RunService& runs_;
    agentrun::catalog::AgentCatalog& catalog_;
    ApiOptions options_;
    httplib::Server server_;
};

}  // namespace agentrun::api
