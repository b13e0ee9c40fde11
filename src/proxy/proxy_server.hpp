#pragma once

#include <string>

#include "httplib.h"
#include "proxy/inference_proxy.hpp"

namespace agentrun::proxy {

// HTTP surface of the inference proxy: run registration plus the
// chat-completion relay used by sandboxed agents.
class ProxyServer {
public:
    explicit ProxyServer(InferenceProxy& proxy);

    // Blocks until Stop() is called or the socket fails.
    bool Listen(const std::string& host, int port);
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    void Stop();

    httplib::Server& Http() { return server_; }

private:
    void RegisterRoutes();
    void HandleRegister(const httplib::Request& req, httplib::Response& res);
    void HandleInference(const httplib::Request& req, httplib::Response& res);
    void HandleUnregister(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);

    InferenceProxy& proxy_;
    httplib::Server server_;
};

}  // namespace agentrun::proxy
