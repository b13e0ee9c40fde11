#pragma once

#include <chrono>
#include <map>
#include <string>

#include "httplib.h"

namespace agentrun::proxy {

enum class TransportError {
    kNone,
    kTimeout,
    kUnreachable,
    kOther
};

struct UpstreamResponse {
    TransportError transport_error = TransportError::kNone;
    std::string transport_message;
    int status = 0;
    std::string body;
};

// Maps an httplib failure to the proxy's transport error classes.
TransportError ClassifyTransportError(httplib::Error err,
                                      std::chrono::steady_clock::duration elapsed,
                                      std::chrono::seconds timeout);

// HTTP client towards the external inference provider.
class UpstreamClient {
public:
    virtual ~UpstreamClient() = default;
    virtual UpstreamResponse PostJson(const std::string& url,
                                      const std::map<std::string, std::string>& headers,
                                      const std::string& body) = 0;
};

class HttplibUpstreamClient : public UpstreamClient {
public:
    explicit HttplibUpstreamClient(std::chrono::seconds timeout);

    UpstreamResponse PostJson(const std::string& url,
                              const std::map<std::string, std::string>& headers,
                              const std::string& body) override;

private:
    std::chrono::seconds timeout_;
};

}  // namespace agentrun::proxy
