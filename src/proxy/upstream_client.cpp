#include "proxy/upstream_client.hpp"

#include <memory>

#include "httplib.h"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace agentrun::proxy {

TransportError ClassifyTransportError(httplib::Error err,
                                     std::chrono::steady_clock::duration elapsed,
                                     std::chrono::seconds timeout) {
    // httplib reports both an expired read timeout and a reset peer as Read/Write;
    // only the elapsed time tells them apart.
    if (elapsed >= timeout) {
        return TransportError::kTimeout;
    }
    switch (err) {
        case httplib::Error::Read:
        case httplib::Error::Write:
        case httplib::Error::Connection:
        case httplib::Error::BindIPAddress:
        case httplib::Error::SSLConnection:
        case httplib::Error::ProxyConnection:
            return TransportError::kUnreachable;
        default:
            return TransportError::kOther;
    }
}

HttplibUpstreamClient::HttplibUpstreamClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

UpstreamResponse HttplibUpstreamClient::PostJson(const std::string& url,
                                                 const std::map<std::string, std::string>& headers,
                                                 const std::string& body) {
    UpstreamResponse upstream{};
    const auto parsed = agentrun::utils::ParseUrl(url);
    if (parsed.host.empty()) {
        upstream.transport_error = TransportError::kUnreachable;
        upstream.transport_message = "invalid inference url: " + url;
        return upstream;
    }

    auto client = std::make_unique<httplib::Client>(parsed.SchemeHostPort());
    client->set_connection_timeout(timeout_.count());
    client->set_read_timeout(timeout_.count());
    client->set_write_timeout(timeout_.count());

    httplib::Headers request_headers;
    for (const auto& [key, value] : headers) {
        request_headers.emplace(key, value);
    }

    agentrun::utils::LogDebug("proxy", "POST " + parsed.SchemeHostPort() + parsed.path);
    const auto started = std::chrono::steady_clock::now();
    auto response = client->Post(parsed.path.c_str(), request_headers, body, "application/json");
    if (!response) {
        const auto err = response.error();
        upstream.transport_error = ClassifyTransportError(err, std::chrono::steady_clock::now() - started, timeout_);
        upstream.transport_message = httplib::to_string(err);
        return upstream;
    }
    upstream.status = response->status;
    upstream.body = response->body;
    return upstream;
}

}  // namespace agentrun::proxy
