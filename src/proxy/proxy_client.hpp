#pragma once

#include <chrono>
#include <string>

namespace agentrun::proxy {

// Control-plane calls the sandbox manager makes against the inference proxy.
class ProxyRegistrar {
public:
    virtual ~ProxyRegistrar() = default;
    virtual bool Register(const std::string& run_id,
                          const std::string& inference_url,
                          const std::string& api_key) = 0;
    virtual bool Unregister(const std::string& run_id) = 0;
};

class HttpProxyClient : public ProxyRegistrar {
public:
    HttpProxyClient(std::string control_url, std::chrono::seconds timeout);

    bool Register(const std::string& run_id,
                  const std::string& inference_url,
                  const std::string& api_key) override;
    bool Unregister(const std::string& run_id) override;

private:
    std::string control_url_;
    std::chrono::seconds timeout_;
};

}  // namespace agentrun::proxy
