#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace agentrun::proxy {

struct RunConfig {
    std::string inference_url;
    std::string api_key;
};

// run_id -> inference endpoint and credential, for the lifetime of one sandbox.
class RunConfigStore {
public:
    void Register(const std::string& run_id, RunConfig config);
    // Returns false when the run was not registered.
    bool Unregister(const std::string& run_id);
    std::optional<RunConfig> Find(const std::string& run_id) const;
    std::size_t Count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunConfig> configs_;
};

}  // namespace agentrun::proxy
