#include "proxy/run_config_store.hpp"

namespace agentrun::proxy {

void RunConfigStore::Register(const std::string& run_id, RunConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[run_id] = std::move(config);
}

bool RunConfigStore::Unregister(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.erase(run_id) > 0;
}

std::optional<RunConfig> RunConfigStore::Find(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(run_id);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t RunConfigStore::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.size();
}

}  // namespace agentrun::proxy
