#include "config/config_loader.hpp"

#include <fstream>
#include <string>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace agentrun::config {
namespace {

using agentrun::utils::GetEnv;

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

void OverrideString(const char* name, std::string& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

void OverrideInt(const char* name, int& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

void OverrideDouble(const char* name, double& target) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseDouble(value, target);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("AGENTRUN_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return agentrun::utils::GetHomePath() / ".agentrun" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
    }

    if (data.contains("proxy") && data["proxy"].is_object()) {
        const auto& proxy = data["proxy"];
        ReadString(proxy, "host", config.proxy.host);
        ReadInt(proxy, "port", config.proxy.port);
        ReadString(proxy, "controlUrl", config.proxy.control_url);
        ReadString(proxy, "internalUrl", config.proxy.internal_url);
        ReadString(proxy, "defaultInferenceUrl", config.proxy.default_inference_url);
        ReadString(proxy, "defaultApiKey", config.proxy.default_api_key);
        ReadInt(proxy, "upstreamTimeoutS", config.proxy.upstream_timeout_s);
        ReadInt(proxy, "controlTimeoutS", config.proxy.control_timeout_s);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "dockerBinary", config.sandbox.docker_binary);
        ReadString(sandbox, "image", config.sandbox.image);
        ReadString(sandbox, "network", config.sandbox.network);
        ReadString(sandbox, "memoryLimit", config.sandbox.memory_limit);
        ReadDouble(sandbox, "cpuLimit", config.sandbox.cpu_limit);
        ReadInt(sandbox, "timeoutS", config.sandbox.timeout_s);
        ReadInt(sandbox, "pollIntervalMs", config.sandbox.poll_interval_ms);
        ReadInt(sandbox, "dockerCommandTimeoutS", config.sandbox.docker_command_timeout_s);
        ReadString(sandbox, "workspaceRoot", config.sandbox.workspace_root);
        ReadString(sandbox, "setupCommand", config.sandbox.setup_command);
    }

    if (data.contains("catalog") && data["catalog"].is_object()) {
        const auto& catalog = data["catalog"];
        ReadString(catalog, "baseUrl", config.catalog.base_url);
        ReadString(catalog, "cacheDir", config.catalog.cache_dir);
        ReadInt(catalog, "cacheTtlS", config.catalog.cache_ttl_s);
        ReadInt(catalog, "defaultNumAgents", config.catalog.default_num_agents);
        ReadInt(catalog, "requestTimeoutS", config.catalog.request_timeout_s);
    }

    if (data.contains("runs") && data["runs"].is_object()) {
        const auto& runs = data["runs"];
        ReadInt(runs, "workers", config.runs.workers);
        ReadInt(runs, "queueCapacity", config.runs.queue_capacity);
        ReadInt(runs, "defaultListLimit", config.runs.default_list_limit);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.log.level);
    }
}

void ApplyEnvOverrides(Config& config) {
    OverrideString("AGENTRUN_SERVER_HOST", config.server.host);
    OverrideInt("AGENTRUN_SERVER_PORT", config.server.port);

    OverrideString("AGENTRUN_PROXY_HOST", config.proxy.host);
    OverrideInt("AGENTRUN_PROXY_PORT", config.proxy.port);
    OverrideString("AGENTRUN_PROXY_CONTROL_URL", config.proxy.control_url);
    OverrideString("AGENTRUN_PROXY_INTERNAL_URL", config.proxy.internal_url);
    OverrideInt("AGENTRUN_PROXY_UPSTREAM_TIMEOUT_S", config.proxy.upstream_timeout_s);
    // Process-wide inference defaults keep the names the proxy has always read.
    OverrideString("INFERENCE_URL", config.proxy.default_inference_url);
    OverrideString("API_KEY", config.proxy.default_api_key);
    OverrideString("AGENTRUN_PROXY_DEFAULT_INFERENCE_URL", config.proxy.default_inference_url);
    OverrideString("AGENTRUN_PROXY_DEFAULT_API_KEY", config.proxy.default_api_key);

    OverrideString("AGENTRUN_SANDBOX_DOCKER_BINARY", config.sandbox.docker_binary);
    OverrideString("AGENTRUN_SANDBOX_IMAGE", config.sandbox.image);
    OverrideString("AGENTRUN_SANDBOX_NETWORK", config.sandbox.network);
    OverrideString("AGENTRUN_SANDBOX_MEMORY_LIMIT", config.sandbox.memory_limit);
    OverrideDouble("AGENTRUN_SANDBOX_CPU_LIMIT", config.sandbox.cpu_limit);
    OverrideInt("AGENTRUN_SANDBOX_TIMEOUT_S", config.sandbox.timeout_s);
    OverrideInt("AGENTRUN_SANDBOX_POLL_INTERVAL_MS", config.sandbox.poll_interval_ms);
    OverrideString("AGENTRUN_SANDBOX_WORKSPACE_ROOT", config.sandbox.workspace_root);

    OverrideString("AGENTRUN_CATALOG_BASE_URL", config.catalog.base_url);
    OverrideString("AGENTRUN_CATALOG_CACHE_DIR", config.catalog.cache_dir);
    OverrideInt("AGENTRUN_CATALOG_CACHE_TTL_S", config.catalog.cache_ttl_s);

    OverrideInt("AGENTRUN_RUNS_WORKERS", config.runs.workers);
    OverrideInt("AGENTRUN_RUNS_QUEUE_CAPACITY", config.runs.queue_capacity);

    OverrideString("AGENTRUN_LOG_LEVEL", config.log.level);
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            agentrun::utils::LogWarn(
                "config", "ignoring unparseable config file " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);

    if (config.runs.workers < 1) {
        config.runs.workers = 1;
    }
    if (config.runs.queue_capacity < 1) {
        config.runs.queue_capacity = 1;
    }
    if (config.sandbox.poll_interval_ms < 10) {
        config.sandbox.poll_interval_ms = 10;
    }
    return config;
}

}  // namespace agentrun::config
