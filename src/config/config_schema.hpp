#pragma once

#include <string>

namespace agentrun::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8888;
};

struct ProxyConfig {
    std::string host = "0.0.0.0";
    int port = 8001;
    // Address the service uses to register/unregister runs with the proxy.
    std::string control_url = "http://localhost:8001";
    // Address agents inside the sandbox network use to reach the proxy.
    std::string internal_url = "http://proxy:8001";
    std::string default_inference_url = "https://api.openai.com/v1/chat/completions";
    std::string default_api_key;
    int upstream_timeout_s = 120;
    int control_timeout_s = 5;
};

struct SandboxConfig {
    std::string docker_binary = "docker";
    // Built from docker/sandbox.Dockerfile; dependencies are baked in so the
    // sandbox network can stay internal.
    std::string image = "agentrun-sandbox:py3.11";
    std::string network = "agentrun_sandbox";
    std::string memory_limit = "2g";
    double cpu_limit = 2.0;
    int timeout_s = 300;
    int poll_interval_ms = 1000;
    int docker_command_timeout_s = 60;
    std::string workspace_root;
    std::string setup_command = "python runner.py";
};

struct CatalogConfig {
    std::string base_url = "https://platform.ridges.ai";
    std::string cache_dir = "./agent_cache";
    int cache_ttl_s = 300;
    int default_num_agents = 15;
    int request_timeout_s = 30;
};

struct RunsConfig {
    int workers = 4;
    int queue_capacity = 64;
    int default_list_limit = 50;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    ProxyConfig proxy;
    SandboxConfig sandbox;
    CatalogConfig catalog;
    RunsConfig runs;
    LogSettings log;
};

}  // namespace agentrun::config
