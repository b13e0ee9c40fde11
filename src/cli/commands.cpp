#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "api/api_server.hpp"
#include "catalog/http_agent_catalog.hpp"
#include "config/config_loader.hpp"
#include "proxy/inference_proxy.hpp"
#include "proxy/proxy_client.hpp"
#include "proxy/proxy_server.hpp"
#include "proxy/upstream_client.hpp"
#include "runs/run_registry.hpp"
#include "runs/run_service.hpp"
#include "runs/work_queue.hpp"
#include "sandbox/command_runner.hpp"
#include "sandbox/docker_runtime.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Blocks until SIGINT/SIGTERM. A second stage forces exit if teardown hangs.
void WaitForShutdownSignal() {
    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(60));
                    std::_Exit(130);
                }).detach();
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
}

agentrun::config::Config LoadAndApplyConfig() {
    auto config = agentrun::config::LoadConfig();
    agentrun::utils::LogConfig log_config{};
    log_config.min_level = agentrun::utils::ParseLogLevel(config.log.level, agentrun::utils::LogLevel::kInfo);
    agentrun::utils::ApplyLogConfig(log_config);
    return config;
}

agentrun::proxy::RunConfig ProxyDefaults(const agentrun::config::Config& config) {
    return agentrun::proxy::RunConfig{
        .inference_url = config.proxy.default_inference_url,
        .api_key = config.proxy.default_api_key
    };
}

int RunProxy() {
    const auto config = LoadAndApplyConfig();
    agentrun::proxy::RunConfigStore store;
    agentrun::proxy::HttplibUpstreamClient upstream(std::chrono::seconds(config.proxy.upstream_timeout_s));
    agentrun::proxy::InferenceProxy proxy(store, ProxyDefaults(config), upstream);
    agentrun::proxy::ProxyServer server(proxy);

    InstallSignalHandlers();
    const std::string host = config.proxy.host;
    const int port = config.proxy.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&server, &listen_failed, host, port]() {
        if (!server.Listen(host, port)) {
            std::cerr << "[proxy] http server failed to listen on " << host << ":" << port << std::endl;
            listen_failed.store(true);
            g_signal = SIGTERM;
        }
    });

    std::cout << "agentrun proxy started on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    WaitForShutdownSignal();
    server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int RunServe(bool with_proxy) {
    const auto config = LoadAndApplyConfig();

    agentrun::catalog::HttpAgentCatalog catalog(config.catalog);
    agentrun::sandbox::ProcessCommandRunner command_runner;
    agentrun::sandbox::DockerRuntime runtime(
        command_runner,
        config.sandbox.docker_binary,
        std::chrono::seconds(config.sandbox.docker_command_timeout_s));
    agentrun::proxy::HttpProxyClient proxy_client(
        config.proxy.control_url,
        std::chrono::seconds(config.proxy.control_timeout_s));
    agentrun::sandbox::SandboxManager sandbox(
        agentrun::sandbox::SandboxSettings::FromConfig(config), runtime, &proxy_client);

    const auto isolation = sandbox.VerifyIsolation();
    if (isolation) {
        agentrun::utils::LogError("sandbox", isolation.message);
        std::cerr << "refusing to start: sandbox network must be an internal docker network" << std::endl;
        return 1;
    }

    agentrun::runs::RunRegistry registry;
    agentrun::runs::WorkQueue queue(
        static_cast<std::size_t>(config.runs.workers),
        static_cast<std::size_t>(config.runs.queue_capacity));
    agentrun::runs::RunService runs(registry, catalog, sandbox, queue);
    agentrun::api::ApiServer api(
        runs, catalog,
        agentrun::api::ApiOptions{
            .default_list_limit = static_cast<std::size_t>(config.runs.default_list_limit),
            .default_num_agents = config.catalog.default_num_agents
        });

    // Optional in-process proxy for single-host setups.
    agentrun::proxy::RunConfigStore proxy_store;
    agentrun::proxy::HttplibUpstreamClient upstream(std::chrono::seconds(config.proxy.upstream_timeout_s));
    agentrun::proxy::InferenceProxy inference_proxy(proxy_store, ProxyDefaults(config), upstream);
    std::unique_ptr<agentrun::proxy::ProxyServer> proxy_server;
    std::thread proxy_thread;
    if (with_proxy) {
        proxy_server = std::make_unique<agentrun::proxy::ProxyServer>(inference_proxy);
        const std::string proxy_host = config.proxy.host;
        const int proxy_port = config.proxy.port;
        proxy_thread = std::thread([&proxy_server, proxy_host, proxy_port]() {
            if (!proxy_server->Listen(proxy_host, proxy_port)) {
                std::cerr << "[proxy] http server failed to listen on "
                          << proxy_host << ":" << proxy_port << std::endl;
            }
        });
    }

    catalog.Prefetch(config.catalog.default_num_agents);

    queue.Start();
    InstallSignalHandlers();
    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&api, &listen_failed, host, port]() {
        if (!api.Listen(host, port)) {
            std::cerr << "[api] http server failed to listen on " << host << ":" << port << std::endl;
            listen_failed.store(true);
            g_signal = SIGTERM;
        }
    });

    std::cout << "agentrun started on " << host << ":" << port << ". Press Ctrl+C to stop." << std::endl;
    WaitForShutdownSignal();

    api.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    runs.Shutdown();
    if (proxy_server) {
        proxy_server->Stop();
    }
    if (proxy_thread.joinable()) {
        proxy_thread.join();
    }
    return listen_failed.load() ? 1 : 0;
}

int ListAgents(int argc, char** argv) {
    const auto config = LoadAndApplyConfig();
    int num_agents = config.catalog.default_num_agents;
    if (argc >= 3) {
        try {
            num_agents = std::stoi(argv[2]);
        } catch (const std::exception&) {
            std::cout << "Invalid agent count: " << argv[2] << std::endl;
            return 1;
        }
    }
    agentrun::catalog::HttpAgentCatalog catalog(config.catalog);
    const auto listed = catalog.FetchTopAgents(num_agents);
    if (listed.error) {
        std::cout << listed.error.message << std::endl;
        return 1;
    }
    for (const auto& agent : listed.agents) {
        std::cout << agent.version_id << "  v" << agent.version_num << "  " << agent.miner_hotkey;
        if (agent.score.has_value()) {
            std::cout << "  score=" << *agent.score;
        }
        std::cout << std::endl;
    }
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: agentrun serve [--with-proxy] | agentrun proxy | agentrun agents [n] | agentrun help"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "serve") {
        const bool with_proxy = argc >= 3 && std::string(argv[2]) == "--with-proxy";
        return RunServe(with_proxy);
    }
    if (command == "proxy") {
        return RunProxy();
    }
    if (command == "agents") {
        return ListAgents(argc, argv);
    }
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage();
        return 0;
    }
    PrintUsage();
    return 1;
}
