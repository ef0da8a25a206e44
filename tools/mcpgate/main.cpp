#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include <mcpgate/config/gateway_config.h>
#include <mcpgate/gateway.h>
#include <mcpgate/store/server_repository.h>
#include <mcpgate/version.hpp>

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

int main(int argc, char* argv[]) {
    CLI::App app{"mcpgate - MCP server gateway and supervisor"};

    std::string config_path;
    std::string servers_file;
    std::string log_level;
    std::string log_file;
    bool no_supervisor = false;

    app.add_option("--config", config_path, "Config file (default: $MCPGATE_CONFIG or XDG path)");
    app.add_option("--servers", servers_file, "JSON array of server descriptors")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("--log-file", log_file, "Log file path (optional)");
    app.add_flag("--no-supervisor", no_supervisor, "Disable automatic restarts");
    app.set_version_flag("--version", std::string(mcpgate::version::long_string_v));
    CLI11_PARSE(app, argc, argv);

    auto loaded = mcpgate::config::GatewayConfig::load(config_path);
    if (!loaded) {
        std::cerr << "Failed to load configuration: " << loaded.error().message << std::endl;
        return 1;
    }
    auto config = loaded.value();
    if (!log_level.empty())
        config.logLevel = log_level;
    if (!log_file.empty())
        config.logFile = log_file;
    if (no_supervisor)
        config.supervisorEnabled = false;

    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!config.logFile.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile.string(), 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("mcpgate", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        if (config.logLevel == "trace")
            spdlog::set_level(spdlog::level::trace);
        else if (config.logLevel == "debug")
            spdlog::set_level(spdlog::level::debug);
        else if (config.logLevel == "warn")
            spdlog::set_level(spdlog::level::warn);
        else if (config.logLevel == "error")
            spdlog::set_level(spdlog::level::err);
        else
            spdlog::set_level(spdlog::level::info);

        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("mcpgate {}", mcpgate::version::long_string_v);
    if (!config.configPath.empty())
        spdlog::info("Config: {}", config.configPath.string());

    auto repository = std::make_shared<mcpgate::store::InMemoryServerRepository>();
    if (!servers_file.empty()) {
        auto servers = mcpgate::config::loadServersFile(servers_file);
        if (!servers) {
            spdlog::error("Failed to load servers: {}", servers.error().message);
            return 1;
        }
        for (auto& server : servers.value())
            repository->upsertServer(std::move(server));
        spdlog::info("Loaded {} server(s) from {}", repository->listServers().size(), servers_file);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        mcpgate::Gateway gateway(config, repository);
        auto started = gateway.start();
        if (!started) {
            spdlog::error("Failed to start gateway: {}", started.error().message);
            return 1;
        }

        for (const auto& proxy : gateway.proxies().listRunningProxies()) {
            spdlog::info("  {} ({}) -> {}", proxy.serverId, proxy.serverName,
                         mcpgate::proxy::ProxyManager::proxyUrl(proxy.port));
        }
        for (const auto& id : gateway.servers().runningServers()) {
            if (!gateway.proxies().getProxyPort(id))
                spdlog::info("  {} -> {}", id, gateway.servers().reachableUrl(id));
        }
        spdlog::info("Gateway running; press Ctrl+C to stop");

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Received shutdown signal");
        gateway.shutdown();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
