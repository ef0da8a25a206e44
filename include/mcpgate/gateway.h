#pragma once

#include <atomic>
#include <memory>
#include <mcpgate/config/gateway_config.h>
#include <mcpgate/core/io_runtime.h>
#include <mcpgate/discovery/tool_discovery_service.h>
#include <mcpgate/logging/log_watcher_manager.h>
#include <mcpgate/proxy/proxy_manager.h>
#include <mcpgate/server/server_manager.h>
#include <mcpgate/store/server_repository.h>
#include <mcpgate/supervisor/auto_restart_supervisor.h>

namespace mcpgate {

/**
 * Process-wide gateway state, constructed once at startup.
 *
 * Owns the io runtime and every service built on it. Every successful server start is
 * followed by a background tool discovery. start() reconciles recorded runtime state and
 * launches the supervisor; shutdown() stops the supervisor, every server and
 * proxy, the log watchers and finally the runtime. shutdown() is idempotent and runs from
 * the destructor.
 */
class Gateway {
public:
    Gateway(config::GatewayConfig config, std::shared_ptr<store::IServerRepository> repository,
            proxy::BridgeFactory bridgeFactory = {});
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    Result<void> start();
    void shutdown();

    const config::GatewayConfig& config() const { return config_; }
    core::IoRuntime& runtime() { return *runtime_; }
    store::IServerRepository& repository() { return *repository_; }
    proxy::ProxyManager& proxies() { return *proxies_; }
    server::ServerManager& servers() { return *servers_; }
    supervisor::AutoRestartSupervisor& supervisor() { return *supervisor_; }
    discovery::ToolDiscoveryService& discovery() { return *discovery_; }
    logging::LogWatcherManager& logs() { return *logs_; }

    transport::TransportContext transportContext();

private:
    void discoverAfterStart(const model::ServerDescriptor& server);

    config::GatewayConfig config_;
    std::unique_ptr<core::IoRuntime> runtime_;
    std::shared_ptr<store::IServerRepository> repository_;
    std::shared_ptr<proxy::PortAllocator> allocator_;
    std::shared_ptr<proxy::ProxyManager> proxies_;
    std::shared_ptr<server::ServerManager> servers_;
    std::shared_ptr<supervisor::AutoRestartSupervisor> supervisor_;
    std::unique_ptr<discovery::ToolDiscoveryService> discovery_;
    std::unique_ptr<logging::LogWatcherManager> logs_;
    std::atomic<bool> started_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace mcpgate
