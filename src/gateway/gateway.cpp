#include <mcpgate/core/format.h>
#include <mcpgate/gateway.h>
#include <mcpgate/proxy/stdio_bridge.h>

#include <filesystem>
#include <future>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate {

namespace {
constexpr auto kShutdownWait = std::chrono::seconds(60);

boost::asio::awaitable<void> discoverTools(discovery::ToolDiscoveryService& discovery, ServerId id,
                                           std::shared_ptr<mcp::IRequestSender> sender) {
    Result<int> count;
    if (sender)
        count = co_await discovery.discoverAndCacheDirect(id, *sender);
    else
        count = co_await discovery.discoverAndCache(id);
    if (count)
        spdlog::info("[Gateway] discovered {} tools for {}", count.value(), id);
    else
        spdlog::warn("[Gateway] tool discovery for {} failed: {}", id, count.error().message);
}
} // namespace

Gateway::Gateway(config::GatewayConfig config, std::shared_ptr<store::IServerRepository> repository,
                 proxy::BridgeFactory bridgeFactory)
    : config_(std::move(config)), runtime_(std::make_unique<core::IoRuntime>(config_.ioThreads)),
      repository_(std::move(repository)) {
    auto ctx = transportContext();
    if (!bridgeFactory)
        bridgeFactory = proxy::makeStdioBridgeFactory(ctx);

    allocator_ = std::make_shared<proxy::PortAllocator>(config_.portRangeStart, config_.portRangeEnd);
    proxies_ = std::make_shared<proxy::ProxyManager>(allocator_, std::move(bridgeFactory));
    servers_ = std::make_shared<server::ServerManager>(repository_, proxies_, ctx);

    supervisor::AutoRestartConfig restartConfig;
    restartConfig.enabled = config_.supervisorEnabled;
    restartConfig.healthCheckInterval = config_.healthCheckInterval;
    restartConfig.maxRestartAttempts = config_.maxRestartAttempts;
    restartConfig.restartDelay = config_.restartDelay;
    supervisor_ = std::make_shared<supervisor::AutoRestartSupervisor>(
        runtime_->executor(), repository_, servers_, restartConfig);

    discovery::ToolDiscoveryService::Options discoveryOptions;
    discoveryOptions.cacheTtl = config_.discoveryCacheTtl;
    std::weak_ptr<server::ServerManager> weakServers = servers_;
    discovery_ = std::make_unique<discovery::ToolDiscoveryService>(
        runtime_->executor(), repository_,
        [weakServers](const ServerId& id) {
            auto servers = weakServers.lock();
            return servers ? servers->reachableUrl(id) : std::string{};
        },
        discoveryOptions);

    logs_ = std::make_unique<logging::LogWatcherManager>(
        runtime_->executor(), logging::LogWatcherManager::Options{config_.mcpLogRoot(), 1000});

    servers_->setStartedHook(
        [this](const model::ServerDescriptor& server) { discoverAfterStart(server); });
}

Gateway::~Gateway() {
    shutdown();
}

transport::TransportContext Gateway::transportContext() {
    return transport::TransportContext{runtime_->executor(), config_.runtimeBinDir,
                                       config_.mcpLogRoot()};
}

Result<void> Gateway::start() {
    if (shutdown_.load())
        return Error{ErrorCode::InvalidState, "gateway has been shut down"};
    if (started_.exchange(true))
        return Result<void>{};

    std::error_code ec;
    std::filesystem::create_directories(config_.mcpLogRoot(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, format("cannot create log directory {}: {}",
                                                config_.mcpLogRoot().string(), ec.message())};
    }

    spdlog::info("[Gateway] starting (data dir {}, ports {}-{}, {} io threads)",
                 config_.dataDir.string(), config_.portRangeStart, config_.portRangeEnd,
                 runtime_->threadCount());
    try {
        boost::asio::co_spawn(runtime_->executor(), servers_->reconcile(), boost::asio::use_future)
            .get();
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, format("reconcile failed: {}", e.what())};
    }

    supervisor_->start();
    return Result<void>{};
}

void Gateway::discoverAfterStart(const model::ServerDescriptor& server) {
    if (shutdown_.load())
        return;
    std::shared_ptr<mcp::IRequestSender> sender;
    if (server.transport == model::TransportKind::Stdio)
        sender = proxies_->getProxySender(server.id);
    boost::asio::co_spawn(runtime_->executor(),
                          discoverTools(*discovery_, server.id, std::move(sender)),
                          boost::asio::detached);
}

void Gateway::shutdown() {
    if (shutdown_.exchange(true))
        return;
    spdlog::info("[Gateway] shutting down");

    servers_->setStartedHook({});
    supervisor_->stop();
    supervisor_->clear();

    if (runtime_->running()) {
        try {
            auto done = boost::asio::co_spawn(runtime_->executor(), servers_->shutdownAll(),
                                              boost::asio::use_future);
            if (done.wait_for(kShutdownWait) != std::future_status::ready)
                spdlog::warn("[Gateway] servers still stopping after {}s", kShutdownWait.count());
            else
                done.get();
        } catch (const std::exception& e) {
            spdlog::error("[Gateway] server shutdown failed: {}", e.what());
        }
    }

    logs_->shutdown();
    runtime_->stop();
    spdlog::info("[Gateway] shutdown complete");
}

} // namespace mcpgate
