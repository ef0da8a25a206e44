#include <mcpgate/core/format.h>
#include <mcpgate/proxy/proxy_manager.h>

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace mcpgate::proxy {

using boost::asio::awaitable;

ProxyManager::ProxyManager(std::shared_ptr<PortAllocator> allocator, BridgeFactory factory)
    : allocator_(std::move(allocator)), factory_(std::move(factory)) {}

std::string ProxyManager::proxyUrl(std::uint16_t port) {
    return format("http://127.0.0.1:{}/mcp", port);
}

awaitable<Result<std::uint16_t>> ProxyManager::startProxy(model::ServerDescriptor server) {
    if (server.transport != model::TransportKind::Stdio) {
        co_return Error{ErrorCode::UnsupportedTransport,
                        format("Proxy only applies to stdio servers ({} is {})", server.id,
                               model::transportKindToString(server.transport))};
    }

    auto guard = co_await lifecycleMutex_.scoped_lock();
    {
        std::shared_lock lk(mutex_);
        if (auto it = entries_.find(server.id); it != entries_.end()) {
            spdlog::debug("[ProxyManager] proxy for {} already on port {}", server.id,
                          it->second.port);
            co_return it->second.port;
        }
    }

    auto port = allocator_->allocate();
    if (!port) {
        spdlog::error("[ProxyManager] {}: {}", server.id, port.error().message);
        co_return port.error();
    }

    auto bridge = factory_(server);
    Result<void> started = Error{ErrorCode::InternalError, "no bridge"};
    if (bridge)
        started = co_await bridge->start(port.value());
    if (!started) {
        allocator_->release(port.value());
        spdlog::error("[ProxyManager] failed to start proxy for {}: {}", server.id,
                      started.error().message);
        co_return started.error();
    }

    ProxyEntry entry{port.value(), proxyUrl(port.value()), server.name, std::move(bridge)};
    {
        std::unique_lock lk(mutex_);
        entries_.emplace(server.id, std::move(entry));
    }
    spdlog::info("[ProxyManager] {} ({}) proxied at {}", server.id, server.name,
                 proxyUrl(port.value()));
    co_return port.value();
}

awaitable<Result<void>> ProxyManager::stopProxy(ServerId id) {
    auto guard = co_await lifecycleMutex_.scoped_lock();
    ProxyEntry entry;
    {
        std::unique_lock lk(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            co_return Result<void>{};
        entry = std::move(it->second);
        entries_.erase(it);
    }
    if (entry.bridge)
        co_await entry.bridge->stop();
    allocator_->release(entry.port);
    spdlog::info("[ProxyManager] stopped proxy for {} (port {})", id, entry.port);
    co_return Result<void>{};
}

std::optional<std::string> ProxyManager::getProxyUrl(const ServerId& id) const {
    std::shared_lock lk(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;
    return it->second.url;
}

std::optional<std::uint16_t> ProxyManager::getProxyPort(const ServerId& id) const {
    std::shared_lock lk(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;
    return it->second.port;
}

std::optional<int> ProxyManager::getProxyPid(const ServerId& id) const {
    auto bridge = bridgeFor(id);
    if (!bridge)
        return std::nullopt;
    return bridge->pid();
}

std::shared_ptr<mcp::IRequestSender> ProxyManager::getProxySender(const ServerId& id) const {
    auto bridge = bridgeFor(id);
    return bridge ? bridge->requestSender() : nullptr;
}

std::shared_ptr<IBridge> ProxyManager::bridgeFor(const ServerId& id) const {
    std::shared_lock lk(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.bridge;
}

awaitable<bool> ProxyManager::isProxyHealthy(ServerId id) const {
    auto bridge = bridgeFor(id);
    if (!bridge)
        co_return false;
    co_return co_await bridge->isHealthy();
}

std::vector<RunningProxy> ProxyManager::listRunningProxies() const {
    std::vector<RunningProxy> out;
    {
        std::shared_lock lk(mutex_);
        out.reserve(entries_.size());
        for (const auto& [id, entry] : entries_)
            out.push_back(RunningProxy{id, entry.port, entry.serverName});
    }
    std::sort(out.begin(), out.end(),
              [](const RunningProxy& a, const RunningProxy& b) { return a.port < b.port; });
    return out;
}

awaitable<Result<void>> ProxyManager::shutdownAllProxies() {
    std::vector<ServerId> ids;
    {
        std::shared_lock lk(mutex_);
        for (const auto& [id, entry] : entries_)
            ids.push_back(id);
    }
    spdlog::info("[ProxyManager] shutting down {} proxies", ids.size());
    for (const auto& id : ids) {
        auto r = co_await stopProxy(id);
        if (!r)
            spdlog::warn("[ProxyManager] failed to stop proxy for {}: {}", id, r.error().message);
    }
    allocator_->clear();
    co_return Result<void>{};
}

} // namespace mcpgate::proxy
