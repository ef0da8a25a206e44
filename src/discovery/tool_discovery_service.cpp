#include <mcpgate/core/format.h>
#include <mcpgate/discovery/tool_discovery_service.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/net/json_rpc_http_client.h>

#include <spdlog/spdlog.h>

namespace mcpgate::discovery {

using boost::asio::awaitable;

std::shared_ptr<core::AsyncMutex> DiscoveryLockTable::lockFor(const ServerId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto& slot = locks_[id];
    if (!slot)
        slot = std::make_shared<core::AsyncMutex>();
    return slot;
}

void DiscoveryLockTable::evict(const ServerId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    locks_.erase(id);
}

std::size_t DiscoveryLockTable::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return locks_.size();
}

ToolDiscoveryService::ToolDiscoveryService(boost::asio::any_io_executor executor,
                                           std::shared_ptr<store::IServerRepository> repository,
                                           EndpointLookup endpointLookup, Options options,
                                           SenderFactory senderFactory, Clock clock)
    : repository_(std::move(repository)), endpointLookup_(std::move(endpointLookup)),
      options_(options), senderFactory_(std::move(senderFactory)), clock_(std::move(clock)) {
    if (!senderFactory_) {
        auto timeout = options_.requestTimeout;
        senderFactory_ = [executor, timeout](const std::string& url) {
            return std::make_shared<net::JsonRpcHttpClient>(executor, url, net::Headers{}, timeout);
        };
    }
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };
}

Result<bool> ToolDiscoveryService::shouldRediscover(const ServerId& id) const {
    auto server = repository_->getServer(id);
    if (!server)
        return server.error();
    const auto& discoveredAt = server.value().toolsDiscoveredAt;
    if (!discoveredAt)
        return true;
    return clock_() - *discoveredAt > options_.cacheTtl;
}

awaitable<Result<int>> ToolDiscoveryService::discoverAndCache(ServerId id) {
    auto lock = locks_.lockFor(id);
    auto guard = co_await lock->scoped_lock();

    auto stale = shouldRediscover(id);
    if (!stale)
        co_return stale.error();
    if (!stale.value()) {
        auto server = repository_->getServer(id);
        if (!server)
            co_return server.error();
        spdlog::debug("[ToolDiscovery] {}: cache fresh ({} tools)", id, server.value().toolsCount);
        co_return server.value().toolsCount;
    }

    const std::string url = endpointLookup_ ? endpointLookup_(id) : std::string{};
    if (url.empty()) {
        co_return Error{ErrorCode::ServerNotRunning,
                        format("Server {} is not running (no reachable endpoint)", id)};
    }

    auto sender = senderFactory_(url);
    if (!sender)
        co_return Error{ErrorCode::InternalError, format("No request channel for {}", url)};
    co_return co_await refreshWith(id, *sender);
}

awaitable<Result<int>> ToolDiscoveryService::discoverAndCacheDirect(ServerId id,
                                                                    mcp::IRequestSender& sender) {
    auto lock = locks_.lockFor(id);
    auto guard = co_await lock->scoped_lock();
    if (auto server = repository_->getServer(id); !server)
        co_return server.error();
    co_return co_await refreshWith(id, sender);
}

awaitable<Result<int>> ToolDiscoveryService::refreshWith(const ServerId& id,
                                                         mcp::IRequestSender& sender) {
    auto request = mcp::makeRequest(nextRequestId_.fetch_add(1), mcp::protocol::METHOD_TOOLS_LIST);
    auto response = co_await sender.sendRequest(std::move(request));
    if (!response) {
        const auto code = response.error().code;
        spdlog::warn("[ToolDiscovery] {}: tools/list failed: {}", id, response.error().message);
        if (code == ErrorCode::Timeout || code == ErrorCode::ConnectionFailed ||
            code == ErrorCode::MCPCommunication)
            co_return response.error();
        co_return Error{ErrorCode::MCPCommunication,
                        format("tools/list failed: {}", response.error().message)};
    }

    auto result = mcp::extractResult(response.value());
    if (!result) {
        spdlog::warn("[ToolDiscovery] {}: {}", id, result.error().message);
        co_return result.error();
    }
    auto tools = model::parseToolsList(result.value());
    if (!tools) {
        spdlog::warn("[ToolDiscovery] {}: {}", id, tools.error().message);
        co_return tools.error();
    }

    const int count = static_cast<int>(tools.value().size());
    if (auto r = repository_->clearToolsCache(id); !r)
        co_return r.error();
    if (auto r = repository_->cacheTools(id, tools.value()); !r)
        co_return r.error();
    if (auto r = repository_->updateToolsDiscovered(id, count, clock_()); !r)
        co_return r.error();

    spdlog::info("[ToolDiscovery] {}: cached {} tools", id, count);
    co_return count;
}

Result<std::vector<model::ToolRecord>> ToolDiscoveryService::cachedTools(const ServerId& id) const {
    return repository_->cachedTools(id);
}

} // namespace mcpgate::discovery
