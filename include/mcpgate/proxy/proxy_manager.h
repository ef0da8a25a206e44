#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/async_mutex.h>
#include <mcpgate/proxy/bridge.h>
#include <mcpgate/proxy/port_allocator.h>

namespace mcpgate::proxy {

struct ProxyEntry {
    std::uint16_t port = 0;
    std::string url;
    std::string serverName;
    std::shared_ptr<IBridge> bridge;
};

struct RunningProxy {
    ServerId serverId;
    std::uint16_t port = 0;
    std::string serverName;
};

/**
 * Gives every stdio server an HTTP address by pairing it with a StdioBridge on a port taken
 * from the allocator.
 *
 * Lookups take a shared lock on the entry map; start and stop are serialized by an async
 * mutex so a bridge start (which awaits the child's handshake) never holds a thread lock.
 */
class ProxyManager {
public:
    ProxyManager(std::shared_ptr<PortAllocator> allocator, BridgeFactory factory);

    static std::string proxyUrl(std::uint16_t port);

    // Idempotent per server id. Only stdio servers are bridged (UnsupportedTransport
    // otherwise). A failed bridge start releases the port it was given.
    boost::asio::awaitable<Result<std::uint16_t>> startProxy(model::ServerDescriptor server);
    // No-op when no proxy is tracked for the id.
    boost::asio::awaitable<Result<void>> stopProxy(ServerId id);

    std::optional<std::string> getProxyUrl(const ServerId& id) const;
    std::optional<std::uint16_t> getProxyPort(const ServerId& id) const;
    std::optional<int> getProxyPid(const ServerId& id) const;
    std::shared_ptr<mcp::IRequestSender> getProxySender(const ServerId& id) const;
    boost::asio::awaitable<bool> isProxyHealthy(ServerId id) const;
    std::vector<RunningProxy> listRunningProxies() const;

    // Stops every proxy and resets the allocator.
    boost::asio::awaitable<Result<void>> shutdownAllProxies();

    const PortAllocator& allocator() const { return *allocator_; }

private:
    std::shared_ptr<IBridge> bridgeFor(const ServerId& id) const;

    std::shared_ptr<PortAllocator> allocator_;
    BridgeFactory factory_;
    core::AsyncMutex lifecycleMutex_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ServerId, ProxyEntry> entries_;
};

} // namespace mcpgate::proxy
