#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/async_mutex.h>
#include <mcpgate/mcp/request_sender.h>
#include <mcpgate/store/server_repository.h>

namespace mcpgate::discovery {

// One async mutex per server id. Entries are created on first use and only removed by
// evict().
class DiscoveryLockTable {
public:
    std::shared_ptr<core::AsyncMutex> lockFor(const ServerId& id);
    void evict(const ServerId& id);
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ServerId, std::shared_ptr<core::AsyncMutex>> locks_;
};

/**
 * Learns a server's tools with `tools/list` and caches them in the repository.
 *
 * Discovery for one server id is serialized; callers that waited on the lock while another
 * caller refreshed the cache return the cached count without a round trip. A failed round
 * trip leaves the existing cache untouched.
 */
class ToolDiscoveryService {
public:
    using EndpointLookup = std::function<std::string(const ServerId&)>;
    using SenderFactory = std::function<std::shared_ptr<mcp::IRequestSender>(const std::string& url)>;
    using Clock = std::function<TimePoint()>;

    struct Options {
        std::chrono::minutes cacheTtl{10};
        std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
    };

    ToolDiscoveryService(boost::asio::any_io_executor executor,
                         std::shared_ptr<store::IServerRepository> repository,
                         EndpointLookup endpointLookup, Options options,
                         SenderFactory senderFactory = {}, Clock clock = {});

    // Never discovered, or discovered longer ago than the TTL. ServerNotFound when the
    // descriptor is missing.
    Result<bool> shouldRediscover(const ServerId& id) const;

    // Refreshes through the server's reachable HTTP endpoint when stale. Returns the tool count.
    boost::asio::awaitable<Result<int>> discoverAndCache(ServerId id);

    // Refreshes over a caller-held channel (an open stdio session, for instance). Serialized
    // with discoverAndCache but always performs the round trip.
    boost::asio::awaitable<Result<int>> discoverAndCacheDirect(ServerId id,
                                                               mcp::IRequestSender& sender);

    Result<std::vector<model::ToolRecord>> cachedTools(const ServerId& id) const;

    DiscoveryLockTable& locks() { return locks_; }

private:
    boost::asio::awaitable<Result<int>> refreshWith(const ServerId& id, mcp::IRequestSender& sender);

    std::shared_ptr<store::IServerRepository> repository_;
    EndpointLookup endpointLookup_;
    Options options_;
    SenderFactory senderFactory_;
    Clock clock_;
    DiscoveryLockTable locks_;
    std::atomic<std::uint64_t> nextRequestId_{1};
};

} // namespace mcpgate::discovery
