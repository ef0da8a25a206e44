#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <mcpgate/core/async_mutex.h>
#include <mcpgate/proxy/proxy_manager.h>
#include <mcpgate/server/server_lifecycle.h>
#include <mcpgate/store/server_repository.h>
#include <mcpgate/transport/transport.h>

namespace mcpgate::server {

/**
 * Starts, stops and verifies servers of every transport kind.
 *
 * Stdio servers run behind a ProxyManager bridge (the bridge owns the child); Http and Sse
 * servers are handshaken through HttpTransport and addressed at their canonical endpoint.
 * Starts and stops are serialized by one async mutex, so a manual restart racing a
 * supervisor tick sees AlreadyRunning instead of a second process.
 */
class ServerManager : public IServerLifecycle {
public:
    // Runs after every successful start (not for AlreadyRunning), outside the start lock.
    using StartedHook = std::function<void(const model::ServerDescriptor& server)>;

    ServerManager(std::shared_ptr<store::IServerRepository> repository,
                  std::shared_ptr<proxy::ProxyManager> proxies,
                  transport::TransportContext context);

    boost::asio::awaitable<model::ServerStartResult> startServer(ServerId id) override;
    // Idempotent
    boost::asio::awaitable<Result<void>> stopServer(ServerId id);

    // A recorded pid that is gone, or a runtime record this process does not own, is cleaned
    // up and reported as not running.
    boost::asio::awaitable<std::optional<ProcessStatus>>
    verifyRunning(ServerId id) override;

    // Proxy URL for stdio, canonical endpoint for http/sse, empty when not running.
    std::string reachableUrl(const ServerId& id) const;

    // Marks stale runtime records stopped, then starts enabled system servers.
    boost::asio::awaitable<void> reconcile();

    boost::asio::awaitable<void> shutdownAll();

    std::vector<ServerId> runningServers() const;

    void setStartedHook(StartedHook hook);

private:
    struct RunningServer {
        model::TransportKind kind = model::TransportKind::Stdio;
        std::shared_ptr<transport::ITransport> transport; // http/sse only
        std::string url;
    };

    std::shared_ptr<RunningServer> entryFor(const ServerId& id) const;
    boost::asio::awaitable<model::ServerStartResult> startLocked(const ServerId& id);
    void notifyStarted(const ServerId& id);
    boost::asio::awaitable<void> teardown(const ServerId& id);
    boost::asio::awaitable<void> cleanupStale(const ServerId& id, std::string_view reason);
    void recordStopped(const ServerId& id);

    std::shared_ptr<store::IServerRepository> repository_;
    std::shared_ptr<proxy::ProxyManager> proxies_;
    transport::TransportContext context_;
    core::AsyncMutex startMutex_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ServerId, std::shared_ptr<RunningServer>> running_;
    StartedHook startedHook_; // guarded by mutex_
};

} // namespace mcpgate::server
