#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>
#include <mcpgate/core/async_mutex.h>
#include <mcpgate/core/broadcast_channel.h>
#include <mcpgate/logging/server_log_writer.h>
#include <mcpgate/mcp/request_sender.h>
#include <mcpgate/process/child_process.h>

namespace mcpgate::proxy {

/**
 * JSON-RPC client over a child's stdin/stdout.
 *
 * Requests are written one line at a time under a write lock. Ids of forwarded requests are
 * rewritten to session-unique keys and restored on the response, so callers that reuse ids
 * never collide; a single stdout reader matches responses to a pending map and broadcasts
 * notifications. Server-initiated requests are answered with "method not found" so the child
 * never stalls. When stdout closes every pending request fails.
 */
class StdioClientSession : public mcp::IRequestSender,
                           public std::enable_shared_from_this<StdioClientSession> {
public:
    using json = nlohmann::json;
    using NotificationChannel = core::BroadcastChannel<json>;

    struct Options {
        std::chrono::milliseconds requestTimeout{std::chrono::seconds(30)};
        std::chrono::milliseconds writeTimeout{std::chrono::seconds(5)};
        std::size_t notificationCapacity = 1000;
        std::string clientName = "mcpgate-proxy";
    };

    // Takes over the child's pipes and starts the stdout/stderr readers.
    static std::shared_ptr<StdioClientSession>
    create(boost::asio::any_io_executor executor, ServerId serverId,
           std::unique_ptr<process::ChildProcess> child, std::filesystem::path logRoot,
           Options options);

    ~StdioClientSession() override;

    StdioClientSession(const StdioClientSession&) = delete;
    StdioClientSession& operator=(const StdioClientSession&) = delete;

    // initialize (id "init") followed by notifications/initialized. Returns the server's
    // initialize result.
    boost::asio::awaitable<Result<json>> initialize();

    boost::asio::awaitable<Result<json>> sendRequest(json request) override;
    boost::asio::awaitable<Result<void>> sendNotification(json notification);

    NotificationChannel::Receiver subscribeNotifications() { return notifications_.subscribe(); }

    bool isAlive() const;
    bool initialized() const { return initialized_.load(); }
    std::optional<int> pid() const;
    std::size_t pendingCount() const;
    const ServerId& serverId() const { return serverId_; }

    // Idempotent. Pending requests fail at once; the pipes close and the child is terminated
    // in the background.
    void close();
    // Like close(), but completes once the child has exited.
    boost::asio::awaitable<void> closeAsync();

private:
    StdioClientSession(boost::asio::any_io_executor executor, ServerId serverId,
                       std::unique_ptr<process::ChildProcess> child, std::filesystem::path logRoot,
                       Options options);

    void startReaders();
    boost::asio::awaitable<Result<json>> roundTrip(json request, std::string key);
    boost::asio::awaitable<Result<void>> writeLocked(std::string line);
    boost::asio::awaitable<Result<void>> writeLine(std::string line);
    boost::asio::awaitable<void> readStdout();
    boost::asio::awaitable<void> readStderr();
    void handleLine(std::string line);
    void handleMessage(const json& msg);
    void failAllPending(const Error& error);
    boost::asio::awaitable<void> onStdoutClosed();
    bool beginClose();
    boost::asio::awaitable<void> terminateChild();

    using Pending = std::shared_ptr<std::promise<Result<json>>>;

    ServerId serverId_;
    Options options_;
    std::unique_ptr<process::ChildProcess> child_;
    std::shared_ptr<logging::ServerLogWriter> log_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::posix::stream_descriptor stdout_;
    boost::asio::posix::stream_descriptor stderr_;

    core::AsyncMutex writeMutex_;
    NotificationChannel notifications_;

    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, Pending> pending_;
    std::atomic<std::uint64_t> nextId_{1};

    std::atomic<bool> alive_{true};
    std::atomic<bool> closed_{false};
    std::atomic<bool> initialized_{false};
};

} // namespace mcpgate::proxy
