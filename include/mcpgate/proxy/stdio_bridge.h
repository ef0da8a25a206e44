#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <mcpgate/proxy/bridge.h>
#include <mcpgate/proxy/stdio_client_session.h>
#include <mcpgate/transport/transport.h>

namespace mcpgate::proxy {

/**
 * Stdio to HTTP bridge.
 *
 * Routes on 127.0.0.1:<port>:
 *   POST /mcp     JSON-RPC forwarded to the child (202 for notifications)
 *   GET  /mcp     {"status":"ok"}
 *   GET  /health  {"status":"healthy"}
 *   GET  /sse     server notifications as an event stream
 *   OPTIONS *     CORS preflight
 *
 * A request carrying an Origin header that is not a local origin is answered 403. Allowed
 * origins are echoed back in Access-Control-Allow-Origin.
 *
 * Connection handlers all run on one strand; the session serializes writes to the child.
 */
class StdioBridge : public IBridge, public std::enable_shared_from_this<StdioBridge> {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    static constexpr auto kIdleTimeout = std::chrono::seconds(60);
    static constexpr auto kKeepaliveInterval = std::chrono::seconds(15);

    StdioBridge(model::ServerDescriptor server, transport::TransportContext context,
                StdioClientSession::Options sessionOptions = {});
    ~StdioBridge() override;

    boost::asio::awaitable<Result<void>> start(std::uint16_t port) override;
    boost::asio::awaitable<void> stop() override;
    boost::asio::awaitable<bool> isHealthy() override;
    std::optional<int> pid() const override;
    std::shared_ptr<mcp::IRequestSender> requestSender() const override { return session_; }

    std::shared_ptr<StdioClientSession> session() const { return session_; }

    // Browser origins allowed to reach the bridge: http(s) on localhost, 127.0.0.1 or [::1]
    static bool isLocalOrigin(std::string_view origin);
    std::uint16_t port() const { return port_; }

private:
    using Stream = boost::beast::tcp_stream;

    Result<void> listen(std::uint16_t port);
    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> serveConnection(std::shared_ptr<Stream> stream);
    boost::asio::awaitable<Response> handlePost(const Request& req);
    boost::asio::awaitable<void> streamEvents(std::shared_ptr<Stream> stream,
                                              const std::string& origin);
    void closeAll();

    model::ServerDescriptor server_;
    transport::TransportContext context_;
    StdioClientSession::Options sessionOptions_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<StdioClientSession> session_;
    std::unordered_set<std::shared_ptr<Stream>> connections_; // strand only
    std::uint16_t port_ = 0;
    std::atomic<bool> listening_{false};
    std::atomic<bool> stopped_{false};
};

// Factory producing StdioBridges bound to one runtime context.
BridgeFactory makeStdioBridgeFactory(transport::TransportContext context,
                                     StdioClientSession::Options sessionOptions = {});

} // namespace mcpgate::proxy
