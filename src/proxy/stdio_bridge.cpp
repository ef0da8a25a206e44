#include <mcpgate/core/format.h>
#include <mcpgate/core/uuid.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/proxy/stdio_bridge.h>
#include <mcpgate/transport/stdio_transport.h>
#include <mcpgate/version.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::proxy {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;
using nlohmann::json;

namespace {

StdioBridge::Response jsonResponse(http::status status, const json& body) {
    StdioBridge::Response res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    return res;
}

void applyCommonHeaders(StdioBridge::Response& res, const std::string& origin) {
    res.set(http::field::server, std::string("mcpgate/") + version::string_v);
    if (!origin.empty()) {
        res.set(http::field::access_control_allow_origin, origin);
        res.set(http::field::vary, "Origin");
    }
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Mcp-Session-Id");
}

std::string pathOf(beast::string_view target) {
    std::string path(target);
    if (auto q = path.find('?'); q != std::string::npos)
        path.resize(q);
    return path;
}

} // namespace

bool StdioBridge::isLocalOrigin(std::string_view origin) {
    for (std::string_view scheme : {"http://", "https://"}) {
        if (origin.substr(0, scheme.size()) != scheme)
            continue;
        auto host = origin.substr(scheme.size());
        for (std::string_view local : {"localhost", "127.0.0.1", "[::1]"}) {
            if (host.substr(0, local.size()) != local)
                continue;
            auto rest = host.substr(local.size());
            if (rest.empty() || rest == "/")
                return true;
            if (rest.front() != ':' || rest.size() == 1)
                return false;
            rest.remove_prefix(1);
            if (!rest.empty() && rest.back() == '/')
                rest.remove_suffix(1);
            return !rest.empty() && rest.find_first_not_of("0123456789") == std::string_view::npos;
        }
    }
    return false;
}

StdioBridge::StdioBridge(model::ServerDescriptor server, transport::TransportContext context,
                         StdioClientSession::Options sessionOptions)
    : server_(std::move(server)), context_(std::move(context)),
      sessionOptions_(std::move(sessionOptions)), strand_(boost::asio::make_strand(context_.executor)),
      acceptor_(strand_) {}

StdioBridge::~StdioBridge() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (session_)
        session_->close();
}

awaitable<Result<void>> StdioBridge::start(std::uint16_t port) {
    if (session_)
        co_return Error{ErrorCode::InvalidState, format("bridge for {} already started", server_.id)};

    transport::StdioTransport transport(server_, context_);
    auto conn = transport.spawn();
    if (!conn)
        co_return conn.error();

    session_ = StdioClientSession::create(context_.executor, server_.id,
                                          std::move(conn.value().process), context_.logRoot,
                                          sessionOptions_);
    auto init = co_await session_->initialize();
    if (!init) {
        co_await session_->closeAsync();
        co_return init.error();
    }

    auto self = shared_from_this();
    auto bound = co_await boost::asio::co_spawn(
        strand_, [self, port]() -> awaitable<Result<void>> { co_return self->listen(port); },
        use_awaitable);
    if (!bound) {
        co_await session_->closeAsync();
        co_return bound.error();
    }

    boost::asio::co_spawn(
        strand_, [self]() -> awaitable<void> { co_await self->acceptLoop(); },
        boost::asio::detached);
    spdlog::info("[StdioBridge] {} listening on 127.0.0.1:{}", server_.id, port_);
    co_return Result<void>{};
}

// Runs on strand_
Result<void> StdioBridge::listen(std::uint16_t port) {
    boost::system::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address_v4("127.0.0.1"), port};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::ConnectionFailed, format("acceptor open failed: {}", ec.message())};
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::ConnectionFailed,
                     format("bind 127.0.0.1:{} failed: {}", port, ec.message())};
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::ConnectionFailed, format("listen failed: {}", ec.message())};
    }
    port_ = port;
    listening_.store(true);
    return Result<void>{};
}

awaitable<void> StdioBridge::acceptLoop() {
    auto self = shared_from_this();
    while (!stopped_.load()) {
        boost::system::error_code ec;
        auto socket =
            co_await acceptor_.async_accept(boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                break;
            spdlog::warn("[StdioBridge] {}: accept error: {}", server_.id, ec.message());
            continue;
        }
        auto stream = std::make_shared<Stream>(std::move(socket));
        connections_.insert(stream);
        boost::asio::co_spawn(
            strand_, [self, stream]() -> awaitable<void> { co_await self->serveConnection(stream); },
            boost::asio::detached);
    }
    listening_.store(false);
}

awaitable<void> StdioBridge::serveConnection(std::shared_ptr<Stream> stream) {
    beast::flat_buffer buffer;
    try {
        for (;;) {
            Request req;
            boost::system::error_code ec;
            stream->expires_after(kIdleTimeout);
            co_await http::async_read(*stream, buffer, req,
                                      boost::asio::redirect_error(use_awaitable, ec));
            if (ec) {
                if (ec != http::error::end_of_stream && ec != beast::error::timeout &&
                    ec != boost::asio::error::operation_aborted)
                    spdlog::debug("[StdioBridge] {}: read error: {}", server_.id, ec.message());
                break;
            }

            const std::string path = pathOf(req.target());
            std::string origin;
            bool forbidden = false;
            if (auto it = req.find(http::field::origin); it != req.end()) {
                origin = std::string(it->value());
                if (!isLocalOrigin(origin)) {
                    spdlog::warn("[StdioBridge] {}: rejected request from origin '{}'",
                                 server_.id, origin);
                    forbidden = true;
                    origin.clear();
                }
            }

            if (!forbidden && req.method() == http::verb::get && path == "/sse") {
                stream->expires_never();
                co_await streamEvents(stream, origin);
                break;
            }

            Response res;
            if (forbidden) {
                res = jsonResponse(http::status::forbidden, json{{"error", "Forbidden origin"}});
            } else if (req.method() == http::verb::post && path == "/mcp") {
                res = co_await handlePost(req);
            } else if (req.method() == http::verb::get && path == "/mcp") {
                res = jsonResponse(http::status::ok, json{{"status", "ok"}});
            } else if (req.method() == http::verb::get && path == "/health") {
                res = jsonResponse(http::status::ok, json{{"status", "healthy"}});
            } else if (req.method() == http::verb::options) {
                res = Response{http::status::no_content, req.version()};
            } else {
                res = jsonResponse(http::status::not_found, json{{"error", "Not found"}});
            }
            res.version(req.version());
            res.keep_alive(req.keep_alive());
            applyCommonHeaders(res, origin);
            res.prepare_payload();

            stream->expires_after(kIdleTimeout);
            co_await http::async_write(*stream, res, boost::asio::redirect_error(use_awaitable, ec));
            if (ec || !res.keep_alive())
                break;
        }
    } catch (const std::exception& e) {
        spdlog::warn("[StdioBridge] {}: connection handler failed: {}", server_.id, e.what());
    }

    boost::system::error_code ec;
    stream->socket().shutdown(tcp::socket::shutdown_send, ec);
    connections_.erase(stream);
}

awaitable<StdioBridge::Response> StdioBridge::handlePost(const Request& req) {
    auto parsed = mcp::json_utils::parse_json(req.body());
    if (!parsed) {
        co_return jsonResponse(http::status::bad_request,
                               mcp::makeErrorResponse(nullptr, mcp::protocol::PARSE_ERROR,
                                                      "Parse error"));
    }
    const json& msg = parsed.value();
    if (!msg.is_object()) {
        co_return jsonResponse(http::status::bad_request,
                               mcp::makeErrorResponse(nullptr, mcp::protocol::INVALID_REQUEST,
                                                      "Invalid Request"));
    }

    if (!msg.contains("id") || msg["id"].is_null()) {
        auto sent = co_await session_->sendNotification(msg);
        if (!sent) {
            co_return jsonResponse(http::status::bad_gateway,
                                   mcp::makeErrorResponse(nullptr, mcp::protocol::INTERNAL_ERROR,
                                                          sent.error().message));
        }
        co_return Response{http::status::accepted, 11};
    }

    auto response = co_await session_->sendRequest(msg);
    if (!response) {
        spdlog::warn("[StdioBridge] {}: forward failed: {}", server_.id, response.error().message);
        co_return jsonResponse(http::status::bad_gateway,
                               mcp::makeErrorResponse(msg["id"], mcp::protocol::INTERNAL_ERROR,
                                                      response.error().message));
    }
    co_return jsonResponse(http::status::ok, response.value());
}

awaitable<void> StdioBridge::streamEvents(std::shared_ptr<Stream> stream,
                                          const std::string& origin) {
    auto receiver = session_->subscribeNotifications();
    const std::string clientId = core::generateId("sse");
    spdlog::debug("[StdioBridge] {}: event stream {} opened", server_.id, clientId);
    boost::system::error_code ec;
    std::string hdr = "HTTP/1.1 200 OK\r\n"
                      "Content-Type: text/event-stream\r\n"
                      "Cache-Control: no-cache\r\n";
    if (!origin.empty())
        hdr += "Access-Control-Allow-Origin: " + origin + "\r\nVary: Origin\r\n";
    hdr += "Connection: keep-alive\r\n\r\n";
    co_await boost::asio::async_write(*stream, boost::asio::buffer(hdr),
                                      boost::asio::redirect_error(use_awaitable, ec));
    if (ec)
        co_return;

    boost::asio::steady_timer timer(strand_);
    auto last = std::chrono::steady_clock::now();
    while (!stopped_.load()) {
        auto r = receiver.tryRecv();
        using Status = StdioClientSession::NotificationChannel::RecvStatus;
        if (r.status == Status::Closed)
            break;
        if (r.status == Status::Lagged) {
            spdlog::debug("[StdioBridge] {}: event stream lagged by {}", server_.id, r.skipped);
            continue;
        }
        if (r.status == Status::Item) {
            std::string ev = "event: message\ndata: " + r.value->dump() + "\n\n";
            co_await boost::asio::async_write(*stream, boost::asio::buffer(ev),
                                              boost::asio::redirect_error(use_awaitable, ec));
            if (ec)
                break;
            last = std::chrono::steady_clock::now();
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last > kKeepaliveInterval) {
            std::string ping = ": ping\n\n";
            co_await boost::asio::async_write(*stream, boost::asio::buffer(ping),
                                              boost::asio::redirect_error(use_awaitable, ec));
            if (ec)
                break;
            last = now;
        }
        timer.expires_after(std::chrono::milliseconds(50));
        co_await timer.async_wait(boost::asio::redirect_error(use_awaitable, ec));
        if (ec)
            break;
    }
    spdlog::debug("[StdioBridge] {}: event stream {} closed", server_.id, clientId);
}

awaitable<void> StdioBridge::stop() {
    if (stopped_.exchange(true))
        co_return;
    auto self = shared_from_this();
    co_await boost::asio::co_spawn(
        strand_,
        [self]() -> awaitable<void> {
            self->closeAll();
            co_return;
        },
        use_awaitable);
    if (session_)
        co_await session_->closeAsync();
    spdlog::info("[StdioBridge] {} stopped (port {})", server_.id, port_);
}

// Runs on strand_
void StdioBridge::closeAll() {
    boost::system::error_code ec;
    listening_.store(false);
    acceptor_.close(ec);
    for (auto& conn : connections_) {
        conn->socket().shutdown(tcp::socket::shutdown_both, ec);
        conn->close();
    }
    connections_.clear();
}

awaitable<bool> StdioBridge::isHealthy() {
    co_return !stopped_.load() && listening_.load() && session_ && session_->isAlive();
}

std::optional<int> StdioBridge::pid() const {
    if (!session_)
        return std::nullopt;
    return session_->pid();
}

BridgeFactory makeStdioBridgeFactory(transport::TransportContext context,
                                     StdioClientSession::Options sessionOptions) {
    return [context = std::move(context), sessionOptions = std::move(sessionOptions)](
               const model::ServerDescriptor& server) -> std::shared_ptr<IBridge> {
        return std::make_shared<StdioBridge>(server, context, sessionOptions);
    };
}

} // namespace mcpgate::proxy
