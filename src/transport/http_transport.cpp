#include <mcpgate/core/format.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/transport/http_transport.h>
#include <mcpgate/version.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::transport {

using nlohmann::json;

std::string HttpTransport::canonicalEndpoint(const std::string& baseUrl) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    constexpr std::string_view kSuffix = "/mcp";
    if (url.size() >= kSuffix.size() && url.compare(url.size() - kSuffix.size(), kSuffix.size(),
                                                    kSuffix.data()) == 0) {
        return url;
    }
    return url + std::string(kSuffix);
}

std::string HttpTransport::healthUrl(const std::string& baseUrl) {
    std::string url = canonicalEndpoint(baseUrl);
    url.resize(url.size() - std::string_view("/mcp").size());
    return url + "/health";
}

Result<std::unique_ptr<HttpTransport>> HttpTransport::create(const model::ServerDescriptor& server,
                                                             const TransportContext& context) {
    if (server.url.empty())
        return Error{ErrorCode::InvalidUrl, format("server '{}' has no url", server.id)};
    auto parsed = net::parseUrl(server.url);
    if (!parsed)
        return parsed.error();
    std::unique_ptr<HttpTransport> transport(
        new HttpTransport(server, context, canonicalEndpoint(server.url)));
    return std::move(transport);
}

HttpTransport::HttpTransport(model::ServerDescriptor server, const TransportContext& context,
                             std::string endpoint)
    : server_(std::move(server)), kind_(server_.transport), executor_(context.executor),
      baseUrl_(server_.url) {
    auto timeout = server_.timeout.count() > 0
                       ? std::chrono::duration_cast<std::chrono::milliseconds>(server_.timeout)
                       : std::chrono::milliseconds(kRequestTimeout);
    client_ = std::make_shared<net::JsonRpcHttpClient>(executor_, std::move(endpoint),
                                                       server_.headers, timeout);
}

boost::asio::awaitable<Result<ConnectionInfo>> HttpTransport::start() {
    spdlog::info("[HttpTransport] {}: initializing {}", server_.id, client_->endpoint());
    client_->resetSession();

    auto request = mcp::makeRequest(
        std::string(mcp::protocol::INIT_REQUEST_ID), mcp::protocol::METHOD_INITIALIZE,
        mcp::makeInitializeParams("mcpgate-client", version::string_v));
    auto response = co_await client_->sendRequest(request);
    if (!response) {
        const auto& err = response.error();
        if (err.code == ErrorCode::Timeout || err.code == ErrorCode::ConnectionFailed)
            co_return err;
        co_return Error{ErrorCode::HandshakeFailed,
                        format("initialize failed for {}: {}", server_.id, err.message)};
    }
    auto result = mcp::extractResult(response.value());
    if (!result) {
        co_return Error{ErrorCode::HandshakeFailed,
                        format("initialize rejected by {}: {}", server_.id,
                               result.error().message)};
    }

    // Notification delivery problems do not fail the handshake
    auto note = co_await client_->sendNotification(
        mcp::makeNotification(mcp::protocol::METHOD_INITIALIZED));
    if (!note) {
        spdlog::debug("[HttpTransport] {}: initialized notification failed: {}", server_.id,
                      note.error().message);
    }

    initialized_.store(true);
    ConnectionInfo info;
    if (auto url = net::parseUrl(client_->endpoint()))
        info.port = url.value().port;
    co_return std::move(info);
}

boost::asio::awaitable<Result<void>> HttpTransport::stop() {
    initialized_.store(false);
    client_->resetSession();
    co_return Result<void>{};
}

boost::asio::awaitable<bool> HttpTransport::isHealthy() {
    net::HttpClient http(executor_);
    // Any HTTP answer from the MCP endpoint means the server is up
    auto res = co_await http.get(client_->endpoint(), server_.headers, kHealthTimeout);
    if (res)
        co_return true;

    auto fallback = co_await http.get(healthUrl(baseUrl_), server_.headers, kHealthTimeout);
    co_return fallback && fallback.value().ok();
}

} // namespace mcpgate::transport
