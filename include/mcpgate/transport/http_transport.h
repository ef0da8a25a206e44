#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <mcpgate/net/json_rpc_http_client.h>
#include <mcpgate/transport/transport.h>

namespace mcpgate::transport {

// Remote MCP server over HTTP POST. start() performs the initialize handshake.
class HttpTransport : public ITransport {
public:
    static constexpr auto kRequestTimeout = std::chrono::seconds(30);
    static constexpr auto kHealthTimeout = std::chrono::seconds(5);

    // Validates the URL (InvalidUrl) and derives the canonical endpoint.
    static Result<std::unique_ptr<HttpTransport>> create(const model::ServerDescriptor& server,
                                                         const TransportContext& context);

    // Appends "/mcp" unless the path already ends with it
    static std::string canonicalEndpoint(const std::string& baseUrl);

    // "<base>/health" with any trailing "/mcp" removed from the base
    static std::string healthUrl(const std::string& baseUrl);

    model::TransportKind kind() const override { return kind_; }
    boost::asio::awaitable<Result<ConnectionInfo>> start() override;
    boost::asio::awaitable<Result<void>> stop() override;
    boost::asio::awaitable<bool> isHealthy() override;

    bool initialized() const { return initialized_.load(); }
    const std::string& endpoint() const { return client_->endpoint(); }

    // Request channel to the remote server (shared with tool discovery)
    std::shared_ptr<net::JsonRpcHttpClient> client() const { return client_; }

private:
    HttpTransport(model::ServerDescriptor server, const TransportContext& context,
                  std::string endpoint);

    model::ServerDescriptor server_;
    model::TransportKind kind_;
    boost::asio::any_io_executor executor_;
    std::string baseUrl_;
    std::shared_ptr<net::JsonRpcHttpClient> client_;
    std::atomic<bool> initialized_{false};
};

} // namespace mcpgate::transport
