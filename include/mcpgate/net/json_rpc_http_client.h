#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <mcpgate/mcp/request_sender.h>
#include <mcpgate/net/http_client.h>

namespace mcpgate::net {

// JSON-RPC over HTTP POST to a single MCP endpoint.
class JsonRpcHttpClient : public mcp::IRequestSender {
public:
    JsonRpcHttpClient(boost::asio::any_io_executor executor, std::string endpoint,
                      Headers headers = {},
                      std::chrono::milliseconds timeout = std::chrono::seconds(30));

    // Non-2xx -> MCPCommunication("HTTP error: <status>"); unparsable body -> InvalidResponse.
    // The JSON-RPC envelope is returned as-is (error members are not interpreted here).
    boost::asio::awaitable<Result<nlohmann::json>> sendRequest(nlohmann::json request) override;

    boost::asio::awaitable<Result<void>> sendNotification(nlohmann::json notification);

    const std::string& endpoint() const { return endpoint_; }

    // Captured from the Mcp-Session-Id response header and echoed on later calls
    std::optional<std::string> sessionId() const;
    void resetSession();

    // Extracts the first JSON-RPC envelope from a JSON or text/event-stream body.
    static Result<nlohmann::json> decodeBody(const std::string& contentType,
                                             const std::string& body);

private:
    Headers requestHeaders() const;
    void captureSession(const HttpResponse& response);

    HttpClient http_;
    std::string endpoint_;
    Headers headers_;
    std::chrono::milliseconds timeout_;
    mutable std::mutex mutex_;
    std::optional<std::string> sessionId_;
};

} // namespace mcpgate::net
