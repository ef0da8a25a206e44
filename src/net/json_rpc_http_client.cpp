#include <mcpgate/core/format.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/net/json_rpc_http_client.h>

#include <sstream>

#include <spdlog/spdlog.h>

namespace mcpgate::net {

using nlohmann::json;

JsonRpcHttpClient::JsonRpcHttpClient(boost::asio::any_io_executor executor, std::string endpoint,
                                     Headers headers, std::chrono::milliseconds timeout)
    : http_(std::move(executor)), endpoint_(std::move(endpoint)), headers_(std::move(headers)),
      timeout_(timeout) {}

std::optional<std::string> JsonRpcHttpClient::sessionId() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sessionId_;
}

void JsonRpcHttpClient::resetSession() {
    std::lock_guard<std::mutex> lk(mutex_);
    sessionId_.reset();
}

Headers JsonRpcHttpClient::requestHeaders() const {
    Headers h = headers_;
    std::lock_guard<std::mutex> lk(mutex_);
    if (sessionId_)
        h["Mcp-Session-Id"] = *sessionId_;
    return h;
}

void JsonRpcHttpClient::captureSession(const HttpResponse& response) {
    auto sid = response.header("mcp-session-id");
    if (sid.empty())
        return;
    std::lock_guard<std::mutex> lk(mutex_);
    sessionId_ = std::move(sid);
}

Result<json> JsonRpcHttpClient::decodeBody(const std::string& contentType,
                                           const std::string& body) {
    if (contentType.find("text/event-stream") == std::string::npos)
        return mcp::json_utils::parse_json(body);

    // SSE framing: take the first data payload that parses as a JSON-RPC envelope
    std::istringstream in(body);
    std::string line;
    std::string data;
    auto flush = [&]() -> std::optional<json> {
        if (data.empty())
            return std::nullopt;
        auto parsed = mcp::json_utils::parse_json(data);
        data.clear();
        if (parsed && mcp::classify(parsed.value()) == mcp::MessageKind::Response)
            return parsed.value();
        return std::nullopt;
    };
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty()) {
            if (auto env = flush())
                return *env;
            continue;
        }
        if (line.rfind("data:", 0) == 0) {
            auto payload = line.substr(5);
            if (!payload.empty() && payload.front() == ' ')
                payload.erase(0, 1);
            if (!data.empty())
                data += '\n';
            data += payload;
        }
    }
    if (auto env = flush())
        return *env;
    return Error{ErrorCode::InvalidResponse, "No JSON-RPC response in event stream"};
}

boost::asio::awaitable<Result<json>> JsonRpcHttpClient::sendRequest(json request) {
    auto res = co_await http_.post(endpoint_, request.dump(), requestHeaders(), timeout_);
    if (!res)
        co_return res.error();
    const auto& response = res.value();
    if (!response.ok()) {
        co_return Error{ErrorCode::MCPCommunication, format("HTTP error: {}", response.status)};
    }
    captureSession(response);
    auto decoded = decodeBody(response.header("content-type"), response.body);
    if (!decoded) {
        spdlog::debug("[JsonRpcHttpClient] undecodable body from {}: {}", endpoint_,
                      decoded.error().message);
        co_return decoded.error();
    }
    co_return decoded.value();
}

boost::asio::awaitable<Result<void>> JsonRpcHttpClient::sendNotification(json notification) {
    auto res = co_await http_.post(endpoint_, notification.dump(), requestHeaders(), timeout_);
    if (!res)
        co_return res.error();
    if (!res.value().ok()) {
        co_return Error{ErrorCode::MCPCommunication,
                        format("HTTP error: {}", res.value().status)};
    }
    co_return Result<void>{};
}

} // namespace mcpgate::net
