#include <mcpgate/core/format.h>
#include <mcpgate/mcp/protocol.h>

namespace mcpgate::mcp {

json makeRequest(const json& id, std::string_view method, json params) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                {"id", id},
                {"method", method},
                {"params", std::move(params)}};
}

json makeNotification(std::string_view method, json params) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                {"method", method},
                {"params", std::move(params)}};
}

json makeErrorResponse(const json& id, int code, std::string_view message) {
    return json{{"jsonrpc", protocol::JSONRPC_VERSION},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

json makeInitializeParams(std::string_view clientName, std::string_view clientVersion) {
    return json{{"protocolVersion", protocol::MCP_PROTOCOL_VERSION},
                {"capabilities", {{"roots", {{"listChanged", true}}}, {"sampling", json::object()}}},
                {"clientInfo", {{"name", clientName}, {"version", clientVersion}}}};
}

std::optional<std::string> idKey(const json& id) {
    if (id.is_string())
        return id.get<std::string>();
    if (id.is_number_integer())
        return std::to_string(id.get<long long>());
    if (id.is_number_unsigned())
        return std::to_string(id.get<unsigned long long>());
    if (id.is_number_float())
        return id.dump();
    return std::nullopt;
}

MessageKind classify(const json& msg) {
    if (!msg.is_object())
        return MessageKind::Invalid;
    const bool hasId = msg.contains("id") && !msg["id"].is_null();
    const bool hasMethod = msg.contains("method") && msg["method"].is_string();
    if (hasId && hasMethod)
        return MessageKind::Request;
    if (hasMethod)
        return MessageKind::Notification;
    if (hasId && (msg.contains("result") || msg.contains("error")))
        return MessageKind::Response;
    return MessageKind::Invalid;
}

Result<json> extractResult(const json& response) {
    if (!response.is_object())
        return Error{ErrorCode::InvalidResponse, "MCP response is not an object"};
    if (response.contains("error") && !response["error"].is_null()) {
        const auto& err = response["error"];
        int code = protocol::INTERNAL_ERROR;
        std::string message = err.dump();
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer())
                code = err["code"].get<int>();
            if (err.contains("message") && err["message"].is_string())
                message = err["message"].get<std::string>();
        }
        return Error{ErrorCode::MCPCommunication, format("MCP error: {} - {}", code, message)};
    }
    if (!response.contains("result"))
        return Error{ErrorCode::InvalidResponse, "No result in MCP response"};
    return response["result"];
}

} // namespace mcpgate::mcp
