#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::mcp {

using json = nlohmann::json;

namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view MCP_PROTOCOL_VERSION = "2024-11-05";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view INIT_REQUEST_ID = "init";

// Error codes from JSON-RPC 2.0 specification
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace protocol

enum class MessageKind {
    Response,     // has id and result or error
    Notification, // has method, no id
    Request,      // server-initiated: has id and method
    Invalid
};

json makeRequest(const json& id, std::string_view method, json params = json::object());
json makeNotification(std::string_view method, json params = json::object());
json makeErrorResponse(const json& id, int code, std::string_view message);

// initialize params for protocol 2024-11-05 with roots/sampling capabilities
json makeInitializeParams(std::string_view clientName, std::string_view clientVersion);

// String ids as-is, integers as decimal text; nullopt for anything else (including null).
std::optional<std::string> idKey(const json& id);

MessageKind classify(const json& msg);

// Returns `result` of a response, or a typed failure:
//   error member     -> MCPCommunication("MCP error: <code> - <message>")
//   neither present  -> InvalidResponse("No result in MCP response")
Result<json> extractResult(const json& response);

namespace json_utils {
// JSON parsing without exceptions
inline Result<json> parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::InvalidResponse, "Empty input string for JSON parsing"};
    }

    try {
        auto result = json::parse(input);
        return result;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidResponse, std::string("JSON parse error: ") + e.what() +
                                                     " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::InvalidResponse, std::string("JSON parsing failed: ") + e.what()};
    }
}
} // namespace json_utils

} // namespace mcpgate::mcp
