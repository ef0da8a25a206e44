#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::mcp {

// Minimal JSON-RPC request capability: send one request, await its response envelope.
// Implemented by the stdio client session and the HTTP JSON-RPC client so callers do not
// depend on the transport kind.
class IRequestSender {
public:
    virtual ~IRequestSender() = default;

    virtual boost::asio::awaitable<Result<nlohmann::json>>
    sendRequest(nlohmann::json request) = 0;
};

} // namespace mcpgate::mcp
