#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/types.h>
#include <mcpgate/mcp/request_sender.h>
#include <mcpgate/model/server.h>

namespace mcpgate::proxy {

// Local HTTP front for a stdio server, listening on 127.0.0.1:<port>.
class IBridge {
public:
    virtual ~IBridge() = default;

    // Spawns and initializes the server, then starts listening. A failed start leaves
    // nothing running and nothing bound.
    virtual boost::asio::awaitable<Result<void>> start(std::uint16_t port) = 0;
    // Closes the listener and open connections and terminates the child. Idempotent.
    virtual boost::asio::awaitable<void> stop() = 0;
    virtual boost::asio::awaitable<bool> isHealthy() = 0;
    virtual std::optional<int> pid() const = 0;
    // Channel to the child's initialized session, null when the bridge keeps none.
    virtual std::shared_ptr<mcp::IRequestSender> requestSender() const { return nullptr; }
};

using BridgeFactory =
    std::function<std::shared_ptr<IBridge>(const model::ServerDescriptor& server)>;

} // namespace mcpgate::proxy
