#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/types.h>
#include <mcpgate/model/server.h>

namespace mcpgate::server {

struct ProcessStatus {
    std::optional<int> pid;
    std::optional<std::uint16_t> port;
};

// Answers "is this server actually up" from recorded runtime info plus a live probe.
class IProcessVerifier {
public:
    virtual ~IProcessVerifier() = default;

    virtual boost::asio::awaitable<std::optional<ProcessStatus>>
    verifyRunning(ServerId id) = 0;
};

// Start/verify operations the supervisor drives.
class IServerLifecycle : public IProcessVerifier {
public:
    // Must be idempotent: a server that is already up reports AlreadyRunning.
    virtual boost::asio::awaitable<model::ServerStartResult> startServer(ServerId id) = 0;
};

} // namespace mcpgate::server
