#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/types.h>
#include <mcpgate/model/server.h>
#include <mcpgate/process/child_process.h>

namespace mcpgate::transport {

// Result of Transport::start. The process handle, when present, belongs to whoever called
// start until that owner stops it.
struct ConnectionInfo {
    std::unique_ptr<process::ChildProcess> process;
    std::optional<int> pid;
    std::optional<std::uint16_t> port;
};

// Identical {start, stop, isHealthy} contract across Stdio, Http and Sse.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual model::TransportKind kind() const = 0;
    virtual boost::asio::awaitable<Result<ConnectionInfo>> start() = 0;
    virtual boost::asio::awaitable<Result<void>> stop() = 0;
    virtual boost::asio::awaitable<bool> isHealthy() = 0;
};

struct TransportContext {
    boost::asio::any_io_executor executor;
    std::filesystem::path runtimeBinDir;
    std::filesystem::path logRoot; // per-server exec logs
};

Result<std::unique_ptr<ITransport>> createTransport(const model::ServerDescriptor& server,
                                                    const TransportContext& context);

} // namespace mcpgate::transport
