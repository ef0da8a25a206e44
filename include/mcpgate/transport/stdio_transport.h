#pragma once

#include <mcpgate/logging/server_log_writer.h>
#include <mcpgate/transport/command_resolver.h>
#include <mcpgate/transport/transport.h>

namespace mcpgate::transport {

// Marker variable injected into every stdio child
inline constexpr const char* kMarkerEnvName = "IS_MCPGATE_MCP";
inline constexpr const char* kMarkerEnvValue = "1";

// Spawns the server as a child with piped stdio. Process termination belongs to the caller
// that received the handle, so stop() is a no-op and isHealthy() reports true; liveness is
// checked by the owner.
class StdioTransport : public ITransport {
public:
    StdioTransport(model::ServerDescriptor server, const TransportContext& context);

    model::TransportKind kind() const override { return model::TransportKind::Stdio; }
    boost::asio::awaitable<Result<ConnectionInfo>> start() override;
    boost::asio::awaitable<Result<void>> stop() override;
    boost::asio::awaitable<bool> isHealthy() override;

    // Synchronous spawn used by start()
    Result<ConnectionInfo> spawn();

    process::ProcessConfig processConfig() const;

private:
    model::ServerDescriptor server_;
    CommandResolver resolver_;
    std::shared_ptr<logging::ServerLogWriter> log_;
};

} // namespace mcpgate::transport
