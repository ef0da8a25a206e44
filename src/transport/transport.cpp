#include <mcpgate/transport/http_transport.h>
#include <mcpgate/transport/stdio_transport.h>

namespace mcpgate::transport {

Result<std::unique_ptr<ITransport>> createTransport(const model::ServerDescriptor& server,
                                                    const TransportContext& context) {
    switch (server.transport) {
        case model::TransportKind::Stdio:
            return std::unique_ptr<ITransport>(std::make_unique<StdioTransport>(server, context));
        case model::TransportKind::Http:
        case model::TransportKind::Sse: {
            auto http = HttpTransport::create(server, context);
            if (!http)
                return http.error();
            return std::unique_ptr<ITransport>(std::move(http).value());
        }
    }
    return Error{ErrorCode::UnsupportedTransport,
                 std::string("Unsupported transport type: ") +
                     model::transportKindToString(server.transport)};
}

} // namespace mcpgate::transport
