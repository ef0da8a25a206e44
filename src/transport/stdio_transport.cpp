#include <mcpgate/core/format.h>
#include <mcpgate/transport/stdio_transport.h>

#include <spdlog/spdlog.h>

namespace mcpgate::transport {

StdioTransport::StdioTransport(model::ServerDescriptor server, const TransportContext& context)
    : server_(std::move(server)), resolver_(context.runtimeBinDir),
      log_(logging::ServerLogWriter::forServer(context.logRoot, server_.id)) {}

process::ProcessConfig StdioTransport::processConfig() const {
    auto resolved = resolver_.resolve(server_.command, server_.args);
    process::ProcessConfig config{.executable = resolved.program, .args = resolved.args};
    for (const auto& [key, value] : server_.env)
        config.with_env(key, value);
    config.with_env(kMarkerEnvName, kMarkerEnvValue);
    return config;
}

Result<ConnectionInfo> StdioTransport::spawn() {
    if (server_.command.empty()) {
        log_->exec("ERROR", "No command configured");
        return Error{ErrorCode::InvalidArgument,
                     format("stdio server '{}' has no command", server_.id)};
    }

    auto config = processConfig();
    std::string commandLine = config.executable.string();
    for (const auto& a : config.args)
        commandLine += " " + a;
    log_->exec("INFO", format("Starting server: {}", commandLine));

    auto child = process::ChildProcess::spawn(std::move(config));
    if (!child) {
        log_->exec("ERROR", child.error().message);
        spdlog::error("[StdioTransport] {}: {}", server_.id, child.error().message);
        return child.error();
    }

    ConnectionInfo info;
    info.process = std::move(child).value();
    info.pid = info.process->pid();
    log_->exec("INFO", format("Server process started (pid={})", *info.pid));
    spdlog::info("[StdioTransport] {} started (pid={})", server_.id, *info.pid);
    return std::move(info);
}

boost::asio::awaitable<Result<ConnectionInfo>> StdioTransport::start() {
    co_return spawn();
}

boost::asio::awaitable<Result<void>> StdioTransport::stop() {
    co_return Result<void>{};
}

boost::asio::awaitable<bool> StdioTransport::isHealthy() {
    co_return true;
}

} // namespace mcpgate::transport
