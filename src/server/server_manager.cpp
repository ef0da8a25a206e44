#include <mcpgate/core/format.h>
#include <mcpgate/logging/server_log_writer.h>
#include <mcpgate/process/child_process.h>
#include <mcpgate/server/server_manager.h>
#include <mcpgate/transport/http_transport.h>

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace mcpgate::server {

using boost::asio::awaitable;
using model::ServerStartResult;

ServerManager::ServerManager(std::shared_ptr<store::IServerRepository> repository,
                             std::shared_ptr<proxy::ProxyManager> proxies,
                             transport::TransportContext context)
    : repository_(std::move(repository)), proxies_(std::move(proxies)),
      context_(std::move(context)) {}

std::shared_ptr<ServerManager::RunningServer> ServerManager::entryFor(const ServerId& id) const {
    std::shared_lock lk(mutex_);
    auto it = running_.find(id);
    return it == running_.end() ? nullptr : it->second;
}

awaitable<ServerStartResult> ServerManager::startServer(ServerId id) {
    ServerStartResult result;
    {
        auto guard = co_await startMutex_.scoped_lock();
        result = co_await startLocked(id);
    }
    if (result.started())
        notifyStarted(id);
    co_return result;
}

void ServerManager::setStartedHook(StartedHook hook) {
    std::unique_lock lk(mutex_);
    startedHook_ = std::move(hook);
}

void ServerManager::notifyStarted(const ServerId& id) {
    StartedHook hook;
    {
        std::shared_lock lk(mutex_);
        hook = startedHook_;
    }
    if (!hook)
        return;
    auto server = repository_->getServer(id);
    if (!server) {
        spdlog::warn("[ServerManager] {}: descriptor vanished after start", id);
        return;
    }
    hook(server.value());
}

awaitable<ServerStartResult> ServerManager::startLocked(const ServerId& id) {
    if (auto status = co_await verifyRunning(id)) {
        spdlog::debug("[ServerManager] {} already running", id);
        co_return ServerStartResult{ServerStartResult::AlreadyRunning{status->pid, status->port}};
    }

    auto server = repository_->getServer(id);
    if (!server)
        co_return ServerStartResult{ServerStartResult::Failed{server.error(), {}}};

    auto log = logging::ServerLogWriter::forServer(context_.logRoot, id);
    const std::string logPath = log->execLogPath().string();

    // Leftovers of an unhealthy instance (bridge still bound, transport still registered)
    co_await teardown(id);

    auto entry = std::make_shared<RunningServer>();
    entry->kind = server.value().transport;
    std::optional<int> pid;
    std::optional<std::uint16_t> port;

    if (entry->kind == model::TransportKind::Stdio) {
        auto proxyPort = co_await proxies_->startProxy(server.value());
        if (!proxyPort) {
            spdlog::error("[ServerManager] failed to start {}: {}", id, proxyPort.error().message);
            co_return ServerStartResult{ServerStartResult::Failed{proxyPort.error(), logPath}};
        }
        port = proxyPort.value();
        pid = proxies_->getProxyPid(id);
        entry->url = proxy::ProxyManager::proxyUrl(proxyPort.value());
    } else {
        auto http = transport::HttpTransport::create(server.value(), context_);
        if (!http) {
            log->exec("ERROR", http.error().message);
            co_return ServerStartResult{ServerStartResult::Failed{http.error(), logPath}};
        }
        std::shared_ptr<transport::HttpTransport> transport = std::move(http).value();
        auto conn = co_await transport->start();
        if (!conn) {
            log->exec("ERROR", format("Connection failed: {}", conn.error().message));
            spdlog::error("[ServerManager] failed to connect {}: {}", id, conn.error().message);
            co_return ServerStartResult{ServerStartResult::Failed{conn.error(), logPath}};
        }
        port = conn.value().port;
        entry->url = transport->endpoint();
        entry->transport = std::move(transport);
    }

    {
        std::unique_lock lk(mutex_);
        running_[id] = entry;
    }
    if (auto r = repository_->updateRuntimeInfo(id, pid, port, model::RuntimeStatus::Running, true);
        !r) {
        spdlog::warn("[ServerManager] {}: failed to record runtime info: {}", id, r.error().message);
    }
    if (auto r = repository_->incrementRestartCount(id); !r)
        spdlog::warn("[ServerManager] {}: failed to count start: {}", id, r.error().message);

    spdlog::info("[ServerManager] started {} ({}) at {}", id,
                 model::transportKindToString(entry->kind), entry->url);
    co_return ServerStartResult{ServerStartResult::Started{pid, port}};
}

awaitable<Result<void>> ServerManager::stopServer(ServerId id) {
    auto guard = co_await startMutex_.scoped_lock();
    co_await teardown(id);
    recordStopped(id);
    co_return Result<void>{};
}

awaitable<void> ServerManager::teardown(const ServerId& id) {
    std::shared_ptr<RunningServer> entry;
    {
        std::unique_lock lk(mutex_);
        if (auto it = running_.find(id); it != running_.end()) {
            entry = std::move(it->second);
            running_.erase(it);
        }
    }
    if (entry && entry->transport) {
        auto r = co_await entry->transport->stop();
        if (!r)
            spdlog::warn("[ServerManager] {}: transport stop failed: {}", id, r.error().message);
    }
    if (proxies_->getProxyPort(id)) {
        auto r = co_await proxies_->stopProxy(id);
        if (!r)
            spdlog::warn("[ServerManager] {}: proxy stop failed: {}", id, r.error().message);
    }
}

void ServerManager::recordStopped(const ServerId& id) {
    auto r = repository_->updateRuntimeInfo(id, std::nullopt, std::nullopt,
                                            model::RuntimeStatus::Stopped, false);
    if (!r && r.error().code != ErrorCode::ServerNotFound)
        spdlog::warn("[ServerManager] {}: failed to record stop: {}", id, r.error().message);
}

awaitable<void> ServerManager::cleanupStale(const ServerId& id, std::string_view reason) {
    spdlog::warn("[ServerManager] {}: clearing stale runtime record ({})", id, reason);
    co_await teardown(id);
    recordStopped(id);
}

awaitable<std::optional<ProcessStatus>> ServerManager::verifyRunning(ServerId id) {
    auto info = repository_->getRuntimeInfo(id);
    if (!info || info.value().status != model::RuntimeStatus::Running)
        co_return std::nullopt;
    const auto runtime = info.value();

    if (runtime.pid && !process::isProcessRunning(*runtime.pid)) {
        co_await cleanupStale(id, format("pid {} exited", *runtime.pid));
        co_return std::nullopt;
    }

    auto entry = entryFor(id);
    if (!entry) {
        co_await cleanupStale(id, "not started by this gateway");
        co_return std::nullopt;
    }

    bool healthy = false;
    if (entry->kind == model::TransportKind::Stdio)
        healthy = co_await proxies_->isProxyHealthy(id);
    else if (entry->transport)
        healthy = co_await entry->transport->isHealthy();
    if (!healthy) {
        spdlog::debug("[ServerManager] {} failed its health check", id);
        co_return std::nullopt;
    }
    co_return ProcessStatus{runtime.pid, runtime.port};
}

std::string ServerManager::reachableUrl(const ServerId& id) const {
    if (auto entry = entryFor(id))
        return entry->url;
    return proxies_->getProxyUrl(id).value_or(std::string{});
}

std::vector<ServerId> ServerManager::runningServers() const {
    std::vector<ServerId> ids;
    {
        std::shared_lock lk(mutex_);
        for (const auto& [id, entry] : running_)
            ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

awaitable<void> ServerManager::reconcile() {
    for (const auto& server : repository_->listServers()) {
        auto info = repository_->getRuntimeInfo(server.id);
        if (info && info.value().status == model::RuntimeStatus::Running && !entryFor(server.id)) {
            spdlog::info("[ServerManager] {} was recorded running; marking stopped", server.id);
            recordStopped(server.id);
        }
    }

    for (const auto& server : repository_->listEnabledServers()) {
        if (!server.isSystem)
            continue;
        auto result = co_await startServer(server.id);
        if (auto* failed = std::get_if<ServerStartResult::Failed>(&result.outcome)) {
            spdlog::error("[ServerManager] auto-start of {} failed: {} (see {})", server.id,
                          failed->error.message, failed->logPath);
        }
    }
}

awaitable<void> ServerManager::shutdownAll() {
    for (const auto& id : runningServers()) {
        auto r = co_await stopServer(id);
        if (!r)
            spdlog::warn("[ServerManager] {}: stop failed: {}", id, r.error().message);
    }
    auto r = co_await proxies_->shutdownAllProxies();
    if (!r)
        spdlog::warn("[ServerManager] proxy shutdown failed: {}", r.error().message);
}

} // namespace mcpgate::server
