#include <mcpgate/core/format.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/proxy/stdio_client_session.h>
#include <mcpgate/version.hpp>

#include <algorithm>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::proxy {

using boost::asio::awaitable;
using boost::asio::use_awaitable;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxLineBytes = 64 * 1024 * 1024;

bool is_ws(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Strips CR, surrounding whitespace, a UTF-8 BOM and record separators before the JSON.
void sanitizeLine(std::string& line) {
    while (!line.empty() && is_ws(static_cast<unsigned char>(line.back())))
        line.pop_back();
    if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
        static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
    }
    auto first = std::find_if_not(line.begin(), line.end(), [](unsigned char c) {
        return is_ws(c) || c == 0x1e || c < 0x20;
    });
    line.erase(line.begin(), first);
}

} // namespace

std::shared_ptr<StdioClientSession>
StdioClientSession::create(boost::asio::any_io_executor executor, ServerId serverId,
                           std::unique_ptr<process::ChildProcess> child,
                           std::filesystem::path logRoot, Options options) {
    std::shared_ptr<StdioClientSession> session(new StdioClientSession(
        std::move(executor), std::move(serverId), std::move(child), std::move(logRoot),
        std::move(options)));
    session->startReaders();
    return session;
}

StdioClientSession::StdioClientSession(boost::asio::any_io_executor executor, ServerId serverId,
                                       std::unique_ptr<process::ChildProcess> child,
                                       std::filesystem::path logRoot, Options options)
    : serverId_(std::move(serverId)), options_(std::move(options)), child_(std::move(child)),
      log_(logging::ServerLogWriter::forServer(logRoot, serverId_)),
      strand_(boost::asio::make_strand(executor)),
      stdin_(strand_), stdout_(strand_), stderr_(strand_),
      notifications_(options_.notificationCapacity) {
    stdin_.assign(child_->releaseStdin());
    stdout_.assign(child_->releaseStdout());
    stderr_.assign(child_->releaseStderr());
}

StdioClientSession::~StdioClientSession() {
    // Readers hold a reference, so by now both pipes have closed
    boost::system::error_code ec;
    stdin_.close(ec);
    stdout_.close(ec);
    stderr_.close(ec);
    if (child_ && child_->isAlive())
        child_->terminate(std::chrono::seconds{2});
}

void StdioClientSession::startReaders() {
    auto self = shared_from_this();
    boost::asio::co_spawn(
        strand_, [self]() -> awaitable<void> { co_await self->readStdout(); },
        boost::asio::detached);
    boost::asio::co_spawn(
        strand_, [self]() -> awaitable<void> { co_await self->readStderr(); },
        boost::asio::detached);
}

bool StdioClientSession::isAlive() const {
    return alive_.load() && child_ && child_->isAlive();
}

std::optional<int> StdioClientSession::pid() const {
    if (!child_)
        return std::nullopt;
    return child_->pid();
}

std::size_t StdioClientSession::pendingCount() const {
    std::lock_guard<std::mutex> lk(pendingMutex_);
    return pending_.size();
}

awaitable<Result<json>> StdioClientSession::initialize() {
    auto request = mcp::makeRequest(
        std::string(mcp::protocol::INIT_REQUEST_ID), mcp::protocol::METHOD_INITIALIZE,
        mcp::makeInitializeParams(options_.clientName, version::string_v));
    auto response = co_await roundTrip(std::move(request),
                                       std::string(mcp::protocol::INIT_REQUEST_ID));
    if (!response) {
        log_->exec("ERROR", format("Initialize failed: {}", response.error().message));
        if (response.error().code == ErrorCode::Timeout)
            co_return response.error();
        co_return Error{ErrorCode::HandshakeFailed,
                        format("initialize failed: {}", response.error().message)};
    }
    auto result = mcp::extractResult(response.value());
    if (!result) {
        log_->exec("ERROR", format("Initialize rejected: {}", result.error().message));
        co_return Error{ErrorCode::HandshakeFailed,
                        format("initialize rejected: {}", result.error().message)};
    }

    auto note = co_await sendNotification(mcp::makeNotification(mcp::protocol::METHOD_INITIALIZED));
    if (!note) {
        co_return Error{ErrorCode::HandshakeFailed,
                        format("initialized notification failed: {}", note.error().message)};
    }

    initialized_.store(true);
    std::string serverName = "unknown";
    if (result.value().contains("serverInfo") && result.value()["serverInfo"].is_object())
        serverName = result.value()["serverInfo"].value("name", serverName);
    log_->exec("INFO", format("Server initialized: {}", serverName));
    spdlog::info("[StdioClientSession] {} initialized (server: {})", serverId_, serverName);
    co_return result.value();
}

awaitable<Result<json>> StdioClientSession::sendRequest(json request) {
    if (!request.is_object() || !request.contains("id") || request["id"].is_null()) {
        co_return Error{ErrorCode::InvalidArgument, "JSON-RPC request without id"};
    }
    const json originalId = request["id"];
    const std::string key = "gw-" + std::to_string(nextId_.fetch_add(1));
    request["id"] = key;

    auto response = co_await roundTrip(std::move(request), key);
    if (!response)
        co_return response.error();
    json out = std::move(response).value();
    out["id"] = originalId;
    co_return out;
}

awaitable<Result<void>> StdioClientSession::sendNotification(json notification) {
    if (!alive_.load())
        co_return Error{ErrorCode::MCPCommunication, "server closed"};
    co_return co_await writeLocked(notification.dump());
}

awaitable<Result<json>> StdioClientSession::roundTrip(json request, std::string key) {
    auto self = shared_from_this();
    auto promise = std::make_shared<std::promise<Result<json>>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        if (!alive_.load())
            co_return Error{ErrorCode::MCPCommunication, "server closed"};
        pending_[key] = promise;
    }

    auto written = co_await writeLocked(request.dump());
    if (!written) {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        pending_.erase(key);
        co_return written.error();
    }

    // Poll the one-shot response until the deadline
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + options_.requestTimeout;
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    while (std::chrono::steady_clock::now() < deadline) {
        if (future.wait_for(0ms) == std::future_status::ready)
            co_return future.get();
        timer.expires_after(10ms);
        co_await timer.async_wait(use_awaitable);
    }
    if (future.wait_for(0ms) == std::future_status::ready)
        co_return future.get();

    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        pending_.erase(key);
    }
    std::string method = request.value("method", std::string("?"));
    log_->exec("WARN", format("Request {} ({}) timed out", key, method));
    co_return Error{ErrorCode::Timeout,
                    format("Request '{}' to {} timed out after {}ms", method, serverId_,
                           options_.requestTimeout.count())};
}

awaitable<Result<void>> StdioClientSession::writeLocked(std::string line) {
    auto self = shared_from_this();
    auto guard = co_await writeMutex_.scoped_lock();
    co_return co_await boost::asio::co_spawn(
        strand_, [self, line = std::move(line)]() mutable { return self->writeLine(std::move(line)); },
        use_awaitable);
}

// Runs on strand_
awaitable<Result<void>> StdioClientSession::writeLine(std::string line) {
    if (!stdin_.is_open())
        co_return Error{ErrorCode::MCPCommunication, "server stdin is closed"};

    auto self = shared_from_this();
    auto timedOut = std::make_shared<bool>(false);
    boost::asio::steady_timer timer(strand_);
    timer.expires_after(options_.writeTimeout);
    timer.async_wait([self, timedOut](const boost::system::error_code& ec) {
        if (ec)
            return;
        *timedOut = true;
        boost::system::error_code ignored;
        self->stdin_.cancel(ignored);
    });

    std::string framed = line;
    framed.push_back('\n');
    boost::system::error_code ec;
    co_await boost::asio::async_write(stdin_, boost::asio::buffer(framed),
                                      boost::asio::redirect_error(use_awaitable, ec));
    timer.cancel();

    if (*timedOut) {
        log_->exec("ERROR", "Write to server stdin timed out");
        co_return Error{ErrorCode::Timeout, format("write to {} stdin timed out", serverId_)};
    }
    if (ec) {
        co_return Error{ErrorCode::MCPCommunication,
                        format("write to {} stdin failed: {}", serverId_, ec.message())};
    }
    log_->in(line);
    co_return Result<void>{};
}

awaitable<void> StdioClientSession::readStdout() {
    std::string buffer;
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await boost::asio::async_read_until(
            stdout_, boost::asio::dynamic_buffer(buffer, kMaxLineBytes), '\n',
            boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[StdioClientSession] {}: stdout read failed: {}", serverId_,
                             ec.message());
            }
            break;
        }
        std::string line = buffer.substr(0, n);
        buffer.erase(0, n);
        try {
            handleLine(std::move(line));
        } catch (const std::exception& e) {
            spdlog::warn("[StdioClientSession] {}: failed to handle line: {}", serverId_, e.what());
        }
    }
    if (!buffer.empty()) {
        try {
            handleLine(std::move(buffer));
        } catch (const std::exception& e) {
            spdlog::debug("[StdioClientSession] {}: trailing output dropped: {}", serverId_,
                          e.what());
        }
    }
    co_await onStdoutClosed();
}

awaitable<void> StdioClientSession::readStderr() {
    std::string buffer;
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await boost::asio::async_read_until(
            stderr_, boost::asio::dynamic_buffer(buffer, kMaxLineBytes), '\n',
            boost::asio::redirect_error(use_awaitable, ec));
        if (ec)
            break;
        std::string line = buffer.substr(0, n);
        buffer.erase(0, n);
        sanitizeLine(line);
        if (line.empty())
            continue;
        log_->err(line);
        spdlog::debug("[StdioClientSession] {} stderr: {}", serverId_, line);
    }
    if (!buffer.empty())
        log_->err(buffer);
}

void StdioClientSession::handleLine(std::string line) {
    sanitizeLine(line);
    if (line.empty())
        return;
    log_->out(line);

    if (line.front() != '{' && line.front() != '[') {
        spdlog::debug("[StdioClientSession] {}: non-JSON output: {}", serverId_, line);
        return;
    }
    auto parsed = mcp::json_utils::parse_json(line);
    if (!parsed) {
        spdlog::warn("[StdioClientSession] {}: {}", serverId_, parsed.error().message);
        return;
    }
    const auto& msg = parsed.value();
    if (msg.is_array()) {
        for (const auto& item : msg)
            handleMessage(item);
        return;
    }
    handleMessage(msg);
}

void StdioClientSession::handleMessage(const json& msg) {
    switch (mcp::classify(msg)) {
        case mcp::MessageKind::Response: {
            auto key = mcp::idKey(msg["id"]);
            Pending waiter;
            if (key) {
                std::lock_guard<std::mutex> lk(pendingMutex_);
                auto it = pending_.find(*key);
                if (it != pending_.end()) {
                    waiter = std::move(it->second);
                    pending_.erase(it);
                }
            }
            if (!waiter) {
                spdlog::warn("[StdioClientSession] {}: dropping response with unknown id {}",
                             serverId_, msg["id"].dump());
                return;
            }
            waiter->set_value(msg);
            return;
        }
        case mcp::MessageKind::Notification:
            notifications_.send(msg);
            return;
        case mcp::MessageKind::Request: {
            spdlog::debug("[StdioClientSession] {}: declining server request '{}'", serverId_,
                          msg["method"].get<std::string>());
            auto reply = mcp::makeErrorResponse(msg["id"], mcp::protocol::METHOD_NOT_FOUND,
                                                "Method not supported by gateway");
            auto self = shared_from_this();
            boost::asio::co_spawn(
                strand_,
                [self, reply]() -> awaitable<void> {
                    auto r = co_await self->writeLocked(reply.dump());
                    if (!r)
                        spdlog::debug("[StdioClientSession] {}: reply failed: {}",
                                      self->serverId_, r.error().message);
                },
                boost::asio::detached);
            return;
        }
        case mcp::MessageKind::Invalid:
            spdlog::debug("[StdioClientSession] {}: ignoring invalid message", serverId_);
            return;
    }
}

void StdioClientSession::failAllPending(const Error& error) {
    std::unordered_map<std::string, Pending> waiters;
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        waiters.swap(pending_);
    }
    for (auto& [key, waiter] : waiters)
        waiter->set_value(Result<json>(error));
}

awaitable<void> StdioClientSession::onStdoutClosed() {
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        alive_.store(false);
    }
    failAllPending(Error{ErrorCode::MCPCommunication, "server closed"});
    notifications_.close();
    if (!closed_.load()) {
        std::string detail;
        if (child_) {
            co_await child_->waitForExitAsync(std::chrono::milliseconds(200));
            if (auto code = child_->exitCode())
                detail = format(" (exit code {})", *code);
        }
        log_->exec("WARN", "Server closed stdout" + detail);
        spdlog::warn("[StdioClientSession] {}: server closed stdout{}", serverId_, detail);
    }
}

bool StdioClientSession::beginClose() {
    if (closed_.exchange(true))
        return false;
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        alive_.store(false);
    }
    failAllPending(Error{ErrorCode::MCPCommunication, "server closed"});
    log_->exec("INFO", "Stopping server");
    return true;
}

awaitable<void> StdioClientSession::terminateChild() {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self]() {
        boost::system::error_code ec;
        self->stdin_.close(ec);
    });
    if (child_)
        co_await child_->terminateAsync(std::chrono::seconds{2});
    boost::asio::post(strand_, [self]() {
        boost::system::error_code ec;
        self->stdout_.close(ec);
        self->stderr_.close(ec);
    });
    spdlog::info("[StdioClientSession] {} closed", serverId_);
}

void StdioClientSession::close() {
    if (!beginClose())
        return;
    auto self = shared_from_this();
    boost::asio::co_spawn(
        strand_, [self]() -> awaitable<void> { co_await self->terminateChild(); },
        boost::asio::detached);
}

awaitable<void> StdioClientSession::closeAsync() {
    if (!beginClose())
        co_return;
    co_await terminateChild();
}

} // namespace mcpgate::proxy
