#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/core/format.h>
#include <mcpgate/core/io_runtime.h>
#include <mcpgate/transport/http_transport.h>

using namespace mcpgate;
using mcpgate::test::run_sync;

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
using boost::asio::awaitable;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

// Remote server whose GET on /mcp never answers (a long-lived event stream) while /health
// answers with a configurable status.
class StallingMcpServer {
public:
    StallingMcpServer(boost::asio::any_io_executor executor, unsigned healthStatus)
        : state_(std::make_shared<State>(executor, healthStatus)) {
        boost::asio::co_spawn(executor, acceptLoop(state_), boost::asio::detached);
    }

    ~StallingMcpServer() {
        std::promise<void> closed;
        boost::asio::post(state_->acceptor.get_executor(), [this, &closed] {
            boost::system::error_code ec;
            state_->acceptor.close(ec);
            closed.set_value();
        });
        closed.get_future().wait();
    }

    std::uint16_t port() const { return state_->port; }

    std::vector<std::string> targets() const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        return state_->targets;
    }

private:
    struct State {
        State(boost::asio::any_io_executor ex, unsigned status)
            : acceptor(ex, tcp::endpoint{boost::asio::ip::make_address_v4("127.0.0.1"), 0}),
              port(acceptor.local_endpoint().port()), healthStatus(status) {}

        tcp::acceptor acceptor;
        std::uint16_t port;
        unsigned healthStatus;
        mutable std::mutex mutex;
        std::vector<std::string> targets;
    };

    static awaitable<void> acceptLoop(std::shared_ptr<State> state) {
        for (;;) {
            boost::system::error_code ec;
            auto socket = co_await state->acceptor.async_accept(
                boost::asio::redirect_error(use_awaitable, ec));
            if (ec)
                co_return;
            boost::asio::co_spawn(state->acceptor.get_executor(), serve(state, std::move(socket)),
                                  boost::asio::detached);
        }
    }

    static awaitable<void> serve(std::shared_ptr<State> state, tcp::socket socket) {
        beast::tcp_stream stream(std::move(socket));
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        boost::system::error_code ec;
        co_await http::async_read(stream, buffer, req, boost::asio::redirect_error(use_awaitable, ec));
        if (ec)
            co_return;

        const std::string target(req.target());
        {
            std::lock_guard<std::mutex> lk(state->mutex);
            state->targets.push_back(target);
        }

        if (target == "/mcp") {
            // Hold the connection until the client gives up
            http::request<http::string_body> next;
            co_await http::async_read(stream, buffer, next,
                                      boost::asio::redirect_error(use_awaitable, ec));
            co_return;
        }

        http::response<http::string_body> res{
            target == "/health" ? static_cast<http::status>(state->healthStatus)
                                : http::status::not_found,
            11};
        res.set(http::field::content_type, "application/json");
        res.body() = R"({"status":"healthy"})";
        res.keep_alive(false);
        res.prepare_payload();
        co_await http::async_write(stream, res, boost::asio::redirect_error(use_awaitable, ec));
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    std::shared_ptr<State> state_;
};

struct RemoteFixture {
    RemoteFixture() : runtime(2) {
        context.executor = runtime.executor();
        context.runtimeBinDir = bins.path();
        context.logRoot = logs.path();
    }

    ~RemoteFixture() { runtime.stop(); }

    std::unique_ptr<transport::HttpTransport> transportFor(const std::string& url) {
        model::ServerDescriptor remote;
        remote.id = "remote";
        remote.name = "Remote";
        remote.transport = model::TransportKind::Http;
        remote.url = url;
        auto created = transport::HttpTransport::create(remote, context);
        REQUIRE(created);
        return std::move(created).value();
    }

    core::IoRuntime runtime;
    test::TempDir logs{"mcpgate_http_logs_"};
    test::TempDir bins{"mcpgate_http_bin_"};
    transport::TransportContext context;
};

} // namespace

TEST_CASE("HttpTransport health URL drops the /mcp suffix", "[transport][http][unit]") {
    using transport::HttpTransport;
    CHECK(HttpTransport::healthUrl("http://h:1") == "http://h:1/health");
    CHECK(HttpTransport::healthUrl("http://h:1/") == "http://h:1/health");
    CHECK(HttpTransport::healthUrl("http://h:1/mcp") == "http://h:1/health");
    CHECK(HttpTransport::healthUrl("http://h:1/mcp/") == "http://h:1/health");
    CHECK(HttpTransport::healthUrl("http://h:1/api/mcp") == "http://h:1/api/health");
    CHECK(HttpTransport::healthUrl("http://h:1/api") == "http://h:1/api/health");
}

TEST_CASE_METHOD(RemoteFixture, "HttpTransport falls back to /health when GET /mcp stalls",
                 "[transport][http][unit]") {
    StallingMcpServer server(runtime.executor(), 200);
    auto http = transportFor(format("http://127.0.0.1:{}/mcp", server.port()));

    CHECK(run_sync(runtime, http->isHealthy()));

    auto targets = server.targets();
    CHECK(std::find(targets.begin(), targets.end(), "/mcp") != targets.end());
    CHECK(std::find(targets.begin(), targets.end(), "/health") != targets.end());
    CHECK(std::find(targets.begin(), targets.end(), "/mcp/health") == targets.end());
}

TEST_CASE_METHOD(RemoteFixture, "HttpTransport is unhealthy when /health fails too",
                 "[transport][http][unit]") {
    StallingMcpServer server(runtime.executor(), 503);
    auto http = transportFor(format("http://127.0.0.1:{}/mcp", server.port()));

    CHECK_FALSE(run_sync(runtime, http->isHealthy()));
    auto targets = server.targets();
    CHECK(std::find(targets.begin(), targets.end(), "/health") != targets.end());
}
