#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/core/io_runtime.h>
#include <mcpgate/logging/server_log_writer.h>
#include <mcpgate/mcp/protocol.h>
#include <mcpgate/process/child_process.h>
#include <mcpgate/proxy/stdio_client_session.h>

using namespace mcpgate;
using namespace std::chrono_literals;
using mcpgate::test::run_sync;
using nlohmann::json;

namespace {

struct SessionFixture {
    SessionFixture() : runtime(2) {}
    ~SessionFixture() {
        if (session)
            session->close();
        runtime.stop();
    }

    std::shared_ptr<proxy::StdioClientSession> open(std::vector<std::string> args,
                                                    std::chrono::milliseconds timeout = 5s) {
        process::ProcessConfig config;
        config.executable = test::fake_server_path();
        config.args = std::move(args);
        config.with_env("IS_MCPGATE_MCP", "1");
        auto child = process::ChildProcess::spawn(std::move(config));
        REQUIRE(child);

        proxy::StdioClientSession::Options options;
        options.requestTimeout = timeout;
        session = proxy::StdioClientSession::create(runtime.executor(), "fake",
                                                    std::move(child).value(), logs.path(),
                                                    options);
        return session;
    }

    bool errLogContains(const std::string& needle) const {
        auto reader = logging::ServerLogWriter::forServer(logs.path(), "fake");
        for (const auto& entry : reader->recentLogs(200)) {
            if (entry.type == model::LogType::Err &&
                entry.message.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    core::IoRuntime runtime;
    test::TempDir logs{"mcpgate_session_"};
    std::shared_ptr<proxy::StdioClientSession> session;
};

json echoRequest(const json& id, int value) {
    return mcp::makeRequest(id, "echo", json{{"value", value}});
}

} // namespace

TEST_CASE_METHOD(SessionFixture, "StdioClientSession handshakes with a stdio server",
                 "[proxy][session][unit]") {
    auto s = open({});
    auto init = run_sync(runtime, s->initialize());
    REQUIRE(init);
    CHECK(init.value()["serverInfo"]["name"] == "fake-mcp");
    CHECK(s->initialized());
    CHECK(s->isAlive());
    CHECK(s->pid().has_value());

    auto tools = run_sync(runtime, s->sendRequest(mcp::makeRequest(7, "tools/list")));
    REQUIRE(tools);
    CHECK(tools.value()["id"] == 7);
    CHECK(tools.value()["result"]["tools"].size() == 2);
    CHECK(s->pendingCount() == 0);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession injects the marker variable",
                 "[proxy][session][unit]") {
    auto s = open({});
    REQUIRE(run_sync(runtime, s->initialize()));
    CHECK(test::wait_until([&] { return errLogContains("marker=1"); }));
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession skips non-JSON stdout noise",
                 "[proxy][session][unit]") {
    auto s = open({"--noise"});
    auto init = run_sync(runtime, s->initialize());
    REQUIRE(init);
    CHECK(init.value().contains("protocolVersion"));
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession matches out-of-order responses by id",
                 "[proxy][session][unit]") {
    auto s = open({"--out-of-order"});
    REQUIRE(run_sync(runtime, s->initialize()));

    auto first = boost::asio::co_spawn(runtime.executor(), s->sendRequest(echoRequest(1, 10)),
                                       boost::asio::use_future);
    auto second = boost::asio::co_spawn(runtime.executor(), s->sendRequest(echoRequest(2, 20)),
                                        boost::asio::use_future);

    auto r1 = first.get();
    auto r2 = second.get();
    REQUIRE(r1);
    REQUIRE(r2);
    CHECK(r1.value()["id"] == 1);
    CHECK(r1.value()["result"]["value"] == 10);
    CHECK(r2.value()["id"] == 2);
    CHECK(r2.value()["result"]["value"] == 20);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession keeps colliding caller ids apart",
                 "[proxy][session][unit]") {
    auto s = open({"--out-of-order"});
    REQUIRE(run_sync(runtime, s->initialize()));

    // Two callers that both picked id 1
    auto a = boost::asio::co_spawn(runtime.executor(), s->sendRequest(echoRequest(1, 100)),
                                   boost::asio::use_future);
    auto b = boost::asio::co_spawn(runtime.executor(), s->sendRequest(echoRequest(1, 200)),
                                   boost::asio::use_future);
    auto ra = a.get();
    auto rb = b.get();
    REQUIRE(ra);
    REQUIRE(rb);
    CHECK(ra.value()["id"] == 1);
    CHECK(rb.value()["id"] == 1);
    CHECK(ra.value()["result"]["value"] == 100);
    CHECK(rb.value()["result"]["value"] == 200);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession rejects requests without an id",
                 "[proxy][session][unit]") {
    auto s = open({});
    REQUIRE(run_sync(runtime, s->initialize()));
    auto r = run_sync(runtime, s->sendRequest(mcp::makeNotification("notifications/progress")));
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(SessionFixture,
                 "StdioClientSession broadcasts notifications and declines server requests",
                 "[proxy][session][unit]") {
    auto s = open({"--notify"});
    auto receiver = s->subscribeNotifications();
    REQUIRE(run_sync(runtime, s->initialize()));

    std::optional<json> note;
    REQUIRE(test::wait_until([&] {
        auto r = receiver.tryRecv();
        if (r.status == core::BroadcastChannel<json>::RecvStatus::Item)
            note = r.value;
        return note.has_value();
    }));
    CHECK((*note)["method"] == "notifications/message");
    CHECK((*note)["params"]["data"] == "hello");

    // The fake logs our -32601 reply to its "srv-1" request on stderr
    CHECK(test::wait_until([&] { return errLogContains("client replied to \"srv-1\""); }));
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession times out when the server never answers",
                 "[proxy][session][unit]") {
    auto s = open({"--hang"}, 200ms);
    auto init = run_sync(runtime, s->initialize());
    REQUIRE_FALSE(init);
    CHECK(init.error().code == ErrorCode::Timeout);
    CHECK(s->pendingCount() == 0);
    CHECK_FALSE(s->initialized());
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession fails the handshake when the server exits",
                 "[proxy][session][unit]") {
    auto s = open({"--exit"});
    auto init = run_sync(runtime, s->initialize());
    REQUIRE_FALSE(init);
    CHECK(init.error().code == ErrorCode::HandshakeFailed);
    CHECK(test::wait_until([&] { return !s->isAlive(); }));
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession fails requests after the server exits",
                 "[proxy][session][unit]") {
    auto s = open({"--exit-after-init"});
    REQUIRE(run_sync(runtime, s->initialize()));
    REQUIRE(test::wait_until([&] { return !s->isAlive(); }));

    auto r = run_sync(runtime, s->sendRequest(mcp::makeRequest(1, "ping")));
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::MCPCommunication);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession close is idempotent and stops the child",
                 "[proxy][session][unit]") {
    auto s = open({});
    REQUIRE(run_sync(runtime, s->initialize()));
    const auto pid = s->pid();
    REQUIRE(pid);

    s->close();
    s->close();
    CHECK_FALSE(s->isAlive());
    CHECK(test::wait_until([&] { return !process::isProcessRunning(*pid); }));

    auto r = run_sync(runtime, s->sendRequest(mcp::makeRequest(1, "ping")));
    REQUIRE_FALSE(r);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession closeAsync returns once the child is reaped",
                 "[proxy][session][unit]") {
    auto s = open({});
    REQUIRE(run_sync(runtime, s->initialize()));
    const auto pid = s->pid();
    REQUIRE(pid);

    run_sync(runtime, s->closeAsync());
    CHECK_FALSE(s->isAlive());
    CHECK_FALSE(process::isProcessRunning(*pid));

    // close() after closeAsync() is a no-op
    s->close();
    auto r = run_sync(runtime, s->sendRequest(mcp::makeRequest(1, "ping")));
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::MCPCommunication);
}

TEST_CASE_METHOD(SessionFixture, "StdioClientSession logs traffic per direction",
                 "[proxy][session][unit]") {
    auto s = open({});
    REQUIRE(run_sync(runtime, s->initialize()));
    REQUIRE(run_sync(runtime, s->sendRequest(mcp::makeRequest(3, "ping"))));

    auto reader = logging::ServerLogWriter::forServer(logs.path(), "fake");
    bool sawIn = false, sawOut = false, sawExec = false;
    for (const auto& entry : reader->recentLogs(100)) {
        sawIn |= entry.type == model::LogType::In && entry.message.find("\"ping\"") != std::string::npos;
        sawOut |= entry.type == model::LogType::Out;
        sawExec |= entry.type == model::LogType::Exec &&
                   entry.message.find("Server initialized: fake-mcp") != std::string::npos;
    }
    CHECK(sawIn);
    CHECK(sawOut);
    CHECK(sawExec);
}
