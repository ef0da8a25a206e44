#include <catch2/catch_test_macros.hpp>

#include <memory>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/gateway.h>
#include <mcpgate/store/server_repository.h>

using namespace mcpgate;
using mcpgate::test::run_sync;

namespace {

model::ServerDescriptor fakeServer(const std::string& id, bool isSystem) {
    model::ServerDescriptor s;
    s.id = id;
    s.name = id;
    s.command = test::fake_server_path();
    s.args = {"--tools", "4"};
    s.isSystem = isSystem;
    return s;
}

config::GatewayConfig testConfig(const std::filesystem::path& dataDir) {
    config::GatewayConfig c;
    c.dataDir = dataDir;
    c.runtimeBinDir = dataDir / "bin";
    c.portRangeStart = 19700;
    c.portRangeEnd = 19799;
    c.supervisorEnabled = false;
    c.ioThreads = 2;
    return c;
}

} // namespace

TEST_CASE("Gateway starts system servers and shuts everything down", "[gateway]") {
    test::TempDir data("mcpgate_gateway_");
    auto repo = std::make_shared<store::InMemoryServerRepository>();
    repo->upsertServer(fakeServer("system", true));
    repo->upsertServer(fakeServer("user", false));

    Gateway gateway(testConfig(data.path()), repo);
    REQUIRE(gateway.start());
    CHECK(std::filesystem::is_directory(data.path() / "logs" / "mcp"));

    auto running = gateway.proxies().listRunningProxies();
    REQUIRE(running.size() == 1);
    CHECK(running[0].serverId == "system");
    CHECK(running[0].port == 19700);
    CHECK(gateway.servers().reachableUrl("system") == "http://127.0.0.1:19700/mcp");
    CHECK(gateway.servers().reachableUrl("user").empty());

    // Second start is a no-op
    REQUIRE(gateway.start());
    CHECK(gateway.proxies().listRunningProxies().size() == 1);

    SECTION("discovery goes through the bridge") {
        auto count = run_sync(gateway.runtime(), gateway.discovery().discoverAndCache("system"));
        REQUIRE(count);
        CHECK(count.value() == 4);
        auto tools = gateway.discovery().cachedTools("system");
        REQUIRE(tools);
        CHECK(tools.value().size() == 4);
        CHECK(repo->getServer("system").value().toolsCount == 4);
    }

    SECTION("log subscriptions are served for a running server") {
        auto sub = gateway.logs().subscribe("system");
        REQUIRE(sub);
        CHECK(gateway.logs().isWatching("system"));
        gateway.logs().unsubscribe("system");
        CHECK_FALSE(gateway.logs().isWatching("system"));
    }

    gateway.shutdown();
    CHECK(gateway.proxies().listRunningProxies().empty());
    auto info = repo->getRuntimeInfo("system");
    REQUIRE(info);
    CHECK(info.value().status == model::RuntimeStatus::Stopped);

    gateway.shutdown();
    auto restarted = gateway.start();
    REQUIRE_FALSE(restarted);
    CHECK(restarted.error().code == ErrorCode::InvalidState);
}

TEST_CASE("Gateway discovers tools after every server start", "[gateway]") {
    test::TempDir data("mcpgate_gateway_");
    auto repo = std::make_shared<store::InMemoryServerRepository>();
    repo->upsertServer(fakeServer("system", true));
    repo->upsertServer(fakeServer("user", false));

    Gateway gateway(testConfig(data.path()), repo);
    REQUIRE(gateway.start());

    auto discovered = [&](const ServerId& id) {
        auto server = repo->getServer(id);
        return server && server.value().toolsCount == 4 &&
               server.value().toolsDiscoveredAt.has_value();
    };
    CHECK(test::wait_until([&] { return discovered("system"); }));
    CHECK(gateway.discovery().cachedTools("system").value().size() == 4);
    CHECK_FALSE(gateway.discovery().shouldRediscover("system").value());

    // Manual start of a user server
    CHECK_FALSE(discovered("user"));
    auto started = run_sync(gateway.runtime(), gateway.servers().startServer("user"));
    REQUIRE(started.started());
    CHECK(test::wait_until([&] { return discovered("user"); }));

    gateway.shutdown();
}

TEST_CASE("Gateway start succeeds with an empty registry", "[gateway]") {
    test::TempDir data("mcpgate_gateway_");
    Gateway gateway(testConfig(data.path()), std::make_shared<store::InMemoryServerRepository>());
    REQUIRE(gateway.start());
    CHECK(gateway.proxies().listRunningProxies().empty());
    CHECK(gateway.servers().runningServers().empty());
}
