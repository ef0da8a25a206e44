#include <catch2/catch_test_macros.hpp>

#include <map>
#include <mutex>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/supervisor/auto_restart_supervisor.h>

using namespace mcpgate;
using mcpgate::test::run_sync;
using namespace std::chrono_literals;

namespace {

class FakeLifecycle : public server::IServerLifecycle {
public:
    boost::asio::awaitable<std::optional<server::ProcessStatus>>
    verifyRunning(ServerId id) override {
        std::lock_guard<std::mutex> lk(mutex);
        ++probes[id];
        if (healthy[id])
            co_return server::ProcessStatus{1234, 9000};
        co_return std::nullopt;
    }

    boost::asio::awaitable<model::ServerStartResult> startServer(ServerId id) override {
        std::lock_guard<std::mutex> lk(mutex);
        ++starts[id];
        if (failStarts)
            co_return model::ServerStartResult{
                model::ServerStartResult::Failed{Error{ErrorCode::ProcessSpawnFailed, "boom"}, ""}};
        co_return model::ServerStartResult{model::ServerStartResult::Started{1234, 9000}};
    }

    int startsFor(const ServerId& id) {
        std::lock_guard<std::mutex> lk(mutex);
        return starts[id];
    }

    std::mutex mutex;
    std::map<ServerId, bool> healthy;
    std::map<ServerId, int> probes;
    std::map<ServerId, int> starts;
    bool failStarts = false;
};

model::ServerDescriptor systemServer(const std::string& id, int maxAttempts = 0) {
    model::ServerDescriptor s;
    s.id = id;
    s.name = id;
    s.command = "fake";
    s.isSystem = true;
    s.maxRestartAttempts = maxAttempts;
    return s;
}

struct SupervisorFixture {
    SupervisorFixture()
        : runtime(2), repo(std::make_shared<store::InMemoryServerRepository>()),
          lifecycle(std::make_shared<FakeLifecycle>()) {
        config.maxRestartAttempts = 3;
        config.restartDelay = 5s;
    }
    ~SupervisorFixture() { runtime.stop(); }

    std::shared_ptr<supervisor::AutoRestartSupervisor> make() {
        return std::make_shared<supervisor::AutoRestartSupervisor>(runtime.executor(), repo,
                                                                   lifecycle, config);
    }

    core::IoRuntime runtime;
    std::shared_ptr<store::InMemoryServerRepository> repo;
    std::shared_ptr<FakeLifecycle> lifecycle;
    supervisor::AutoRestartConfig config;
    TimePoint t0 = std::chrono::system_clock::now();
};

} // namespace

TEST_CASE_METHOD(SupervisorFixture, "Supervisor restarts at most max attempts while unhealthy",
                 "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    auto sup = make();

    for (int tick = 0; tick < 5; ++tick)
        run_sync(runtime, sup->tick(t0 + std::chrono::seconds(30 * tick)));

    CHECK(lifecycle->startsFor("sys") == 3);
    auto state = sup->healthState("sys");
    REQUIRE(state);
    CHECK(state->consecutiveFailures == 5);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor healthy probe resets the failure counter",
                 "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    auto sup = make();

    run_sync(runtime, sup->tick(t0));
    run_sync(runtime, sup->tick(t0 + 30s));
    REQUIRE(sup->healthState("sys")->consecutiveFailures == 2);
    CHECK(lifecycle->startsFor("sys") == 2);

    lifecycle->healthy["sys"] = true;
    run_sync(runtime, sup->tick(t0 + 60s));
    auto state = sup->healthState("sys");
    REQUIRE(state);
    CHECK(state->consecutiveFailures == 0);
    CHECK_FALSE(state->lastRestartAttempt);

    // A fresh budget after recovery
    lifecycle->healthy["sys"] = false;
    for (int tick = 3; tick < 8; ++tick)
        run_sync(runtime, sup->tick(t0 + std::chrono::seconds(30 * tick)));
    CHECK(lifecycle->startsFor("sys") == 5);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor honours the restart cooldown", "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    auto sup = make();

    run_sync(runtime, sup->tick(t0));
    run_sync(runtime, sup->tick(t0 + 1s));
    run_sync(runtime, sup->tick(t0 + 2s));
    CHECK(lifecycle->startsFor("sys") == 1);
    CHECK(sup->healthState("sys")->consecutiveFailures == 3);

    run_sync(runtime, sup->tick(t0 + 10s));
    // Fourth failure exceeds the budget of three
    CHECK(lifecycle->startsFor("sys") == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor ignores user servers and disabled servers",
                 "[supervisor][unit]") {
    auto user = systemServer("user");
    user.isSystem = false;
    auto disabled = systemServer("off");
    disabled.enabled = false;
    repo->upsertServer(user);
    repo->upsertServer(disabled);
    auto sup = make();

    run_sync(runtime, sup->tick(t0));
    CHECK(lifecycle->startsFor("user") == 0);
    CHECK(lifecycle->startsFor("off") == 0);
    CHECK(sup->trackedCount() == 0);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor per-server budget overrides the default",
                 "[supervisor][unit]") {
    repo->upsertServer(systemServer("one", 1));
    auto sup = make();
    for (int tick = 0; tick < 4; ++tick)
        run_sync(runtime, sup->tick(t0 + std::chrono::seconds(30 * tick)));
    CHECK(lifecycle->startsFor("one") == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor keeps counting when restarts fail",
                 "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    lifecycle->failStarts = true;
    auto sup = make();
    for (int tick = 0; tick < 4; ++tick)
        run_sync(runtime, sup->tick(t0 + std::chrono::seconds(30 * tick)));
    CHECK(lifecycle->startsFor("sys") == 3);
    CHECK(sup->healthState("sys")->consecutiveFailures == 4);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor drops trackers of servers no longer supervised",
                 "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    auto sup = make();
    run_sync(runtime, sup->tick(t0));
    REQUIRE(sup->healthState("sys"));

    auto disabled = systemServer("sys");
    disabled.enabled = false;
    repo->upsertServer(disabled);
    run_sync(runtime, sup->tick(t0 + 30s));
    CHECK_FALSE(sup->healthState("sys"));

    sup->forget("sys");
    CHECK(sup->trackedCount() == 0);
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor loop starts, ticks and stops", "[supervisor][unit]") {
    repo->upsertServer(systemServer("sys"));
    config.healthCheckInterval = 1s;
    config.restartDelay = 0s;
    auto sup = make();
    sup->start();
    CHECK(sup->running());
    CHECK(test::wait_until([&] { return lifecycle->startsFor("sys") >= 1; }, 5s));
    sup->stop();
    CHECK_FALSE(sup->running());
}

TEST_CASE_METHOD(SupervisorFixture, "Supervisor disabled by configuration never starts",
                 "[supervisor][unit]") {
    config.enabled = false;
    auto sup = make();
    sup->start();
    CHECK_FALSE(sup->running());
    sup->stop();
}
