#include <catch2/catch_test_macros.hpp>

#include <future>
#include <string>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/core/broadcast_channel.h>
#include <mcpgate/core/io_runtime.h>

using namespace mcpgate;
using Channel = core::BroadcastChannel<int>;
using Status = Channel::RecvStatus;

TEST_CASE("BroadcastChannel delivers to every receiver in order", "[core][broadcast]") {
    Channel ch(8);
    auto a = ch.subscribe();
    auto b = ch.subscribe();
    CHECK(ch.receiverCount() == 2);

    CHECK(ch.send(1) == 2);
    CHECK(ch.send(2) == 2);

    for (auto* rx : {&a, &b}) {
        auto first = rx->tryRecv();
        REQUIRE(first.status == Status::Item);
        CHECK(*first.value == 1);
        auto second = rx->tryRecv();
        REQUIRE(second.status == Status::Item);
        CHECK(*second.value == 2);
        CHECK(rx->tryRecv().status == Status::Empty);
    }
}

TEST_CASE("BroadcastChannel receivers only see items sent after subscribing",
          "[core][broadcast]") {
    Channel ch(4);
    ch.send(1);
    auto late = ch.subscribe();
    CHECK(late.tryRecv().status == Status::Empty);
    ch.send(2);
    auto r = late.tryRecv();
    REQUIRE(r.status == Status::Item);
    CHECK(*r.value == 2);
}

TEST_CASE("BroadcastChannel reports lag once and resumes at the oldest item",
          "[core][broadcast]") {
    Channel ch(4);
    auto slow = ch.subscribe();
    for (int i = 0; i < 10; ++i)
        ch.send(i);

    auto lag = slow.tryRecv();
    CHECK(lag.status == Status::Lagged);
    CHECK(lag.skipped == 6);

    for (int expected = 6; expected < 10; ++expected) {
        auto r = slow.tryRecv();
        REQUIRE(r.status == Status::Item);
        CHECK(*r.value == expected);
    }
    CHECK(slow.tryRecv().status == Status::Empty);
}

TEST_CASE("BroadcastChannel close drains then reports Closed", "[core][broadcast]") {
    Channel ch(4);
    auto rx = ch.subscribe();
    ch.send(7);
    ch.close();
    CHECK(ch.closed());
    CHECK(ch.send(8) == 0);

    auto r = rx.tryRecv();
    REQUIRE(r.status == Status::Item);
    CHECK(*r.value == 7);
    CHECK(rx.tryRecv().status == Status::Closed);
}

TEST_CASE("BroadcastChannel tracks receiver lifetimes", "[core][broadcast]") {
    Channel ch(2);
    {
        auto a = ch.subscribe();
        auto moved = std::move(a);
        CHECK(ch.receiverCount() == 1);
        CHECK_FALSE(a.valid());
        CHECK(moved.valid());
    }
    CHECK(ch.receiverCount() == 0);
    CHECK(ch.send(1) == 0);

    CHECK_THROWS_AS(Channel(0), std::invalid_argument);
}

TEST_CASE("BroadcastChannel recv suspends until an item arrives", "[core][broadcast]") {
    core::IoRuntime runtime(1);
    core::BroadcastChannel<std::string> ch(4);
    auto rx = ch.subscribe();

    auto pending = boost::asio::co_spawn(runtime.executor(), rx.recv(), boost::asio::use_future);
    CHECK(pending.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    ch.send("wake");
    auto r = pending.get();
    REQUIRE(r.status == core::BroadcastChannel<std::string>::RecvStatus::Item);
    CHECK(*r.value == "wake");
    runtime.stop();
}
