#include <catch2/catch_test_macros.hpp>

#include <set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <mcpgate/proxy/port_allocator.h>

using mcpgate::ErrorCode;
using mcpgate::proxy::PortAllocator;

namespace {
PortAllocator::PortProbe alwaysFree() {
    return [](std::uint16_t) { return true; };
}
} // namespace

TEST_CASE("PortAllocator hands out the lowest free port", "[proxy][port][unit]") {
    PortAllocator alloc(9000, 9009, alwaysFree());

    auto a = alloc.allocate();
    auto b = alloc.allocate();
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a.value() == 9000);
    CHECK(b.value() == 9001);
    CHECK(alloc.isAllocated(9000));
    CHECK(alloc.allocatedCount() == 2);

    alloc.release(9000);
    auto c = alloc.allocate();
    REQUIRE(c);
    CHECK(c.value() == 9000);
}

TEST_CASE("PortAllocator release is idempotent", "[proxy][port][unit]") {
    PortAllocator alloc(9000, 9001, alwaysFree());
    auto p = alloc.allocate();
    REQUIRE(p);
    alloc.release(p.value());
    alloc.release(p.value());
    alloc.release(9500);
    CHECK(alloc.allocatedCount() == 0);
}

TEST_CASE("PortAllocator exhausts and recovers the range", "[proxy][port][unit]") {
    constexpr int kPorts = 5;
    PortAllocator alloc(9100, 9100 + kPorts - 1, alwaysFree());

    std::set<std::uint16_t> taken;
    for (int i = 0; i < kPorts; ++i) {
        auto p = alloc.allocate();
        REQUIRE(p);
        CHECK(taken.insert(p.value()).second);
    }
    auto none = alloc.allocate();
    REQUIRE_FALSE(none);
    CHECK(none.error().code == ErrorCode::NoAvailablePorts);

    for (auto port : taken)
        alloc.release(port);
    CHECK(alloc.allocatedCount() == 0);
    for (int i = 0; i < kPorts; ++i)
        CHECK(alloc.allocate());
}

TEST_CASE("PortAllocator skips ports the probe reports busy", "[proxy][port][unit]") {
    PortAllocator alloc(9000, 9005, [](std::uint16_t port) { return port != 9000 && port != 9001; });
    auto p = alloc.allocate();
    REQUIRE(p);
    CHECK(p.value() == 9002);
    CHECK_FALSE(alloc.isAllocated(9000));
}

TEST_CASE("PortAllocator clear resets bookkeeping", "[proxy][port][unit]") {
    PortAllocator alloc(9000, 9002, alwaysFree());
    REQUIRE(alloc.allocate());
    REQUIRE(alloc.allocate());
    alloc.clear();
    CHECK(alloc.allocatedCount() == 0);
    auto p = alloc.allocate();
    REQUIRE(p);
    CHECK(p.value() == 9000);
}

TEST_CASE("PortAllocator default probe detects an externally bound port", "[proxy][port][unit]") {
    boost::asio::io_context ctx;
    boost::asio::ip::tcp::acceptor holder(
        ctx, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address_v4("127.0.0.1"), 0));
    const auto held = holder.local_endpoint().port();

    CHECK_FALSE(PortAllocator::isPortBindable(held));

    PortAllocator alloc(held, held);
    auto p = alloc.allocate();
    REQUIRE_FALSE(p);
    CHECK(p.error().code == ErrorCode::NoAvailablePorts);
}
