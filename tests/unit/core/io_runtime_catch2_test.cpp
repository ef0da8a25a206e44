#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <set>
#include <string>
#include <thread>

#include <boost/asio/post.hpp>

#include <mcpgate/core/io_runtime.h>
#include <mcpgate/core/uuid.h>

using namespace mcpgate;

namespace {

bool is_ascii_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

TEST_CASE("IoRuntime runs posted work and stops idempotently", "[core][runtime]") {
    core::IoRuntime runtime(2);
    CHECK(runtime.running());
    CHECK(runtime.threadCount() == 2);

    std::promise<std::thread::id> ran;
    boost::asio::post(runtime.executor(), [&] { ran.set_value(std::this_thread::get_id()); });
    CHECK(ran.get_future().get() != std::this_thread::get_id());

    runtime.stop();
    CHECK_FALSE(runtime.running());
    runtime.stop();
}

TEST_CASE("IoRuntime picks a default thread count", "[core][runtime]") {
    CHECK(core::IoRuntime::defaultThreadCount() >= 1);
    core::IoRuntime runtime;
    CHECK(runtime.threadCount() == core::IoRuntime::defaultThreadCount());
}

TEST_CASE("generateId - prefixed format", "[core][uuid]") {
    auto id = core::generateId("sse");
    REQUIRE(id.rfind("sse-", 0) == 0);

    auto first_dash = id.find('-');
    auto second_dash = id.find('-', first_dash + 1);
    REQUIRE(second_dash != std::string::npos);

    auto timestamp = id.substr(first_dash + 1, second_dash - (first_dash + 1));
    CHECK_FALSE(timestamp.empty());
    for (char c : timestamp)
        CHECK((c >= '0' && c <= '9'));

    auto rand_hex = id.substr(second_dash + 1);
    CHECK(rand_hex.size() == 6);
    for (char c : rand_hex)
        CHECK(is_ascii_lower_hex(c));

    CHECK(core::generateId().rfind("gw-", 0) == 0);

    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i)
        seen.insert(core::generateId("x"));
    CHECK(seen.size() > 1);
}
