#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/logging/server_log_writer.h>

using namespace mcpgate;
using model::LogType;

TEST_CASE("ServerLogWriter writes one dated file per type", "[logging][writer][catch2]") {
    test::TempDir root("mcpgate_writer_");
    auto log = logging::ServerLogWriter::forServer(root.path(), "srv");

    log->exec("INFO", "Starting server: fake");
    log->in(R"({"id":1})");
    log->out(R"({"id":1,"result":{}})");
    log->err("warning on stderr");

    const auto now = std::chrono::system_clock::now();
    for (auto type : {LogType::Exec, LogType::In, LogType::Out, LogType::Err}) {
        auto path = log->filePath(type, now);
        CHECK(std::filesystem::exists(path));
        CHECK(path.parent_path() == root.path() / "srv");
        CHECK(path.filename().string().rfind(model::logTypeToString(type), 0) == 0);
    }
    CHECK(log->execLogPath() == log->filePath(LogType::Exec, now));
}

TEST_CASE("ServerLogWriter flattens multi-line messages", "[logging][writer][catch2]") {
    test::TempDir root("mcpgate_writer_");
    auto log = logging::ServerLogWriter::forServer(root.path(), "srv");
    log->err("line one\nline two\r\n");

    std::ifstream in(log->filePath(LogType::Err, std::chrono::system_clock::now()));
    std::string first, second;
    REQUIRE(std::getline(in, first));
    CHECK_FALSE(std::getline(in, second));
    CHECK(first.find("line one line two") != std::string::npos);
}

TEST_CASE("ServerLogWriter recentLogs merges types in time order", "[logging][writer][catch2]") {
    test::TempDir root("mcpgate_writer_");
    auto log = logging::ServerLogWriter::forServer(root.path(), "srv");
    for (int i = 0; i < 5; ++i) {
        log->exec("INFO", "exec " + std::to_string(i));
        log->out("out " + std::to_string(i));
    }
    // Lines that do not parse are skipped
    test::append_file(log->filePath(LogType::Exec, std::chrono::system_clock::now()),
                      "garbage line\n");

    auto all = log->recentLogs(100);
    REQUIRE(all.size() == 10);
    for (std::size_t i = 1; i < all.size(); ++i)
        CHECK(all[i - 1].timestamp <= all[i].timestamp);

    auto newest = log->recentLogs(3);
    REQUIRE(newest.size() == 3);
    CHECK(newest.back().timestamp == all.back().timestamp);

    SECTION("no logs yet") {
        auto other = logging::ServerLogWriter::forServer(root.path(), "quiet");
        CHECK(other->recentLogs(10).empty());
    }
}

TEST_CASE("ServerLogWriter hands out one writer per server directory", "[logging][writer][catch2]") {
    test::TempDir root("mcpgate_writer_");
    auto first = logging::ServerLogWriter::forServer(root.path(), "srv");
    auto second = logging::ServerLogWriter::forServer(root.path() / ".", "srv");
    auto other = logging::ServerLogWriter::forServer(root.path(), "other");
    CHECK(first == second);
    CHECK(first != other);

    // Handles from different owners write through the same lock
    constexpr int kThreads = 4;
    constexpr int kLines = 200;
    const std::string payload(512, 'x');
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            auto writer = logging::ServerLogWriter::forServer(root.path(), "srv");
            for (int i = 0; i < kLines; ++i)
                writer->in(std::to_string(t) + ":" + payload);
        });
    }
    for (auto& th : threads)
        th.join();

    std::ifstream in(first->filePath(LogType::In, std::chrono::system_clock::now()));
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        auto entry = model::parseLogLine(line, LogType::In, "srv");
        REQUIRE(entry);
        CHECK(entry->message.size() == payload.size() + 2);
        ++count;
    }
    CHECK(count == kThreads * kLines);
}

TEST_CASE("ServerLogWriter releases writers nobody holds", "[logging][writer][catch2]") {
    test::TempDir root("mcpgate_writer_");
    std::weak_ptr<logging::ServerLogWriter> weak;
    {
        auto writer = logging::ServerLogWriter::forServer(root.path(), "srv");
        weak = writer;
        writer->exec("INFO", "hello");
    }
    CHECK(weak.expired());
    auto again = logging::ServerLogWriter::forServer(root.path(), "srv");
    CHECK(again->recentLogs(10).size() == 1);
}
