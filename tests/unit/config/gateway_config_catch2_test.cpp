#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <mcpgate/config/config_helpers.h>
#include <mcpgate/config/gateway_config.h>

using namespace mcpgate;
using mcpgate::test::ScopedEnvVar;
using mcpgate::test::TempDir;
using mcpgate::test::write_file;

TEST_CASE("parse_config_value reads sections, dotted keys and quotes", "[config][toml]") {
    TempDir dir("mcpgate_cfg_");
    auto path = write_file(dir.path() / "config.toml", R"(# top comment
[core]
data_dir = "~/gate data"   # quoted keeps spaces
runtime_bin_dir = '/opt/rt'

[proxy]
port_range_start = 9100 # trailing comment
supervisor.enabled = no
)");

    CHECK(config::parse_config_value(path, "core", "runtime_bin_dir") == "/opt/rt");
    CHECK(config::parse_config_value(path, "core", "data_dir") == "~/gate data");
    CHECK(config::parse_config_value(path, "proxy", "port_range_start") == "9100");
    CHECK(config::parse_config_value(path, "supervisor", "enabled") == "no");
    CHECK(config::parse_config_value(path, "proxy", "missing").empty());
    CHECK(config::parse_config_value(dir.path() / "absent.toml", "core", "data_dir").empty());
}

TEST_CASE("parse_bool accepts the usual spellings", "[config][toml]") {
    CHECK(config::parse_bool("TRUE") == true);
    CHECK(config::parse_bool(" yes ") == true);
    CHECK(config::parse_bool("on") == true);
    CHECK(config::parse_bool("0") == false);
    CHECK(config::parse_bool("Off") == false);
    CHECK_FALSE(config::parse_bool("maybe").has_value());
}

TEST_CASE("expand_tilde and unquote", "[config][toml]") {
    ScopedEnvVar home("HOME", std::string("/home/tester"));
    CHECK(config::expand_tilde("~") == std::filesystem::path("/home/tester"));
    CHECK(config::expand_tilde("~/x/y") == std::filesystem::path("/home/tester/x/y"));
    CHECK(config::expand_tilde("/abs") == std::filesystem::path("/abs"));
    CHECK(config::unquote("  'single'  ") == "single");
    CHECK(config::unquote("\"double\"") == "double");
    CHECK(config::unquote("bare") == "bare");
}

TEST_CASE("GatewayConfig uses defaults without a config file", "[config][gateway]") {
    TempDir dir("mcpgate_cfg_");
    ScopedEnvVar cfg("MCPGATE_CONFIG", std::nullopt);
    ScopedEnvVar xdgConfig("XDG_CONFIG_HOME", (dir.path() / "xdg-config").string());
    ScopedEnvVar xdgData("XDG_DATA_HOME", (dir.path() / "xdg-data").string());
    ScopedEnvVar dataEnv("MCPGATE_DATA_DIR", std::nullopt);
    ScopedEnvVar binEnv("MCPGATE_RUNTIME_BIN_DIR", std::nullopt);

    auto loaded = config::GatewayConfig::load();
    REQUIRE(loaded);
    const auto& c = loaded.value();
    CHECK(c.configPath == dir.path() / "xdg-config" / "mcpgate" / "config.toml");
    CHECK(c.dataDir == dir.path() / "xdg-data" / "mcpgate");
    CHECK(c.runtimeBinDir == c.dataDir / "bin");
    CHECK(c.mcpLogRoot() == c.dataDir / "logs" / "mcp");
    CHECK(c.portRangeStart == 9000);
    CHECK(c.portRangeEnd == 9999);
    CHECK(c.supervisorEnabled);
    CHECK(c.healthCheckInterval == std::chrono::seconds(30));
    CHECK(c.maxRestartAttempts == 3);
    CHECK(c.restartDelay == std::chrono::seconds(5));
    CHECK(c.discoveryCacheTtl == std::chrono::minutes(10));
    CHECK(c.logLevel == "info");
    CHECK(c.logFile.empty());
}

TEST_CASE("GatewayConfig reads every section of the config file", "[config][gateway]") {
    TempDir dir("mcpgate_cfg_");
    ScopedEnvVar dataEnv("MCPGATE_DATA_DIR", std::nullopt);
    ScopedEnvVar binEnv("MCPGATE_RUNTIME_BIN_DIR", std::nullopt);
    auto path = write_file(dir.path() / "gate.toml", "[core]\n"
                                                     "data_dir = \"" +
                                                         (dir.path() / "data").string() +
                                                         "\"\n"
                                                         "[proxy]\n"
                                                         "port_range_start = 9100\n"
                                                         "port_range_end = 9199\n"
                                                         "[supervisor]\n"
                                                         "enabled = false\n"
                                                         "health_check_interval_seconds = 10\n"
                                                         "max_restart_attempts = 7\n"
                                                         "restart_delay_seconds = 2\n"
                                                         "[discovery]\n"
                                                         "cache_ttl_minutes = 3\n"
                                                         "[logging]\n"
                                                         "level = debug\n"
                                                         "[runtime]\n"
                                                         "io_threads = 6\n");

    auto loaded = config::GatewayConfig::load(path.string());
    REQUIRE(loaded);
    const auto& c = loaded.value();
    CHECK(c.configPath == path);
    CHECK(c.dataDir == dir.path() / "data");
    CHECK(c.runtimeBinDir == dir.path() / "data" / "bin");
    CHECK(c.portRangeStart == 9100);
    CHECK(c.portRangeEnd == 9199);
    CHECK_FALSE(c.supervisorEnabled);
    CHECK(c.healthCheckInterval == std::chrono::seconds(10));
    CHECK(c.maxRestartAttempts == 7);
    CHECK(c.restartDelay == std::chrono::seconds(2));
    CHECK(c.discoveryCacheTtl == std::chrono::minutes(3));
    CHECK(c.logLevel == "debug");
    CHECK(c.ioThreads == 6);

    SECTION("environment wins over the file") {
        ScopedEnvVar data("MCPGATE_DATA_DIR", (dir.path() / "env-data").string());
        ScopedEnvVar bins("MCPGATE_RUNTIME_BIN_DIR", "/opt/bundled");
        auto withEnv = config::GatewayConfig::load(path.string());
        REQUIRE(withEnv);
        CHECK(withEnv.value().dataDir == dir.path() / "env-data");
        CHECK(withEnv.value().runtimeBinDir == std::filesystem::path("/opt/bundled"));
    }

    SECTION("MCPGATE_CONFIG selects the file") {
        ScopedEnvVar cfg("MCPGATE_CONFIG", path.string());
        auto viaEnv = config::GatewayConfig::load();
        REQUIRE(viaEnv);
        CHECK(viaEnv.value().portRangeStart == 9100);
    }
}

TEST_CASE("GatewayConfig rejects malformed values", "[config][gateway]") {
    TempDir dir("mcpgate_cfg_");

    SECTION("missing explicit file") {
        auto r = config::GatewayConfig::load((dir.path() / "nope.toml").string());
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("non-numeric port") {
        auto p = write_file(dir.path() / "a.toml", "[proxy]\nport_range_start = abc\n");
        auto r = config::GatewayConfig::load(p.string());
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("port_range_start") != std::string::npos);
    }

    SECTION("empty port range") {
        auto p = write_file(dir.path() / "b.toml",
                            "[proxy]\nport_range_start = 9500\nport_range_end = 9400\n");
        REQUIRE_FALSE(config::GatewayConfig::load(p.string()));
    }

    SECTION("non-boolean flag") {
        auto p = write_file(dir.path() / "c.toml", "[supervisor]\nenabled = sometimes\n");
        REQUIRE_FALSE(config::GatewayConfig::load(p.string()));
    }
}

TEST_CASE("loadServersFile reads descriptors", "[config][servers]") {
    TempDir dir("mcpgate_cfg_");
    auto path = write_file(dir.path() / "servers.json", R"([
  {"id": "fs", "name": "Filesystem", "transport": "stdio", "command": "npx",
   "args": ["-y", "@mcp/fs"], "env": {"ROOT": "/tmp"}, "is_system": true,
   "max_restart_attempts": 5},
  {"id": "remote", "name": "Remote", "transport": "http", "url": "http://127.0.0.1:8080",
   "headers": {"Authorization": "Bearer x"}, "timeout_seconds": 12, "enabled": false}
])");

    auto loaded = config::loadServersFile(path);
    REQUIRE(loaded);
    REQUIRE(loaded.value().size() == 2);

    const auto& fs = loaded.value()[0];
    CHECK(fs.id == "fs");
    CHECK(fs.transport == model::TransportKind::Stdio);
    CHECK(fs.args == std::vector<std::string>{"-y", "@mcp/fs"});
    CHECK(fs.env.at("ROOT") == "/tmp");
    CHECK(fs.isSystem);
    CHECK(fs.maxRestartAttempts == 5);
    CHECK(fs.enabled);

    const auto& remote = loaded.value()[1];
    CHECK(remote.transport == model::TransportKind::Http);
    CHECK(remote.headers.at("Authorization") == "Bearer x");
    CHECK(remote.timeout == std::chrono::seconds(12));
    CHECK_FALSE(remote.enabled);

    SECTION("rejects bad documents") {
        CHECK_FALSE(config::loadServersFile(dir.path() / "missing.json"));
        CHECK_FALSE(config::loadServersFile(write_file(dir.path() / "obj.json", "{}")));
        CHECK_FALSE(config::loadServersFile(write_file(dir.path() / "bad.json", "[{")));
        auto unknown = config::loadServersFile(
            write_file(dir.path() / "ws.json", R"([{"id":"x","transport":"websocket"}])"));
        REQUIRE_FALSE(unknown);
        CHECK(unknown.error().code == ErrorCode::UnsupportedTransport);
    }
}
