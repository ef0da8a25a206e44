#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <mcpgate/core/types.h>
#include <mcpgate/model/server.h>

namespace mcpgate::config {

struct GatewayConfig {
    std::filesystem::path configPath;
    std::filesystem::path dataDir;
    std::filesystem::path runtimeBinDir;

    std::uint16_t portRangeStart = 9000;
    std::uint16_t portRangeEnd = 9999;

    bool supervisorEnabled = true;
    std::chrono::seconds healthCheckInterval{30};
    int maxRestartAttempts = 3;
    std::chrono::seconds restartDelay{5};

    std::chrono::minutes discoveryCacheTtl{10};

    std::string logLevel = "info";
    std::filesystem::path logFile;

    unsigned int ioThreads = 0; // 0 = IoRuntime default

    // <data_dir>/logs/mcp
    std::filesystem::path mcpLogRoot() const { return dataDir / "logs" / "mcp"; }

    // Resolves every key as env -> config file -> default. A missing config file is not an
    // error; a present but malformed value is (InvalidArgument).
    static Result<GatewayConfig> load(const std::string& overridePath = "");
};

// Reads a JSON array of server descriptors.
Result<std::vector<model::ServerDescriptor>> loadServersFile(const std::filesystem::path& path);

} // namespace mcpgate::config
