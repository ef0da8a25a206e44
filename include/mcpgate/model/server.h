#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::model {

enum class TransportKind { Stdio, Http, Sse };

const char* transportKindToString(TransportKind kind);
Result<TransportKind> parseTransportKind(std::string_view raw);

enum class RuntimeStatus { Stopped, Running };

const char* runtimeStatusToString(RuntimeStatus status);

struct RuntimeInfo {
    std::optional<int> pid;
    std::optional<std::uint16_t> port;
    RuntimeStatus status = RuntimeStatus::Stopped;
    bool isActive = false;
};

struct ServerDescriptor {
    ServerId id;
    std::string name;
    TransportKind transport = TransportKind::Stdio;

    // Stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    // Http / Sse
    std::string url;
    std::map<std::string, std::string> headers;

    std::chrono::seconds timeout{30};
    // 0 means "use the supervisor default"
    int maxRestartAttempts = 0;
    bool enabled = true;
    bool isSystem = false;

    std::optional<TimePoint> toolsDiscoveredAt;
    int toolsCount = 0;
    int restartCount = 0;
    RuntimeInfo runtime;
};

// Servers file format: {id, name, transport, command, args, env, url, headers,
// timeout_seconds, max_restart_attempts, enabled, is_system}
Result<ServerDescriptor> descriptorFromJson(const nlohmann::json& j);
nlohmann::json descriptorToJson(const ServerDescriptor& server);

struct ServerStartResult {
    struct Started {
        std::optional<int> pid;
        std::optional<std::uint16_t> port;
    };
    struct AlreadyRunning {
        std::optional<int> pid;
        std::optional<std::uint16_t> port;
    };
    struct Failed {
        Error error;
        std::string logPath;
    };

    std::variant<Started, AlreadyRunning, Failed> outcome;

    bool started() const { return std::holds_alternative<Started>(outcome); }
    bool alreadyRunning() const { return std::holds_alternative<AlreadyRunning>(outcome); }
    bool failed() const { return std::holds_alternative<Failed>(outcome); }
    // Started or AlreadyRunning
    bool running() const { return !failed(); }
};

} // namespace mcpgate::model
