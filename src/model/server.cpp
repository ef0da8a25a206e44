#include <mcpgate/core/format.h>
#include <mcpgate/model/server.h>

namespace mcpgate::model {

using nlohmann::json;

const char* transportKindToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::Sse: return "sse";
    }
    return "stdio";
}

Result<TransportKind> parseTransportKind(std::string_view raw) {
    if (raw == "stdio")
        return TransportKind::Stdio;
    if (raw == "http")
        return TransportKind::Http;
    if (raw == "sse")
        return TransportKind::Sse;
    return Error{ErrorCode::UnsupportedTransport,
                 format("Unsupported transport type: {}", std::string(raw))};
}

const char* runtimeStatusToString(RuntimeStatus status) {
    return status == RuntimeStatus::Running ? "running" : "stopped";
}

namespace {

template <typename Map> Map stringMap(const json& j, const char* key) {
    Map out;
    if (j.contains(key) && j[key].is_object()) {
        for (auto it = j[key].begin(); it != j[key].end(); ++it) {
            if (it.value().is_string())
                out[it.key()] = it.value().get<std::string>();
            else
                out[it.key()] = it.value().dump();
        }
    }
    return out;
}

} // namespace

Result<ServerDescriptor> descriptorFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "server entry must be an object"};
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty())
        return Error{ErrorCode::InvalidArgument, "server entry is missing a string 'id'"};

    ServerDescriptor s;
    try {
        s.id = j["id"].get<std::string>();
        s.name = j.value("name", s.id);

        auto kind = parseTransportKind(j.value("transport", std::string("stdio")));
        if (!kind)
            return kind.error();
        s.transport = kind.value();

        s.command = j.value("command", std::string{});
        if (j.contains("args") && j["args"].is_array()) {
            for (const auto& a : j["args"])
                s.args.push_back(a.is_string() ? a.get<std::string>() : a.dump());
        }
        s.env = stringMap<std::map<std::string, std::string>>(j, "env");
        s.url = j.value("url", std::string{});
        s.headers = stringMap<std::map<std::string, std::string>>(j, "headers");
        s.timeout = std::chrono::seconds(j.value("timeout_seconds", 30));
        s.maxRestartAttempts = j.value("max_restart_attempts", 0);
        s.enabled = j.value("enabled", true);
        s.isSystem = j.value("is_system", false);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     format("invalid server entry '{}': {}", s.id, e.what())};
    }

    if (s.transport == TransportKind::Stdio && s.command.empty())
        return Error{ErrorCode::InvalidArgument,
                     format("stdio server '{}' has no command", s.id)};
    if (s.transport != TransportKind::Stdio && s.url.empty())
        return Error{ErrorCode::InvalidArgument, format("server '{}' has no url", s.id)};
    return s;
}

json descriptorToJson(const ServerDescriptor& s) {
    json j = {{"id", s.id},
              {"name", s.name},
              {"transport", transportKindToString(s.transport)},
              {"timeout_seconds", s.timeout.count()},
              {"max_restart_attempts", s.maxRestartAttempts},
              {"enabled", s.enabled},
              {"is_system", s.isSystem}};
    if (s.transport == TransportKind::Stdio) {
        j["command"] = s.command;
        j["args"] = s.args;
        j["env"] = s.env;
    } else {
        j["url"] = s.url;
        j["headers"] = s.headers;
    }
    return j;
}

} // namespace mcpgate::model
