#include <mcpgate/config/config_helpers.h>
#include <mcpgate/config/gateway_config.h>
#include <mcpgate/core/format.h>

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mcpgate::config {

namespace {

Result<long> parseInteger(const std::string& section, const std::string& key,
                          const std::string& raw, long min, long max) {
    try {
        size_t used = 0;
        long v = std::stol(raw, &used);
        if (used != raw.size())
            throw std::invalid_argument("trailing characters");
        if (v < min || v > max)
            throw std::out_of_range("range");
        return v;
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgument,
                     format("[{}] {} = '{}' is not an integer in [{}, {}]", section, key, raw,
                            min, max)};
    }
}

} // namespace

Result<GatewayConfig> GatewayConfig::load(const std::string& overridePath) {
    GatewayConfig cfg;
    cfg.configPath = get_config_path(overridePath);

    std::error_code ec;
    const bool haveFile = std::filesystem::exists(cfg.configPath, ec);
    if (!overridePath.empty() && !haveFile) {
        return Error{ErrorCode::InvalidArgument,
                     format("config file not found: {}", cfg.configPath.string())};
    }
    const std::filesystem::path source = haveFile ? cfg.configPath : std::filesystem::path{};
    if (haveFile)
        spdlog::debug("Loading configuration from {}", cfg.configPath.string());

    auto value = [&](const char* section, const char* key) -> std::string {
        return source.empty() ? std::string{} : parse_config_value(source, section, key);
    };

    cfg.dataDir = resolve_data_dir_from_config(source);
    cfg.runtimeBinDir = resolve_runtime_bin_dir_from_config(source, cfg.dataDir);

    if (auto v = value("proxy", "port_range_start"); !v.empty()) {
        auto n = parseInteger("proxy", "port_range_start", v, 1, 65535);
        if (!n)
            return n.error();
        cfg.portRangeStart = static_cast<std::uint16_t>(n.value());
    }
    if (auto v = value("proxy", "port_range_end"); !v.empty()) {
        auto n = parseInteger("proxy", "port_range_end", v, 1, 65535);
        if (!n)
            return n.error();
        cfg.portRangeEnd = static_cast<std::uint16_t>(n.value());
    }
    if (cfg.portRangeStart > cfg.portRangeEnd) {
        return Error{ErrorCode::InvalidArgument,
                     format("port range {}-{} is empty", cfg.portRangeStart, cfg.portRangeEnd)};
    }

    if (auto v = value("supervisor", "enabled"); !v.empty()) {
        auto b = parse_bool(v);
        if (!b)
            return Error{ErrorCode::InvalidArgument,
                         format("[supervisor] enabled = '{}' is not a boolean", v)};
        cfg.supervisorEnabled = *b;
    }
    if (auto v = value("supervisor", "health_check_interval_seconds"); !v.empty()) {
        auto n = parseInteger("supervisor", "health_check_interval_seconds", v, 1, 86400);
        if (!n)
            return n.error();
        cfg.healthCheckInterval = std::chrono::seconds(n.value());
    }
    if (auto v = value("supervisor", "max_restart_attempts"); !v.empty()) {
        auto n = parseInteger("supervisor", "max_restart_attempts", v, 0, 1000);
        if (!n)
            return n.error();
        cfg.maxRestartAttempts = static_cast<int>(n.value());
    }
    if (auto v = value("supervisor", "restart_delay_seconds"); !v.empty()) {
        auto n = parseInteger("supervisor", "restart_delay_seconds", v, 0, 86400);
        if (!n)
            return n.error();
        cfg.restartDelay = std::chrono::seconds(n.value());
    }

    if (auto v = value("discovery", "cache_ttl_minutes"); !v.empty()) {
        auto n = parseInteger("discovery", "cache_ttl_minutes", v, 0, 7 * 24 * 60);
        if (!n)
            return n.error();
        cfg.discoveryCacheTtl = std::chrono::minutes(n.value());
    }

    if (auto v = value("logging", "level"); !v.empty())
        cfg.logLevel = v;
    if (auto v = value("logging", "file"); !v.empty())
        cfg.logFile = expand_tilde(v);

    if (auto v = value("runtime", "io_threads"); !v.empty()) {
        auto n = parseInteger("runtime", "io_threads", v, 0, 256);
        if (!n)
            return n.error();
        cfg.ioThreads = static_cast<unsigned int>(n.value());
    }

    return cfg;
}

Result<std::vector<model::ServerDescriptor>> loadServersFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IoError, format("cannot open servers file: {}", path.string())};
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument,
                     format("servers file {} is not valid JSON: {}", path.string(), e.what())};
    }
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidArgument,
                     format("servers file {} must contain a JSON array", path.string())};
    }

    std::vector<model::ServerDescriptor> servers;
    servers.reserve(doc.size());
    for (const auto& entry : doc) {
        auto s = model::descriptorFromJson(entry);
        if (!s)
            return s.error();
        servers.push_back(std::move(s).value());
    }
    return servers;
}

} // namespace mcpgate::config
