#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <mcpgate/core/types.h>
#include <mcpgate/model/log_entry.h>

namespace mcpgate::logging {

// Appends per-server MCP traffic and lifecycle lines to
// <root>/<server_id>/<type>-YYYY-MM-DD.log (UTC date).
//
// There is one live writer per log directory: forServer() hands every caller the same
// instance, so lines from the transport, the session and the manager never interleave.
class ServerLogWriter {
public:
    static std::shared_ptr<ServerLogWriter> forServer(const std::filesystem::path& logRoot,
                                                      const ServerId& serverId);

    ServerLogWriter(const ServerLogWriter&) = delete;
    ServerLogWriter& operator=(const ServerLogWriter&) = delete;

    const ServerId& serverId() const { return serverId_; }
    const std::filesystem::path& directory() const { return dir_; }

    std::filesystem::path filePath(model::LogType type, TimePoint at) const;
    std::filesystem::path execLogPath() const;

    void exec(std::string_view level, std::string_view message);
    void in(std::string_view data);
    void out(std::string_view data);
    void err(std::string_view data);

    void write(model::LogType type, std::string_view level, std::string_view message);

    // Today's entries of all four files, oldest first, limited to the newest `limit`.
    std::vector<model::LogEntry> recentLogs(std::size_t limit) const;

private:
    ServerLogWriter(std::filesystem::path dir, ServerId serverId);

    std::filesystem::path dir_;
    ServerId serverId_;
    mutable std::mutex mutex_;
};

} // namespace mcpgate::logging
