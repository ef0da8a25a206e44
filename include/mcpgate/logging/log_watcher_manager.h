#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <mcpgate/core/broadcast_channel.h>
#include <mcpgate/core/types.h>
#include <mcpgate/model/log_entry.h>

namespace mcpgate::logging {

/**
 * Tails per-server MCP log files and fans new entries out to subscribers.
 *
 * One inotify watch and one broadcast channel exist per server while it has subscribers;
 * the last unsubscribe tears both down. Byte offsets are tracked per server and per
 * "<type>-<date>" key for the lifetime of the manager and never move backwards, so a
 * re-subscribe continues where the previous watcher stopped. Files seen for the first time
 * when a watcher starts are read from their current end.
 */
class LogWatcherManager {
public:
    using Channel = core::BroadcastChannel<model::LogEntry>;
    using Subscription = Channel::Receiver;

    struct Options {
        std::filesystem::path logRoot; // <data_dir>/logs/mcp
        std::size_t channelCapacity = 1000;
    };

    LogWatcherManager(boost::asio::any_io_executor executor, Options options);
    ~LogWatcherManager();

    LogWatcherManager(const LogWatcherManager&) = delete;
    LogWatcherManager& operator=(const LogWatcherManager&) = delete;

    Result<Subscription> subscribe(const ServerId& serverId);
    void unsubscribe(const ServerId& serverId);

    std::size_t subscriberCount(const ServerId& serverId) const;
    bool isWatching(const ServerId& serverId) const;

    // Drops every watcher; open subscriptions observe Closed.
    void shutdown();

    // Publishes complete lines appended to `file` since its stored offset. Called from the
    // inotify loop; returns the number of entries published.
    std::size_t processFileChange(const ServerId& serverId, const std::filesystem::path& file);

    std::optional<std::uint64_t> offset(const ServerId& serverId, const std::string& key) const;

    std::filesystem::path serverLogDir(const ServerId& serverId) const {
        return options_.logRoot / serverId;
    }

    struct OffsetTable;
    struct Watcher;

private:
    std::shared_ptr<OffsetTable> offsetsFor(const ServerId& serverId);
    Result<std::shared_ptr<Watcher>> startWatcher(const ServerId& serverId);
    static void stopWatcher(const std::shared_ptr<Watcher>& watcher);

    boost::asio::any_io_executor executor_;
    Options options_;
    mutable std::mutex mutex_;
    std::unordered_map<ServerId, std::shared_ptr<Watcher>> watchers_;
    std::unordered_map<ServerId, std::shared_ptr<OffsetTable>> offsets_;
};

} // namespace mcpgate::logging
