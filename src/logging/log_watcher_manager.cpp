#include <mcpgate/core/format.h>
#include <mcpgate/logging/log_watcher_manager.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <limits.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace mcpgate::logging {

namespace fs = std::filesystem;

struct LogWatcherManager::OffsetTable {
    std::mutex mutex;
    std::unordered_map<std::string, std::uint64_t> offsets;
};

struct LogWatcherManager::Watcher {
    Watcher(boost::asio::any_io_executor executor, ServerId id, fs::path directory,
            std::size_t capacity, std::shared_ptr<OffsetTable> table)
        : serverId(std::move(id)), dir(std::move(directory)),
          channel(std::make_shared<Channel>(capacity)), offsets(std::move(table)),
          strand(boost::asio::make_strand(executor)), descriptor(strand) {}

    ServerId serverId;
    fs::path dir;
    std::shared_ptr<Channel> channel;
    std::shared_ptr<OffsetTable> offsets;
    boost::asio::strand<boost::asio::any_io_executor> strand;
    boost::asio::posix::stream_descriptor descriptor;
    std::size_t subscribers = 0;
    std::atomic<bool> stopped{false};
};

namespace {

constexpr std::uint32_t kWatchMask = IN_MODIFY | IN_CLOSE_WRITE | IN_CREATE;

std::size_t tailFile(LogWatcherManager::Watcher& w, const fs::path& file) {
    auto cls = model::classifyLogFile(file.filename().string());
    if (!cls)
        return 0;

    std::lock_guard<std::mutex> lk(w.offsets->mutex);
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec) {
        spdlog::debug("[LogWatcher] {}: cannot stat {}: {}", w.serverId, file.string(),
                      ec.message());
        return 0;
    }

    auto& offset = w.offsets->offsets[cls->key];
    if (size <= offset) {
        // Unchanged, or shrunk below what was already delivered
        return 0;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        spdlog::debug("[LogWatcher] {}: cannot open {}", w.serverId, file.string());
        return 0;
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::string data(static_cast<std::size_t>(size - offset), '\0');
    in.read(data.data(), static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<std::size_t>(in.gcount()));

    // Only complete lines advance the offset
    const auto lastNewline = data.rfind('\n');
    if (lastNewline == std::string::npos)
        return 0;

    std::size_t published = 0;
    std::size_t start = 0;
    while (start <= lastNewline) {
        auto end = data.find('\n', start);
        std::string_view line(data.data() + start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (auto entry = model::parseLogLine(line, cls->type, w.serverId)) {
            w.channel->send(std::move(*entry));
            ++published;
        }
        start = end + 1;
    }
    offset += lastNewline + 1;
    return published;
}

// Files already on disk when a watcher starts are delivered from their current end.
void primeOffsets(LogWatcherManager::Watcher& w) {
    std::lock_guard<std::mutex> lk(w.offsets->mutex);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(w.dir, ec)) {
        if (!entry.is_regular_file(ec))
            continue;
        auto cls = model::classifyLogFile(entry.path().filename().string());
        if (!cls || w.offsets->offsets.count(cls->key))
            continue;
        auto size = fs::file_size(entry.path(), ec);
        if (!ec)
            w.offsets->offsets[cls->key] = size;
    }
}

void rescanDirectory(LogWatcherManager::Watcher& w) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(w.dir, ec)) {
        if (entry.is_regular_file(ec))
            tailFile(w, entry.path());
    }
}

boost::asio::awaitable<void> watchLoop(std::shared_ptr<LogWatcherManager::Watcher> w) {
    alignas(inotify_event) std::array<char, 16 * (sizeof(inotify_event) + NAME_MAX + 1)> buf{};
    for (;;) {
        boost::system::error_code ec;
        std::size_t n = co_await w->descriptor.async_read_some(
            boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || w->stopped.load()) {
            if (ec && ec != boost::asio::error::operation_aborted && !w->stopped.load())
                spdlog::warn("[LogWatcher] {}: inotify read failed: {}", w->serverId, ec.message());
            break;
        }

        std::size_t pos = 0;
        while (pos + sizeof(inotify_event) <= n) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + pos);
            pos += sizeof(inotify_event) + ev->len;

            if (ev->mask & IN_Q_OVERFLOW) {
                rescanDirectory(*w);
                continue;
            }
            if (ev->len == 0 || !(ev->mask & kWatchMask))
                continue;
            try {
                tailFile(*w, w->dir / std::string(ev->name));
            } catch (const std::exception& e) {
                spdlog::warn("[LogWatcher] {}: failed to process {}: {}", w->serverId,
                             std::string(ev->name), e.what());
            }
        }
    }
    spdlog::debug("[LogWatcher] {}: watch loop exited", w->serverId);
}

} // namespace

LogWatcherManager::LogWatcherManager(boost::asio::any_io_executor executor, Options options)
    : executor_(std::move(executor)), options_(std::move(options)) {}

LogWatcherManager::~LogWatcherManager() {
    shutdown();
}

std::shared_ptr<LogWatcherManager::OffsetTable>
LogWatcherManager::offsetsFor(const ServerId& serverId) {
    auto& table = offsets_[serverId];
    if (!table)
        table = std::make_shared<OffsetTable>();
    return table;
}

Result<std::shared_ptr<LogWatcherManager::Watcher>>
LogWatcherManager::startWatcher(const ServerId& serverId) {
    const auto dir = serverLogDir(serverId);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     format("cannot create log directory {}: {}", dir.string(), ec.message())};
    }

    auto watcher = std::make_shared<Watcher>(executor_, serverId, dir, options_.channelCapacity,
                                             offsetsFor(serverId));
    primeOffsets(*watcher);

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::IoError, format("inotify_init1 failed: {}", std::strerror(errno))};
    }
    if (inotify_add_watch(fd, dir.c_str(), kWatchMask) < 0) {
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError,
                     format("inotify_add_watch({}) failed: {}", dir.string(), std::strerror(err))};
    }
    watcher->descriptor.assign(fd);

    boost::asio::co_spawn(watcher->strand, watchLoop(watcher), boost::asio::detached);
    spdlog::debug("[LogWatcher] watching {}", dir.string());
    return watcher;
}

void LogWatcherManager::stopWatcher(const std::shared_ptr<Watcher>& watcher) {
    if (watcher->stopped.exchange(true))
        return;
    watcher->channel->close();
    boost::asio::post(watcher->strand, [watcher]() {
        boost::system::error_code ec;
        watcher->descriptor.close(ec);
    });
}

Result<LogWatcherManager::Subscription> LogWatcherManager::subscribe(const ServerId& serverId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = watchers_.find(serverId);
    if (it == watchers_.end()) {
        auto started = startWatcher(serverId);
        if (!started)
            return started.error();
        it = watchers_.emplace(serverId, std::move(started).value()).first;
        spdlog::info("[LogWatcher] started watcher for server {}", serverId);
    }
    ++it->second->subscribers;
    return it->second->channel->subscribe();
}

void LogWatcherManager::unsubscribe(const ServerId& serverId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = watchers_.find(serverId);
    if (it == watchers_.end())
        return;
    auto& watcher = it->second;
    if (watcher->subscribers > 0)
        --watcher->subscribers;
    if (watcher->subscribers == 0) {
        stopWatcher(watcher);
        watchers_.erase(it);
        spdlog::info("[LogWatcher] stopped watcher for server {} (no subscribers)", serverId);
    }
}

std::size_t LogWatcherManager::subscriberCount(const ServerId& serverId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = watchers_.find(serverId);
    return it == watchers_.end() ? 0 : it->second->subscribers;
}

bool LogWatcherManager::isWatching(const ServerId& serverId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return watchers_.count(serverId) > 0;
}

void LogWatcherManager::shutdown() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto& [id, watcher] : watchers_)
        stopWatcher(watcher);
    watchers_.clear();
}

std::size_t LogWatcherManager::processFileChange(const ServerId& serverId, const fs::path& file) {
    std::shared_ptr<Watcher> watcher;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = watchers_.find(serverId);
        if (it == watchers_.end())
            return 0;
        watcher = it->second;
    }
    return tailFile(*watcher, file);
}

std::optional<std::uint64_t> LogWatcherManager::offset(const ServerId& serverId,
                                                       const std::string& key) const {
    std::shared_ptr<OffsetTable> table;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = offsets_.find(serverId);
        if (it == offsets_.end())
            return std::nullopt;
        table = it->second;
    }
    std::lock_guard<std::mutex> lk(table->mutex);
    auto it = table->offsets.find(key);
    if (it == table->offsets.end())
        return std::nullopt;
    return it->second;
}

} // namespace mcpgate::logging
