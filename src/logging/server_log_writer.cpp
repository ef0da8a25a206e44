#include <mcpgate/logging/server_log_writer.h>

#include <algorithm>
#include <fstream>
#include <map>

#include <spdlog/spdlog.h>

namespace mcpgate::logging {

using model::LogType;

std::shared_ptr<ServerLogWriter> ServerLogWriter::forServer(const std::filesystem::path& logRoot,
                                                            const ServerId& serverId) {
    static std::mutex registryMutex;
    static std::map<std::filesystem::path, std::weak_ptr<ServerLogWriter>> registry;

    auto dir = (logRoot / serverId).lexically_normal();
    std::lock_guard<std::mutex> lk(registryMutex);
    for (auto it = registry.begin(); it != registry.end();) {
        if (it->second.expired())
            it = registry.erase(it);
        else
            ++it;
    }
    auto& slot = registry[dir];
    auto writer = slot.lock();
    if (!writer) {
        writer.reset(new ServerLogWriter(dir, serverId));
        slot = writer;
    }
    return writer;
}

ServerLogWriter::ServerLogWriter(std::filesystem::path dir, ServerId serverId)
    : dir_(std::move(dir)), serverId_(std::move(serverId)) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec)
        spdlog::warn("[ServerLogWriter] cannot create {}: {}", dir_.string(), ec.message());
}

std::filesystem::path ServerLogWriter::filePath(LogType type, TimePoint at) const {
    return dir_ / (std::string(model::logTypeToString(type)) + "-" + model::formatLogDate(at) +
                   ".log");
}

std::filesystem::path ServerLogWriter::execLogPath() const {
    return filePath(LogType::Exec, std::chrono::system_clock::now());
}

void ServerLogWriter::exec(std::string_view level, std::string_view message) {
    write(LogType::Exec, level, message);
}

void ServerLogWriter::in(std::string_view data) {
    write(LogType::In, "DATA", data);
}

void ServerLogWriter::out(std::string_view data) {
    write(LogType::Out, "DATA", data);
}

void ServerLogWriter::err(std::string_view data) {
    write(LogType::Err, "ERROR", data);
}

void ServerLogWriter::write(LogType type, std::string_view level, std::string_view message) {
    const auto now = std::chrono::system_clock::now();
    // Embedded newlines would split one record into several lines on the reader side
    std::string flat(message);
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    std::replace(flat.begin(), flat.end(), '\r', ' ');
    std::string line = model::formatLogLine(now, level, flat);
    line += '\n';

    std::lock_guard<std::mutex> lk(mutex_);
    std::ofstream outFile(filePath(type, now), std::ios::app | std::ios::binary);
    if (!outFile) {
        spdlog::debug("[ServerLogWriter] cannot open {} log for {}", model::logTypeToString(type),
                      serverId_);
        return;
    }
    outFile.write(line.data(), static_cast<std::streamsize>(line.size()));
    outFile.flush();
}

std::vector<model::LogEntry> ServerLogWriter::recentLogs(std::size_t limit) const {
    std::vector<model::LogEntry> entries;
    const auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto type : {LogType::Exec, LogType::In, LogType::Out, LogType::Err}) {
        std::ifstream in(filePath(type, now));
        if (!in)
            continue;
        std::string line;
        while (std::getline(in, line)) {
            if (auto e = model::parseLogLine(line, type, serverId_))
                entries.push_back(std::move(*e));
        }
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });
    if (entries.size() > limit)
        entries.erase(entries.begin(), entries.end() - static_cast<std::ptrdiff_t>(limit));
    return entries;
}

} // namespace mcpgate::logging
