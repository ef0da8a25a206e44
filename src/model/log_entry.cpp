#include <mcpgate/core/format.h>
#include <mcpgate/model/log_entry.h>

#include <charconv>
#include <ctime>

namespace mcpgate::model {

const char* logTypeToString(LogType type) {
    switch (type) {
        case LogType::Exec: return "exec";
        case LogType::In: return "in";
        case LogType::Out: return "out";
        case LogType::Err: return "err";
    }
    return "exec";
}

std::optional<LogType> parseLogType(std::string_view raw) {
    if (raw == "exec")
        return LogType::Exec;
    if (raw == "in")
        return LogType::In;
    if (raw == "out")
        return LogType::Out;
    if (raw == "err")
        return LogType::Err;
    return std::nullopt;
}

std::optional<LogFileKey> classifyLogFile(std::string_view fileName) {
    constexpr std::string_view kExt = ".log";
    if (fileName.size() <= kExt.size() || fileName.substr(fileName.size() - kExt.size()) != kExt)
        return std::nullopt;
    auto stem = fileName.substr(0, fileName.size() - kExt.size());
    auto dash = stem.find('-');
    if (dash == std::string_view::npos)
        return std::nullopt;
    auto type = parseLogType(stem.substr(0, dash));
    if (!type)
        return std::nullopt;
    // Date part must look like YYYY-MM-DD
    auto date = stem.substr(dash + 1);
    if (date.size() != 10 || date[4] != '-' || date[7] != '-')
        return std::nullopt;
    return LogFileKey{*type, std::string(stem)};
}

namespace {

std::tm toUtc(TimePoint ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

} // namespace

std::string formatLogTimestamp(TimePoint ts) {
    auto tm = toUtc(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() %
              1000;
    if (ms < 0)
        ms += 1000;
    return format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}", tm.tm_year + 1900, tm.tm_mon + 1,
                  tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
}

std::string formatLogDate(TimePoint ts) {
    auto tm = toUtc(ts);
    return format("{:04}-{:02}-{:02}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

namespace {

// Exactly `width` decimal digits at `pos`
bool readField(std::string_view text, std::size_t pos, std::size_t width, int& out) {
    auto field = text.substr(pos, width);
    if (field.size() != width)
        return false;
    for (char c : field) {
        if (c < '0' || c > '9')
            return false;
    }
    auto [end, ec] = std::from_chars(field.data(), field.data() + field.size(), out);
    return ec == std::errc{} && end == field.data() + field.size();
}

} // namespace

std::optional<TimePoint> parseLogTimestamp(std::string_view text) {
    // YYYY-MM-DD HH:MM:SS.mmm
    if (text.size() != 23 || text[4] != '-' || text[7] != '-' || text[10] != ' ' ||
        text[13] != ':' || text[16] != ':' || text[19] != '.')
        return std::nullopt;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, ms = 0;
    if (!readField(text, 0, 4, y) || !readField(text, 5, 2, mo) || !readField(text, 8, 2, d) ||
        !readField(text, 11, 2, h) || !readField(text, 14, 2, mi) ||
        !readField(text, 17, 2, sec) || !readField(text, 20, 3, ms))
        return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60)
        return std::nullopt;
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(ms);
}

std::optional<LogEntry> parseLogLine(std::string_view line, LogType type,
                                     const ServerId& serverId) {
    // date, time, then "[LEVEL] message"
    auto firstSpace = line.find(' ');
    if (firstSpace == std::string_view::npos)
        return std::nullopt;
    auto secondSpace = line.find(' ', firstSpace + 1);
    if (secondSpace == std::string_view::npos)
        return std::nullopt;

    auto ts = parseLogTimestamp(line.substr(0, secondSpace));
    if (!ts)
        return std::nullopt;

    auto rest = line.substr(secondSpace + 1);
    if (rest.empty() || rest.front() != '[')
        return std::nullopt;
    auto levelEnd = rest.find(']');
    if (levelEnd == std::string_view::npos)
        return std::nullopt;

    LogEntry entry;
    entry.serverId = serverId;
    entry.type = type;
    entry.timestamp = *ts;
    entry.level = std::string(rest.substr(1, levelEnd - 1));
    auto message = rest.substr(levelEnd + 1);
    if (!message.empty() && message.front() == ' ')
        message.remove_prefix(1);
    entry.message = std::string(message);
    return entry;
}

std::string formatLogLine(TimePoint ts, std::string_view level, std::string_view message) {
    std::string line = formatLogTimestamp(ts);
    line.reserve(line.size() + level.size() + message.size() + 5);
    line += " [";
    line += level;
    line += "] ";
    line += message;
    return line;
}

nlohmann::json logEntryToJson(const LogEntry& entry) {
    return {{"server_id", entry.serverId},
            {"log_type", logTypeToString(entry.type)},
            {"level", entry.level},
            {"message", entry.message},
            {"timestamp", formatLogTimestamp(entry.timestamp)}};
}

} // namespace mcpgate::model
