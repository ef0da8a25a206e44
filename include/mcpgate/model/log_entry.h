#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::model {

enum class LogType { Exec, In, Out, Err };

// File name prefix without the dash: "exec", "in", "out", "err"
const char* logTypeToString(LogType type);
std::optional<LogType> parseLogType(std::string_view raw);

struct LogEntry {
    ServerId serverId;
    LogType type = LogType::Exec;
    std::string level;
    std::string message;
    TimePoint timestamp;
};

// "<type>-YYYY-MM-DD.log" -> (type, "<type>-YYYY-MM-DD"). Other names yield nullopt.
struct LogFileKey {
    LogType type;
    std::string key;
};
std::optional<LogFileKey> classifyLogFile(std::string_view fileName);

// "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] message"; malformed lines yield nullopt.
std::optional<LogEntry> parseLogLine(std::string_view line, LogType type, const ServerId& serverId);
std::string formatLogLine(TimePoint ts, std::string_view level, std::string_view message);

// UTC renderings used by the writer and the offset keys
std::string formatLogTimestamp(TimePoint ts);
std::string formatLogDate(TimePoint ts);
std::optional<TimePoint> parseLogTimestamp(std::string_view text);

nlohmann::json logEntryToJson(const LogEntry& entry);

} // namespace mcpgate::model
