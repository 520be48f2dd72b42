/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace otellogger {

namespace {
constexpr const char* TIMESTAMP_FORMAT = "%d.%m.%Y %H:%M:%S";
}  // namespace

// ============================================================================
// LogEntry Implementation
// ============================================================================

auto LogEntry::toJson() const -> nlohmann::ordered_json {
    nlohmann::ordered_json attrs = nlohmann::ordered_json::object();
    for (const auto& [key, value] : attributes) {
        attrs[key] = value;
    }

    nlohmann::ordered_json j;
    j["Timestamp"] = timestamp;
    j["Severity"] = levelToString(level);
    j["Message"] = message;
    j["LoggerName"] = logger_name;
    j["ServiceName"] = service_name;
    j["TraceID"] = trace_id;
    j["SpanID"] = span_id;
    j["Attributes"] = std::move(attrs);
    return j;
}

auto LogEntry::fromJson(const nlohmann::json& j) -> LogEntry {
    LogEntry entry;
    entry.timestamp = j.value("Timestamp", "");
    entry.level = levelFromString(j.value("Severity", "INFO"));
    entry.message = j.value("Message", "");
    entry.logger_name = j.value("LoggerName", "");
    entry.service_name = j.value("ServiceName", "");
    entry.trace_id = j.value("TraceID", "");
    entry.span_id = j.value("SpanID", "");

    if (j.contains("Attributes") && j["Attributes"].is_object()) {
        for (const auto& [key, value] : j["Attributes"].items()) {
            entry.attributes[key] = value.get<std::string>();
        }
    }

    return entry;
}

// ============================================================================
// Level Conversion Functions
// ============================================================================

auto isKnownLevel(Level level) -> bool {
    switch (level) {
        case Level::DEBUG:
        case Level::INFO:
        case Level::WARNING:
        case Level::ERROR:
            return true;
    }
    return false;
}

auto levelFromString(const std::string& level) -> Level {
    if (level == "DEBUG")
        return Level::DEBUG;
    if (level == "INFO")
        return Level::INFO;
    if (level == "WARNING")
        return Level::WARNING;
    if (level == "ERROR")
        return Level::ERROR;
    return Level::INFO;  // Default
}

auto levelToString(Level level) -> std::string {
    switch (level) {
        case Level::DEBUG:
            return "DEBUG";
        case Level::INFO:
            return "INFO";
        case Level::WARNING:
            return "WARNING";
        case Level::ERROR:
            return "ERROR";
    }
    return "UNKNOWN LEVEL";
}

auto formatTimestamp(const std::chrono::system_clock::time_point& tp)
    -> std::string {
    auto time_t = std::chrono::system_clock::to_time_t(tp);

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time_t);
#else
    localtime_r(&time_t, &local_tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local_tm, TIMESTAMP_FORMAT);
    return oss.str();
}

}  // namespace otellogger
