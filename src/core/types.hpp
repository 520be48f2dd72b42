/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Transaction log type definitions

**************************************************/

#ifndef OTELLOGGER_CORE_TYPES_HPP
#define OTELLOGGER_CORE_TYPES_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "atom/type/json.hpp"

#undef ERROR

namespace otellogger {

/**
 * @brief Severity of a log entry
 *
 * Totally ordered: DEBUG < INFO < WARNING < ERROR. Values outside this
 * range are rejected when recording.
 */
enum class Level : int { DEBUG = 1, INFO = 2, WARNING = 3, ERROR = 4 };

/**
 * @brief Attribute mapping attached to entries and transactions
 */
using Attributes = std::map<std::string, std::string>;

/**
 * @brief Free-form configuration handed to exporters on every flush
 */
using ExporterConfig = std::unordered_map<std::string, std::string>;

/**
 * @brief One structured log record (span) belonging to a transaction
 */
struct LogEntry {
    std::string timestamp;
    Level level{Level::INFO};
    std::string message;
    std::string logger_name;
    std::string service_name;
    std::string trace_id;
    std::string span_id;
    Attributes attributes;

    /**
     * @brief Convert log entry to its serialized JSON form
     *
     * Field order is part of the format: Timestamp, Severity, Message,
     * LoggerName, ServiceName, TraceID, SpanID, Attributes. Attributes is
     * always an object, `{}` when empty. Serialize with dumpJson() to get
     * the exported escaping.
     */
    [[nodiscard]] auto toJson() const -> nlohmann::ordered_json;

    /**
     * @brief Create log entry from JSON
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> LogEntry;

    auto operator==(const LogEntry& other) const -> bool = default;
};

/**
 * @brief Ordered collection of entries sharing one trace ID
 */
struct TransactionLog {
    std::string trace_id;
    std::vector<LogEntry> entries;
    Attributes attributes;
};

/**
 * @brief Check that a level is one of DEBUG, INFO, WARNING, ERROR
 */
[[nodiscard]] auto isKnownLevel(Level level) -> bool;

/**
 * @brief Convert level string to enum
 *
 * Case-sensitive; anything other than DEBUG, INFO, WARNING or ERROR maps
 * to INFO.
 */
[[nodiscard]] auto levelFromString(const std::string& level) -> Level;

/**
 * @brief Convert level enum to string ("UNKNOWN LEVEL" when out of range)
 */
[[nodiscard]] auto levelToString(Level level) -> std::string;

/**
 * @brief Format a time point as "DD.MM.YYYY HH:MM:SS" in local time
 */
[[nodiscard]] auto formatTimestamp(
    const std::chrono::system_clock::time_point& tp) -> std::string;

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_TYPES_HPP
