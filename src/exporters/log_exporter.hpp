/*
 * log_exporter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Exporter interface for transaction logs

**************************************************/

#ifndef OTELLOGGER_EXPORTERS_LOG_EXPORTER_HPP
#define OTELLOGGER_EXPORTERS_LOG_EXPORTER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace otellogger {

/**
 * @brief Sink for the entries of one transaction
 *
 * Implementations must:
 * - treat an empty entry sequence as a successful no-op
 * - throw ConfigurationException when required configuration is missing
 * - report any other failure by throwing
 *
 * exportLogs may be called concurrently for different transactions.
 */
class LogExporter {
public:
    virtual ~LogExporter() = default;

    /**
     * @brief Export the entries of one transaction
     * @param trace_id Transaction trace ID
     * @param entries Entries in emission order
     * @param config Exporter configuration, nullopt if none was loaded
     */
    virtual void exportLogs(const std::string& trace_id,
                            const std::vector<LogEntry>& entries,
                            const std::optional<ExporterConfig>& config) = 0;
};

using LogExporterPtr = std::shared_ptr<LogExporter>;

/**
 * @brief Serialize JSON in the exported wire form
 *
 * Invalid UTF-8 bytes become U+FFFD. '<', '>', '&', U+2028 and U+2029 are
 * written as \u escapes.
 *
 * @param j JSON value to serialize
 * @param indent Indentation width, -1 for compact output
 * @return Serialized text
 */
[[nodiscard]] auto dumpJson(const nlohmann::ordered_json& j, int indent = -1)
    -> std::string;

/**
 * @brief Format one entry as "[SEVERITY] [TIMESTAMP] <json>\n"
 */
[[nodiscard]] auto formatLogLine(const LogEntry& entry) -> std::string;

/**
 * @brief Resolve "<filepath>/<filename>_<trace_id><extension>" from config
 * @throws ConfigurationException if config, filepath or filename is missing
 */
[[nodiscard]] auto resolveOutputPath(
    const std::optional<ExporterConfig>& config, const std::string& trace_id,
    const std::string& extension) -> std::filesystem::path;

}  // namespace otellogger

#endif  // OTELLOGGER_EXPORTERS_LOG_EXPORTER_HPP
