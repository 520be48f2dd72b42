/*
 * console_exporter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Exporter printing transaction logs to a stream

**************************************************/

#ifndef OTELLOGGER_EXPORTERS_CONSOLE_EXPORTER_HPP
#define OTELLOGGER_EXPORTERS_CONSOLE_EXPORTER_HPP

#include <mutex>
#include <ostream>

#include "log_exporter.hpp"

namespace otellogger {

/**
 * @brief Default exporter, one line per entry on stdout
 *
 * The lines of one transaction are written as a single block, so output of
 * concurrent flushes never interleaves. Configuration is ignored.
 */
class ConsoleExporter : public LogExporter {
public:
    /**
     * @brief Construct an exporter writing to stdout
     */
    ConsoleExporter();

    /**
     * @brief Construct an exporter writing to a caller-owned stream
     * @param out Output stream, must outlive the exporter
     */
    explicit ConsoleExporter(std::ostream& out);

    void exportLogs(const std::string& trace_id,
                    const std::vector<LogEntry>& entries,
                    const std::optional<ExporterConfig>& config) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

}  // namespace otellogger

#endif  // OTELLOGGER_EXPORTERS_CONSOLE_EXPORTER_HPP
