/*
 * json_file_exporter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Exporter writing one JSON file per transaction

**************************************************/

#ifndef OTELLOGGER_EXPORTERS_JSON_FILE_EXPORTER_HPP
#define OTELLOGGER_EXPORTERS_JSON_FILE_EXPORTER_HPP

#include "log_exporter.hpp"

namespace otellogger {

/**
 * @brief Writes the entry array of a transaction to
 * <filepath>/<filename>_<trace_id>.json
 *
 * Output is pretty-printed with two-space indentation and a trailing
 * newline. An existing file is overwritten.
 */
class JsonFileExporter : public LogExporter {
public:
    void exportLogs(const std::string& trace_id,
                    const std::vector<LogEntry>& entries,
                    const std::optional<ExporterConfig>& config) override;
};

}  // namespace otellogger

#endif  // OTELLOGGER_EXPORTERS_JSON_FILE_EXPORTER_HPP
