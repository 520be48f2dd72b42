/*
 * text_file_exporter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Exporter appending transaction logs to text files

**************************************************/

#ifndef OTELLOGGER_EXPORTERS_TEXT_FILE_EXPORTER_HPP
#define OTELLOGGER_EXPORTERS_TEXT_FILE_EXPORTER_HPP

#include "log_exporter.hpp"

namespace otellogger {

/**
 * @brief Appends the console line format to
 * <filepath>/<filename>_<trace_id>.txt
 */
class TextFileExporter : public LogExporter {
public:
    void exportLogs(const std::string& trace_id,
                    const std::vector<LogEntry>& entries,
                    const std::optional<ExporterConfig>& config) override;
};

}  // namespace otellogger

#endif  // OTELLOGGER_EXPORTERS_TEXT_FILE_EXPORTER_HPP
