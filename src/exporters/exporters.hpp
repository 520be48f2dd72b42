/**
 * @file exporters.hpp
 * @brief Aggregated header for the exporter backends.
 *
 * Components:
 * - LogExporter: exporter interface
 * - ConsoleExporter: one line per entry on stdout (default)
 * - JsonFileExporter: pretty-printed JSON array per transaction
 * - TextFileExporter: console line format appended to a text file
 *
 * @date 2025-3-10
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef OTELLOGGER_EXPORTERS_HPP
#define OTELLOGGER_EXPORTERS_HPP

#include "console_exporter.hpp"
#include "json_file_exporter.hpp"
#include "log_exporter.hpp"
#include "text_file_exporter.hpp"

#endif  // OTELLOGGER_EXPORTERS_HPP
