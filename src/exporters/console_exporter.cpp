/*
 * console_exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "console_exporter.hpp"

#include <iostream>

#include "core/exception.hpp"

namespace otellogger {

ConsoleExporter::ConsoleExporter() : out_(std::cout) {}

ConsoleExporter::ConsoleExporter(std::ostream& out) : out_(out) {}

void ConsoleExporter::exportLogs(
    const std::string& trace_id, const std::vector<LogEntry>& entries,
    [[maybe_unused]] const std::optional<ExporterConfig>& config) {
    if (entries.empty()) {
        return;
    }

    std::string block;
    for (const auto& entry : entries) {
        block += formatLogLine(entry);
    }

    std::lock_guard lock(mutex_);
    out_ << block;
    out_.flush();
    if (!out_) {
        THROW_EXPORTER_IO_ERROR("Failed to write logs of trace ID " +
                                trace_id + " to console");
    }
}

}  // namespace otellogger
