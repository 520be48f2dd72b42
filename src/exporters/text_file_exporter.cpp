/*
 * text_file_exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "text_file_exporter.hpp"

#include <fstream>

#include "core/diagnostics.hpp"
#include "core/exception.hpp"

namespace otellogger {

void TextFileExporter::exportLogs(const std::string& trace_id,
                                  const std::vector<LogEntry>& entries,
                                  const std::optional<ExporterConfig>& config) {
    if (entries.empty()) {
        return;
    }

    auto file_path = resolveOutputPath(config, trace_id, ".txt");

    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            THROW_EXPORTER_IO_ERROR("Failed to create directory " +
                                    file_path.parent_path().string() + ": " +
                                    ec.message());
        }
    }

    std::ofstream file(file_path, std::ios::out | std::ios::app);
    if (!file) {
        THROW_EXPORTER_IO_ERROR("Failed to open file for writing: " +
                                file_path.string());
    }

    for (const auto& entry : entries) {
        file << formatLogLine(entry);
    }

    file.close();
    if (!file) {
        THROW_EXPORTER_IO_ERROR("Failed to write file: " + file_path.string());
    }

    diagnostics()->debug("Appended {} entries of trace ID {} to {}",
                         entries.size(), trace_id, file_path.string());
}

}  // namespace otellogger
