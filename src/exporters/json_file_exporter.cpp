/*
 * json_file_exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "json_file_exporter.hpp"

#include <fstream>

#include "core/diagnostics.hpp"
#include "core/exception.hpp"

namespace otellogger {

void JsonFileExporter::exportLogs(const std::string& trace_id,
                                  const std::vector<LogEntry>& entries,
                                  const std::optional<ExporterConfig>& config) {
    if (entries.empty()) {
        return;
    }

    auto file_path = resolveOutputPath(config, trace_id, ".json");

    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& entry : entries) {
        arr.push_back(entry.toJson());
    }

    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            THROW_EXPORTER_IO_ERROR("Failed to create directory " +
                                    file_path.parent_path().string() + ": " +
                                    ec.message());
        }
    }

    std::ofstream file(file_path, std::ios::out | std::ios::trunc);
    if (!file) {
        THROW_EXPORTER_IO_ERROR("Failed to open file for writing: " +
                                file_path.string());
    }

    file << dumpJson(arr, 2) << "\n";
    file.close();
    if (!file) {
        THROW_EXPORTER_IO_ERROR("Failed to write file: " + file_path.string());
    }

    diagnostics()->debug("Exported {} entries of trace ID {} to {}",
                         entries.size(), trace_id, file_path.string());
}

}  // namespace otellogger
