/*
 * log_exporter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_exporter.hpp"

#include "core/exception.hpp"

namespace otellogger {

auto dumpJson(const nlohmann::ordered_json& j, int indent) -> std::string {
    auto text =
        j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);

    // Only string contents can hold these characters
    std::string escaped;
    escaped.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '<') {
            escaped += "\\u003c";
        } else if (c == '>') {
            escaped += "\\u003e";
        } else if (c == '&') {
            escaped += "\\u0026";
        } else if (c == '\xe2' && i + 2 < text.size() && text[i + 1] == '\x80' &&
                   (text[i + 2] == '\xa8' || text[i + 2] == '\xa9')) {
            escaped += text[i + 2] == '\xa8' ? "\\u2028" : "\\u2029";
            i += 2;
        } else {
            escaped += c;
        }
    }
    return escaped;
}

auto formatLogLine(const LogEntry& entry) -> std::string {
    return "[" + levelToString(entry.level) + "] [" + entry.timestamp + "] " +
           dumpJson(entry.toJson()) + "\n";
}

auto resolveOutputPath(const std::optional<ExporterConfig>& config,
                       const std::string& trace_id,
                       const std::string& extension) -> std::filesystem::path {
    if (!config) {
        THROW_CONFIGURATION_ERROR("no config provided");
    }

    auto filepath = config->find("filepath");
    if (filepath == config->end()) {
        THROW_CONFIGURATION_ERROR("no filepath in config");
    }

    auto filename = config->find("filename");
    if (filename == config->end()) {
        THROW_CONFIGURATION_ERROR("no filename in config");
    }

    return std::filesystem::path(filepath->second) /
           (filename->second + "_" + trace_id + extension);
}

}  // namespace otellogger
