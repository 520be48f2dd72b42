/*
 * logger_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Logger configuration file support

**************************************************/

#ifndef OTELLOGGER_CONFIG_LOGGER_CONFIG_HPP
#define OTELLOGGER_CONFIG_LOGGER_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace otellogger {

/**
 * @brief Logger configuration
 *
 * Read from a JSON object whose values are all strings. The recognized keys
 * are extracted into typed fields; the full mapping, recognized keys
 * included, is kept in values and handed to the exporter on every flush
 * (file exporters read "filepath" and "filename" from it).
 */
struct LoggerConfig {
    std::optional<std::string> logger_name;   // "loggerName"
    std::optional<std::string> service_name;  // "serviceName"
    std::optional<Level> level;               // "level"
    ExporterConfig values;

    /**
     * @brief Convert config to JSON
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Create config from JSON
     *
     * An unrecognized "level" value maps to INFO.
     *
     * @throws ConfigurationException if j is not an object of strings
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggerConfig;

    /**
     * @brief Load config from a JSON file
     * @throws ConfigIOException if the file cannot be read
     * @throws ConfigurationException if the content is not valid
     */
    [[nodiscard]] static auto fromFile(const std::filesystem::path& file_path)
        -> LoggerConfig;
};

}  // namespace otellogger

#endif  // OTELLOGGER_CONFIG_LOGGER_CONFIG_HPP
