/*
 * logger_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger_config.hpp"

#include <fstream>
#include <sstream>

#include "core/diagnostics.hpp"
#include "core/exception.hpp"

namespace otellogger {

auto LoggerConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : values) {
        j[key] = value;
    }

    if (logger_name) {
        j["loggerName"] = *logger_name;
    }
    if (service_name) {
        j["serviceName"] = *service_name;
    }
    if (level) {
        j["level"] = levelToString(*level);
    }

    return j;
}

auto LoggerConfig::fromJson(const nlohmann::json& j) -> LoggerConfig {
    if (!j.is_object()) {
        THROW_CONFIGURATION_ERROR("config must be a JSON object, got " +
                                  std::string(j.type_name()));
    }

    LoggerConfig config;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            THROW_CONFIGURATION_ERROR("config value for '" + key +
                                      "' must be a string, got " +
                                      std::string(value.type_name()));
        }
        config.values[key] = value.get<std::string>();
    }

    if (auto it = config.values.find("loggerName");
        it != config.values.end()) {
        config.logger_name = it->second;
    }
    if (auto it = config.values.find("serviceName");
        it != config.values.end()) {
        config.service_name = it->second;
    }
    if (auto it = config.values.find("level"); it != config.values.end()) {
        config.level = levelFromString(it->second);
        if (levelToString(*config.level) != it->second) {
            diagnostics()->warn(
                "Unrecognized level '{}' in config, using INFO", it->second);
        }
    }

    return config;
}

auto LoggerConfig::fromFile(const std::filesystem::path& file_path)
    -> LoggerConfig {
    std::ifstream file(file_path);
    if (!file) {
        THROW_CONFIG_IO_ERROR("Failed to open config file: " +
                              file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        THROW_CONFIGURATION_ERROR("Failed to parse config file " +
                                  file_path.string() + ": " + e.what());
    }

    diagnostics()->debug("Loaded config from {}", file_path.string());
    return fromJson(j);
}

}  // namespace otellogger
