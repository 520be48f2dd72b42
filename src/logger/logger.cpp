/*
 * logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger.hpp"

#include "core/diagnostics.hpp"

namespace otellogger {

Logger::Logger(Level level, std::shared_ptr<IdGenerator> id_generator)
    : registry_(level, std::move(id_generator)), coordinator_(registry_) {}

// ============================================================================
// Configuration
// ============================================================================

auto Logger::withConfig(const std::filesystem::path& file_path) -> Logger& {
    return withConfig(LoggerConfig::fromFile(file_path));
}

auto Logger::withConfig(const LoggerConfig& config) -> Logger& {
    if (config.logger_name) {
        registry_.setLoggerName(*config.logger_name);
    }
    if (config.service_name) {
        registry_.setServiceName(*config.service_name);
    }
    if (config.level) {
        registry_.setLevel(*config.level);
    }
    coordinator_.setConfig(config.values);

    diagnostics()->info("Logger '{}' of service '{}' configured, level {}",
                        registry_.getLoggerName(), registry_.getServiceName(),
                        levelToString(registry_.getLevel()));
    return *this;
}

auto Logger::withExporter(LogExporterPtr exporter) -> Logger& {
    coordinator_.setExporter(std::move(exporter));
    return *this;
}

void Logger::setLoggerName(const std::string& name) {
    registry_.setLoggerName(name);
}

auto Logger::getLoggerName() const -> std::string {
    return registry_.getLoggerName();
}

void Logger::setServiceName(const std::string& name) {
    registry_.setServiceName(name);
}

auto Logger::getServiceName() const -> std::string {
    return registry_.getServiceName();
}

void Logger::setLevel(Level level) { registry_.setLevel(level); }

auto Logger::getLevel() const -> Level { return registry_.getLevel(); }

auto Logger::getExporter() const -> LogExporterPtr {
    return coordinator_.getExporter();
}

auto Logger::getConfig() const -> std::optional<ExporterConfig> {
    return coordinator_.getConfig();
}

// ============================================================================
// Transactions
// ============================================================================

auto Logger::startTransaction(const Attributes& attributes) -> std::string {
    return registry_.open(attributes);
}

auto Logger::log(Level level, const std::string& message,
                 const std::string& trace_id, const Attributes& attributes)
    -> bool {
    return registry_.record(level, trace_id, message, attributes);
}

auto Logger::debug(const std::string& message, const std::string& trace_id,
                   const Attributes& attributes) -> bool {
    return log(Level::DEBUG, message, trace_id, attributes);
}

auto Logger::info(const std::string& message, const std::string& trace_id,
                  const Attributes& attributes) -> bool {
    return log(Level::INFO, message, trace_id, attributes);
}

auto Logger::warning(const std::string& message, const std::string& trace_id,
                     const Attributes& attributes) -> bool {
    return log(Level::WARNING, message, trace_id, attributes);
}

auto Logger::error(const std::string& message, const std::string& trace_id,
                   const Attributes& attributes) -> bool {
    return log(Level::ERROR, message, trace_id, attributes);
}

// ============================================================================
// Export
// ============================================================================

void Logger::exportLogs(const std::string& trace_id) {
    coordinator_.flush(trace_id);
}

auto Logger::exportAllLogs() -> size_t { return coordinator_.flushAll(); }

auto Logger::registry() -> TransactionRegistry& { return registry_; }

auto Logger::registry() const -> const TransactionRegistry& {
    return registry_;
}

auto Logger::coordinator() -> ExportCoordinator& { return coordinator_; }

}  // namespace otellogger
