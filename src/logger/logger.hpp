/*
 * logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Transaction logger entry point

**************************************************/

#ifndef OTELLOGGER_LOGGER_LOGGER_HPP
#define OTELLOGGER_LOGGER_LOGGER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "config/logger_config.hpp"
#include "core/export_coordinator.hpp"
#include "core/transaction_registry.hpp"
#include "exporters/log_exporter.hpp"

namespace otellogger {

/**
 * @brief Transaction-scoped logger
 *
 * Provides:
 * - Transaction creation with attributes
 * - Per-level recording (debug/info/warning/error) filtered by threshold
 * - Export of one or all transactions through a pluggable exporter
 * - Configuration from a JSON file
 *
 * Loggers are independent; each owns its own registry.
 */
class Logger {
public:
    /**
     * @brief Create a logger with default names and the console exporter
     * @param level Minimum level that gets recorded
     * @param id_generator Identifier provider (RandomIdGenerator if null)
     */
    explicit Logger(Level level = Level::INFO,
                    std::shared_ptr<IdGenerator> id_generator = nullptr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // ========== Configuration ==========

    /**
     * @brief Load configuration from a JSON file
     *
     * Applies loggerName, serviceName and level when present and keeps the
     * whole mapping for the exporter.
     *
     * @param file_path Path to the config file
     * @return *this
     * @throws ConfigIOException if the file cannot be read
     * @throws ConfigurationException if the content is not valid
     */
    auto withConfig(const std::filesystem::path& file_path) -> Logger&;

    /**
     * @brief Apply an already loaded configuration
     * @param config Logger configuration
     * @return *this
     */
    auto withConfig(const LoggerConfig& config) -> Logger&;

    /**
     * @brief Replace the exporter
     * @param exporter Exporter backend (ConsoleExporter if null)
     * @return *this
     */
    auto withExporter(LogExporterPtr exporter) -> Logger&;

    void setLoggerName(const std::string& name);
    [[nodiscard]] auto getLoggerName() const -> std::string;

    void setServiceName(const std::string& name);
    [[nodiscard]] auto getServiceName() const -> std::string;

    void setLevel(Level level);
    [[nodiscard]] auto getLevel() const -> Level;

    [[nodiscard]] auto getExporter() const -> LogExporterPtr;
    [[nodiscard]] auto getConfig() const -> std::optional<ExporterConfig>;

    // ========== Transactions ==========

    /**
     * @brief Start a transaction
     * @param attributes Attributes attached to the transaction
     * @return Trace ID of the new transaction
     */
    auto startTransaction(const Attributes& attributes = {}) -> std::string;

    /**
     * @brief Record an entry at the given level
     * @return false if the entry was below the threshold and dropped
     * @throws UnknownLevelException, UnknownTransactionException
     */
    auto log(Level level, const std::string& message,
             const std::string& trace_id, const Attributes& attributes = {})
        -> bool;

    auto debug(const std::string& message, const std::string& trace_id,
               const Attributes& attributes = {}) -> bool;
    auto info(const std::string& message, const std::string& trace_id,
              const Attributes& attributes = {}) -> bool;
    auto warning(const std::string& message, const std::string& trace_id,
                 const Attributes& attributes = {}) -> bool;
    auto error(const std::string& message, const std::string& trace_id,
               const Attributes& attributes = {}) -> bool;

    // ========== Export ==========

    /**
     * @brief Export one transaction and retire it
     * @see ExportCoordinator::flush
     */
    void exportLogs(const std::string& trace_id);

    /**
     * @brief Export all open transactions concurrently
     * @see ExportCoordinator::flushAll
     */
    auto exportAllLogs() -> size_t;

    [[nodiscard]] auto registry() -> TransactionRegistry&;
    [[nodiscard]] auto registry() const -> const TransactionRegistry&;
    [[nodiscard]] auto coordinator() -> ExportCoordinator&;

private:
    TransactionRegistry registry_;
    ExportCoordinator coordinator_;
};

}  // namespace otellogger

#endif  // OTELLOGGER_LOGGER_LOGGER_HPP
