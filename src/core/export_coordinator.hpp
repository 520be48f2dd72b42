/*
 * export_coordinator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Flush of single and all transactions through an exporter

**************************************************/

#ifndef OTELLOGGER_CORE_EXPORT_COORDINATOR_HPP
#define OTELLOGGER_CORE_EXPORT_COORDINATOR_HPP

#include <mutex>
#include <optional>
#include <string>

#include "exporters/log_exporter.hpp"
#include "transaction_registry.hpp"
#include "types.hpp"

namespace otellogger {

/**
 * @brief Hands transactions to an exporter and retires them on success
 *
 * The registry lock is only held to pick up and to retire a transaction;
 * the exporter itself runs unlocked, so flushes of different transactions
 * proceed in parallel.
 */
class ExportCoordinator {
public:
    /**
     * @brief Construct a coordinator
     * @param registry Registry to flush, must outlive the coordinator
     * @param exporter Exporter backend (ConsoleExporter if null)
     */
    explicit ExportCoordinator(TransactionRegistry& registry,
                               LogExporterPtr exporter = nullptr);

    /**
     * @brief Export one transaction and remove it from the registry
     *
     * On exporter failure the transaction stays open, entries intact, and
     * can be flushed again.
     *
     * @param trace_id Trace ID
     * @throws UnknownTransactionException if trace_id is not open
     * @throws ExportInProgressException if trace_id is already being flushed
     * @throws ExporterFailureException nesting the exporter's exception
     */
    void flush(const std::string& trace_id);

    /**
     * @brief Export every open transaction concurrently
     *
     * Flushes a snapshot of the open trace IDs, one task per transaction,
     * and waits for all of them. Successful transactions are removed even
     * if others fail. When several tasks fail only one error is rethrown
     * (the first in snapshot order, which is unordered); the rest are
     * logged.
     *
     * @return Number of transactions flushed successfully
     */
    auto flushAll() -> size_t;

    void setExporter(LogExporterPtr exporter);
    [[nodiscard]] auto getExporter() const -> LogExporterPtr;

    /**
     * @brief Set configuration passed to the exporter on every flush
     * @param config Configuration mapping, nullopt for none
     */
    void setConfig(std::optional<ExporterConfig> config);
    [[nodiscard]] auto getConfig() const -> std::optional<ExporterConfig>;

private:
    TransactionRegistry& registry_;

    mutable std::mutex mutex_;
    LogExporterPtr exporter_;
    std::optional<ExporterConfig> config_;
};

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_EXPORT_COORDINATOR_HPP
