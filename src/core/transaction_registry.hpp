/*
 * transaction_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Registry of open transactions with level filtering

**************************************************/

#ifndef OTELLOGGER_CORE_TRANSACTION_REGISTRY_HPP
#define OTELLOGGER_CORE_TRANSACTION_REGISTRY_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "id_generator.hpp"
#include "types.hpp"

namespace otellogger {

inline constexpr const char* DEFAULT_LOGGER_NAME = "OTelLogger";
inline constexpr const char* DEFAULT_SERVICE_NAME = "Default";

/**
 * @brief Thread-safe store of open transactions
 *
 * Owns every open TransactionLog. All operations take the registry lock
 * for their full duration: lookups share it, structural changes hold it
 * exclusively. Entries below the configured threshold are dropped on
 * record without error.
 */
class TransactionRegistry {
public:
    /**
     * @brief Construct a registry
     * @param threshold Minimum level that gets recorded
     * @param id_generator Identifier provider (RandomIdGenerator if null)
     */
    explicit TransactionRegistry(
        Level threshold = Level::INFO,
        std::shared_ptr<IdGenerator> id_generator = nullptr);

    TransactionRegistry(const TransactionRegistry&) = delete;
    TransactionRegistry& operator=(const TransactionRegistry&) = delete;

    /**
     * @brief Open a new transaction
     * @param attributes Attributes attached to the transaction
     * @return Trace ID, unique among open transactions
     */
    auto open(const Attributes& attributes = {}) -> std::string;

    /**
     * @brief Record an entry on an open transaction
     * @param level Entry severity
     * @param trace_id Target transaction
     * @param message Entry message
     * @param attributes Entry attributes
     * @return false if the entry was below the threshold and dropped
     * @throws UnknownLevelException if level is not DEBUG..ERROR
     * @throws UnknownTransactionException if trace_id is not open
     */
    auto record(Level level, const std::string& trace_id,
                const std::string& message, const Attributes& attributes = {})
        -> bool;

    /**
     * @brief Snapshot of an open transaction
     * @param trace_id Trace ID
     * @return Copy of the transaction log, nullopt if not open
     */
    [[nodiscard]] auto lookup(const std::string& trace_id) const
        -> std::optional<TransactionLog>;

    /**
     * @brief Remove a transaction
     * @param trace_id Trace ID
     * @return true if removed, false if not open
     */
    auto remove(const std::string& trace_id) -> bool;

    /**
     * @brief Check if a transaction is open
     */
    [[nodiscard]] auto contains(const std::string& trace_id) const -> bool;

    /**
     * @brief Point-in-time list of open trace IDs
     */
    [[nodiscard]] auto traceIds() const -> std::vector<std::string>;

    /**
     * @brief Get count of open transactions
     */
    [[nodiscard]] auto size() const -> size_t;

    // ========== Export Bracket ==========

    /**
     * @brief Mark a transaction as being exported and copy its entries
     * @param trace_id Trace ID
     * @return Entries recorded so far, in emission order
     * @throws UnknownTransactionException if trace_id is not open
     * @throws ExportInProgressException if an export is already running
     */
    auto beginExport(const std::string& trace_id) -> std::vector<LogEntry>;

    /**
     * @brief Retire a successfully exported transaction
     *
     * Drops the first exported_count entries. The transaction is removed
     * unless entries were recorded while the export was running; those stay
     * open for the next flush.
     *
     * @param trace_id Trace ID
     * @param exported_count Number of entries handed to the exporter
     * @return true if the transaction was removed
     */
    auto completeExport(const std::string& trace_id, size_t exported_count)
        -> bool;

    /**
     * @brief Release a transaction after a failed export, entries intact
     * @param trace_id Trace ID
     */
    void abortExport(const std::string& trace_id);

    // ========== Settings ==========

    void setLevel(Level level);
    [[nodiscard]] auto getLevel() const -> Level;

    void setLoggerName(const std::string& name);
    [[nodiscard]] auto getLoggerName() const -> std::string;

    void setServiceName(const std::string& name);
    [[nodiscard]] auto getServiceName() const -> std::string;

private:
    struct OpenTransaction {
        TransactionLog log;
        bool exporting{false};
    };

    mutable std::shared_mutex mutex_;
    Level threshold_;
    std::string logger_name_{DEFAULT_LOGGER_NAME};
    std::string service_name_{DEFAULT_SERVICE_NAME};
    std::shared_ptr<IdGenerator> id_generator_;
    std::unordered_map<std::string, OpenTransaction> transactions_;
};

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_TRANSACTION_REGISTRY_HPP
