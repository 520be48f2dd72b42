/**
 * @file otellogger.hpp
 * @brief Main aggregated header for the OTelLogger library.
 *
 * This is the primary include file for the transaction logger.
 *
 * @par Usage Example:
 * @code
 * #include "otellogger.hpp"
 *
 * using namespace otellogger;
 *
 * Logger logger(Level::INFO);
 * logger.withExporter(std::make_shared<JsonFileExporter>())
 *     .withConfig("logger.json");
 *
 * auto trace_id = logger.startTransaction({{"user", "42"}});
 * logger.info("request accepted", trace_id, {{"path", "/orders"}});
 * logger.exportLogs(trace_id);
 * @endcode
 *
 * @date 2025-3-10
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef OTELLOGGER_OTELLOGGER_HPP
#define OTELLOGGER_OTELLOGGER_HPP

// ============================================================================
// Core Module
// ============================================================================
// Components:
// - LogEntry, TransactionLog: data model
// - TransactionRegistry: open transactions with level filtering
// - ExportCoordinator: single and concurrent flush

#include "core/diagnostics.hpp"
#include "core/exception.hpp"
#include "core/export_coordinator.hpp"
#include "core/id_generator.hpp"
#include "core/transaction_registry.hpp"
#include "core/types.hpp"

// ============================================================================
// Exporters Module
// ============================================================================

#include "exporters/exporters.hpp"

// ============================================================================
// Config and Logger
// ============================================================================

#include "config/logger_config.hpp"
#include "logger/logger.hpp"

namespace otellogger {

/**
 * @brief OTelLogger library version.
 */
inline constexpr const char* OTELLOGGER_VERSION = "1.0.0";

/**
 * @brief Get library version string.
 * @return Version string.
 */
[[nodiscard]] inline const char* getVersion() noexcept {
    return OTELLOGGER_VERSION;
}

}  // namespace otellogger

#endif  // OTELLOGGER_OTELLOGGER_HPP
