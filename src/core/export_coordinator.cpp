/*
 * export_coordinator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "export_coordinator.hpp"

#include <exception>
#include <future>
#include <vector>

#include "diagnostics.hpp"
#include "exception.hpp"
#include "exporters/console_exporter.hpp"

namespace otellogger {

ExportCoordinator::ExportCoordinator(TransactionRegistry& registry,
                                     LogExporterPtr exporter)
    : registry_(registry), exporter_(std::move(exporter)) {
    if (!exporter_) {
        exporter_ = std::make_shared<ConsoleExporter>();
    }
}

void ExportCoordinator::flush(const std::string& trace_id) {
    LogExporterPtr exporter;
    std::optional<ExporterConfig> config;
    {
        std::lock_guard lock(mutex_);
        exporter = exporter_;
        config = config_;
    }

    auto entries = registry_.beginExport(trace_id);

    try {
        exporter->exportLogs(trace_id, entries, config);
    } catch (const std::exception& e) {
        registry_.abortExport(trace_id);
        diagnostics()->error("Failed to export trace ID {}: {}", trace_id,
                             e.what());
        THROW_NESTED_EXPORTER_FAILURE("Failed to export trace ID " + trace_id +
                                      ": " + e.what());
    } catch (...) {
        registry_.abortExport(trace_id);
        throw;
    }

    if (registry_.completeExport(trace_id, entries.size())) {
        diagnostics()->debug("Flushed {} entries of trace ID {}",
                             entries.size(), trace_id);
    }
}

auto ExportCoordinator::flushAll() -> size_t {
    auto trace_ids = registry_.traceIds();

    std::vector<std::future<void>> futures;
    futures.reserve(trace_ids.size());

    // One task per transaction
    for (const auto& trace_id : trace_ids) {
        futures.push_back(std::async(std::launch::async,
                                     [this, trace_id]() { flush(trace_id); }));
    }

    size_t flushed = 0;
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            futures[i].get();
            ++flushed;
        } catch (const std::exception& e) {
            if (!first_error) {
                first_error = std::current_exception();
            } else {
                diagnostics()->warn(
                    "Discarding flush error for trace ID {}: {}",
                    trace_ids[i], e.what());
            }
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            } else {
                diagnostics()->warn(
                    "Discarding non-standard flush error for trace ID {}",
                    trace_ids[i]);
            }
        }
    }

    diagnostics()->info("Flushed {}/{} transactions", flushed,
                        trace_ids.size());

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return flushed;
}

void ExportCoordinator::setExporter(LogExporterPtr exporter) {
    std::lock_guard lock(mutex_);
    exporter_ = exporter ? std::move(exporter)
                         : std::make_shared<ConsoleExporter>();
}

auto ExportCoordinator::getExporter() const -> LogExporterPtr {
    std::lock_guard lock(mutex_);
    return exporter_;
}

void ExportCoordinator::setConfig(std::optional<ExporterConfig> config) {
    std::lock_guard lock(mutex_);
    config_ = std::move(config);
}

auto ExportCoordinator::getConfig() const -> std::optional<ExporterConfig> {
    std::lock_guard lock(mutex_);
    return config_;
}

}  // namespace otellogger
