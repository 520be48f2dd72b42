/*
 * transaction_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transaction_registry.hpp"

#include <chrono>
#include <iterator>
#include <mutex>

#include "diagnostics.hpp"
#include "exception.hpp"

namespace otellogger {

TransactionRegistry::TransactionRegistry(
    Level threshold, std::shared_ptr<IdGenerator> id_generator)
    : threshold_(threshold), id_generator_(std::move(id_generator)) {
    if (!id_generator_) {
        id_generator_ = std::make_shared<RandomIdGenerator>();
    }
}

auto TransactionRegistry::open(const Attributes& attributes) -> std::string {
    std::unique_lock lock(mutex_);

    std::string trace_id = id_generator_->nextTraceId();
    while (transactions_.contains(trace_id)) {
        diagnostics()->debug("Trace ID {} already open, generating another",
                             trace_id);
        trace_id = id_generator_->nextTraceId();
    }

    OpenTransaction transaction;
    transaction.log.trace_id = trace_id;
    transaction.log.attributes = attributes;
    transactions_.emplace(trace_id, std::move(transaction));

    diagnostics()->debug("Transaction {} opened", trace_id);
    return trace_id;
}

auto TransactionRegistry::record(Level level, const std::string& trace_id,
                                 const std::string& message,
                                 const Attributes& attributes) -> bool {
    std::unique_lock lock(mutex_);

    if (level < threshold_) {
        return false;
    }

    if (!isKnownLevel(level)) {
        THROW_UNKNOWN_LEVEL("unknown log level: " +
                            std::to_string(static_cast<int>(level)));
    }

    auto it = transactions_.find(trace_id);
    if (it == transactions_.end()) {
        THROW_UNKNOWN_TRANSACTION("invalid trace ID: " + trace_id);
    }

    LogEntry entry;
    entry.timestamp = formatTimestamp(std::chrono::system_clock::now());
    entry.level = level;
    entry.message = message;
    entry.logger_name = logger_name_;
    entry.service_name = service_name_;
    entry.trace_id = trace_id;
    entry.span_id = id_generator_->nextSpanId();
    entry.attributes = attributes;

    it->second.log.entries.push_back(std::move(entry));
    return true;
}

auto TransactionRegistry::lookup(const std::string& trace_id) const
    -> std::optional<TransactionLog> {
    std::shared_lock lock(mutex_);

    auto it = transactions_.find(trace_id);
    if (it == transactions_.end()) {
        return std::nullopt;
    }
    return it->second.log;
}

auto TransactionRegistry::remove(const std::string& trace_id) -> bool {
    std::unique_lock lock(mutex_);
    return transactions_.erase(trace_id) > 0;
}

auto TransactionRegistry::contains(const std::string& trace_id) const
    -> bool {
    std::shared_lock lock(mutex_);
    return transactions_.contains(trace_id);
}

auto TransactionRegistry::traceIds() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> result;
    result.reserve(transactions_.size());
    for (const auto& [trace_id, transaction] : transactions_) {
        result.push_back(trace_id);
    }
    return result;
}

auto TransactionRegistry::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return transactions_.size();
}

// ============================================================================
// Export Bracket
// ============================================================================

auto TransactionRegistry::beginExport(const std::string& trace_id)
    -> std::vector<LogEntry> {
    std::unique_lock lock(mutex_);

    auto it = transactions_.find(trace_id);
    if (it == transactions_.end()) {
        THROW_UNKNOWN_TRANSACTION("invalid trace ID: " + trace_id);
    }
    if (it->second.exporting) {
        THROW_EXPORT_IN_PROGRESS("export already in progress for trace ID: " +
                                 trace_id);
    }

    it->second.exporting = true;
    return it->second.log.entries;
}

auto TransactionRegistry::completeExport(const std::string& trace_id,
                                         size_t exported_count) -> bool {
    std::unique_lock lock(mutex_);

    auto it = transactions_.find(trace_id);
    if (it == transactions_.end()) {
        return false;
    }

    auto& entries = it->second.log.entries;
    if (entries.size() <= exported_count) {
        transactions_.erase(it);
        diagnostics()->debug("Transaction {} exported and removed", trace_id);
        return true;
    }

    // Entries recorded during the export stay open for the next flush
    entries.erase(entries.begin(),
                  std::next(entries.begin(),
                            static_cast<std::ptrdiff_t>(exported_count)));
    it->second.exporting = false;
    diagnostics()->warn(
        "Transaction {} received {} entries during export, kept open",
        trace_id, entries.size());
    return false;
}

void TransactionRegistry::abortExport(const std::string& trace_id) {
    std::unique_lock lock(mutex_);

    auto it = transactions_.find(trace_id);
    if (it != transactions_.end()) {
        it->second.exporting = false;
    }
}

// ============================================================================
// Settings
// ============================================================================

void TransactionRegistry::setLevel(Level level) {
    std::unique_lock lock(mutex_);
    threshold_ = level;
}

auto TransactionRegistry::getLevel() const -> Level {
    std::shared_lock lock(mutex_);
    return threshold_;
}

void TransactionRegistry::setLoggerName(const std::string& name) {
    std::unique_lock lock(mutex_);
    logger_name_ = name;
}

auto TransactionRegistry::getLoggerName() const -> std::string {
    std::shared_lock lock(mutex_);
    return logger_name_;
}

void TransactionRegistry::setServiceName(const std::string& name) {
    std::unique_lock lock(mutex_);
    service_name_ = name;
}

auto TransactionRegistry::getServiceName() const -> std::string {
    std::shared_lock lock(mutex_);
    return service_name_;
}

}  // namespace otellogger
