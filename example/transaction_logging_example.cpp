/*
 * transaction_logging_example.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Example demonstrating transaction logging and export

*************************************************/

#include "otellogger.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <thread>
#include <vector>

using namespace otellogger;

class TransactionLoggingExample {
public:
    explicit TransactionLoggingExample(const std::string& config_path)
        : config_path_(config_path) {}

    void runExample() {
        spdlog::info("Starting transaction logging example");

        demonstrateConsoleExport();
        demonstrateConcurrentTransactions();

        spdlog::info("Transaction logging example completed");
    }

private:
    void demonstrateConsoleExport() {
        std::cout << "\n=== Console Export Demo ===\n";

        Logger logger(Level::DEBUG);
        auto trace_id = logger.startTransaction({{"request", "GET /orders"}});

        logger.debug("parsing request", trace_id, {{"bytes", "512"}});
        logger.info("loading orders", trace_id, {{"customer", "42"}});
        logger.warning("slow query", trace_id, {{"elapsed_ms", "850"}});

        logger.exportLogs(trace_id);
    }

    void demonstrateConcurrentTransactions() {
        std::cout << "\n=== Concurrent Transactions Demo ===\n";

        Logger logger(Level::INFO);
        if (!config_path_.empty()) {
            logger.withConfig(config_path_);
            logger.withExporter(std::make_shared<JsonFileExporter>());
        }

        std::vector<std::thread> workers;
        for (int i = 0; i < 4; ++i) {
            workers.emplace_back([&logger, i]() {
                auto trace_id = logger.startTransaction(
                    {{"worker", std::to_string(i)}});
                logger.info("job started", trace_id);
                logger.debug("not recorded at INFO", trace_id);
                logger.info("job finished", trace_id);
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        auto flushed = logger.exportAllLogs();
        std::cout << "Flushed " << flushed << " transactions\n";
    }

    std::string config_path_;
};

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "";

    try {
        TransactionLoggingExample example(config_path);
        example.runExample();
    } catch (const std::exception& e) {
        spdlog::error("Example failed: {}", e.what());
        return 1;
    }

    return 0;
}
