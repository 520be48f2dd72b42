/*
 * diagnostics.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "diagnostics.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace otellogger {

auto diagnostics() -> std::shared_ptr<spdlog::logger> {
    static std::mutex mutex;
    std::lock_guard lock(mutex);

    auto logger = spdlog::get(DIAGNOSTICS_LOGGER_NAME);
    if (logger) {
        return logger;
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    logger = std::make_shared<spdlog::logger>(DIAGNOSTICS_LOGGER_NAME, sink);
    spdlog::initialize_logger(logger);
    return logger;
}

}  // namespace otellogger
