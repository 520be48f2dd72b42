/*
 * diagnostics.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Internal diagnostics logger

**************************************************/

#ifndef OTELLOGGER_CORE_DIAGNOSTICS_HPP
#define OTELLOGGER_CORE_DIAGNOSTICS_HPP

#include <memory>

#include <spdlog/logger.h>

namespace otellogger {

inline constexpr const char* DIAGNOSTICS_LOGGER_NAME = "otellogger";

/**
 * @brief Logger used for the library's own messages
 *
 * Registered with spdlog as "otellogger" and writing to stderr, so it never
 * mixes with ConsoleExporter output on stdout. An already registered logger
 * of that name is reused, which lets applications redirect it.
 *
 * @return Shared diagnostics logger
 */
[[nodiscard]] auto diagnostics() -> std::shared_ptr<spdlog::logger>;

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_DIAGNOSTICS_HPP
