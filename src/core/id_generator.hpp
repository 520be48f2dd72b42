/*
 * id_generator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Trace and span identifier providers

**************************************************/

#ifndef OTELLOGGER_CORE_ID_GENERATOR_HPP
#define OTELLOGGER_CORE_ID_GENERATOR_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace otellogger {

/**
 * @brief Source of trace and span identifiers
 *
 * Identifiers are decimal renderings of non-negative 63-bit integers.
 * Implementations must be safe to call from several threads.
 */
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * @brief Generate a candidate trace ID for a new transaction
     *
     * Uniqueness among open transactions is enforced by the registry, which
     * asks again on collision.
     */
    virtual auto nextTraceId() -> std::string = 0;

    /**
     * @brief Generate a span ID, unique within the process lifetime
     */
    virtual auto nextSpanId() -> std::string = 0;
};

/**
 * @brief Default identifier provider
 *
 * Trace IDs are uniformly random. Span IDs come from a randomly seeded
 * counter so they never repeat until the 63-bit space wraps.
 */
class RandomIdGenerator : public IdGenerator {
public:
    RandomIdGenerator();

    auto nextTraceId() -> std::string override;
    auto nextSpanId() -> std::string override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
    std::uniform_int_distribution<std::int64_t> distribution_;
    std::atomic<std::uint64_t> span_counter_;
};

}  // namespace otellogger

#endif  // OTELLOGGER_CORE_ID_GENERATOR_HPP
