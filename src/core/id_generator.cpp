/*
 * id_generator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "id_generator.hpp"

#include <limits>

namespace otellogger {

namespace {
constexpr std::uint64_t ID_MASK =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
}  // namespace

RandomIdGenerator::RandomIdGenerator()
    : engine_(std::random_device{}()),
      distribution_(0, std::numeric_limits<std::int64_t>::max()),
      span_counter_(0) {
    span_counter_.store(static_cast<std::uint64_t>(distribution_(engine_)));
}

auto RandomIdGenerator::nextTraceId() -> std::string {
    std::lock_guard lock(mutex_);
    return std::to_string(distribution_(engine_));
}

auto RandomIdGenerator::nextSpanId() -> std::string {
    auto value = span_counter_.fetch_add(1, std::memory_order_relaxed) & ID_MASK;
    return std::to_string(value);
}

}  // namespace otellogger
