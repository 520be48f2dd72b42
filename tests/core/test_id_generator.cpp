/*
 * test_id_generator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2025-3-10

Description: Tests for trace and span identifier generation

**************************************************/

#include <gtest/gtest.h>

#include "core/id_generator.hpp"

#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace otellogger;

namespace {

auto isDecimalInt63(const std::string& id) -> bool {
    if (id.empty() || id.size() > 19) {
        return false;
    }
    for (char c : id) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    auto value = std::stoull(id);
    return value <= static_cast<unsigned long long>(INT64_MAX);
}

}  // namespace

TEST(RandomIdGeneratorTest, TraceIdsAreNonNegativeDecimal) {
    RandomIdGenerator generator;
    for (int i = 0; i < 100; ++i) {
        auto id = generator.nextTraceId();
        EXPECT_TRUE(isDecimalInt63(id)) << id;
    }
}

TEST(RandomIdGeneratorTest, SpanIdsAreNonNegativeDecimal) {
    RandomIdGenerator generator;
    for (int i = 0; i < 100; ++i) {
        auto id = generator.nextSpanId();
        EXPECT_TRUE(isDecimalInt63(id)) << id;
    }
}

TEST(RandomIdGeneratorTest, SpanIdsAreUnique) {
    RandomIdGenerator generator;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(generator.nextSpanId()).second);
    }
}

TEST(RandomIdGeneratorTest, ConcurrentSpanIdsAreUnique) {
    RandomIdGenerator generator;
    std::mutex mutex;
    std::set<std::string> seen;
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < 200; ++i) {
                local.push_back(generator.nextSpanId());
            }
            std::lock_guard lock(mutex);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(seen.size(), 8u * 200u);
}
