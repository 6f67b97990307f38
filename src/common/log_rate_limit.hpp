// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging.
// Emits the first invocation and then every Nth one at the given level.
// Usage: STRAFE_LOG_EVERY_N(warn, 50, "[ingest] rejected player={} reason={}", id, why);
// Message validation in the tick loop logs through this macro.
#define STRAFE_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> strafe_log_counter_{0}; \
        if ((strafe_log_counter_.fetch_add(1, std::memory_order_relaxed) % (N)) == 0) { \
            strafe::log::level(__VA_ARGS__); \
        } \
    } while (0)
