/**
 * @file cache_entry.h
 * @brief Per-key bookkeeping for the chunk cache
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

using CacheClock = std::chrono::steady_clock;

/// Source of "now" for the cache; tests substitute a manual clock
using TimeSource = std::function<CacheClock::time_point()>;

inline CacheClock::time_point steadyNow() {
    return CacheClock::now();
}

/**
 * @brief A loaded chunk plus the timestamps eviction decisions are based on
 *
 * insertionSeq breaks ties between entries with identical lastAccessed
 * values, so eviction order is reproducible under a frozen clock.
 */
template<typename V>
struct CacheEntry {
    V value;
    CacheClock::time_point insertedAt;
    CacheClock::time_point lastAccessed;
    uint64_t insertionSeq = 0;
};

/**
 * @brief Snapshot of cache counters
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t size = 0;
    double hitRate = 0.0;          ///< hits / (hits + misses), 0 when no requests yet

    uint64_t loads = 0;            ///< Loader invocations that succeeded
    uint64_t loadFailures = 0;     ///< Loader invocations that threw
    uint64_t evictions = 0;        ///< Entries removed by TTL or LRU
    size_t inFlight = 0;           ///< Loads currently running
};
