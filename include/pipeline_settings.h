/**
 * @file pipeline_settings.h
 * @brief Tunables for the chunk cache, concurrency controller and batch scheduler
 *
 * Every struct has working defaults; PipelineSettings::fromConfig() overlays
 * whatever the INI file provides and repairs values that would break an
 * invariant (for example min_parallelism > max_parallelism).
 *
 * Example config.ini:
 * @code
 * [cache]
 * capacity = 512
 * ttl_seconds = 60
 *
 * [concurrency]
 * min_parallelism = 1
 * max_parallelism = 8
 * initial_limit = 4
 * high_cpu = 0.85
 *
 * [scheduler]
 * max_derived_passes = 4
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

class Config;

struct CacheSettings {
    size_t capacity = 512;                          ///< Max live entries (0 = unbounded)
    std::chrono::milliseconds ttl{60000};           ///< Entry lifetime (0 = never expires)
    bool sweepOnInsert = true;                      ///< Drop expired entries before each insert
};

struct ConcurrencySettings {
    uint32_t minParallelism = 1;
    uint32_t maxParallelism = 8;
    uint32_t initialLimit = 4;

    double highCpuThreshold = 0.85;
    double highMemThreshold = 0.85;
    double lowCpuThreshold = 0.50;
    double lowMemThreshold = 0.70;

    uint8_t maxConsecutiveAdjustments = 3;          ///< Increases allowed before a cooldown cycle
    std::chrono::milliseconds sampleInterval{500};  ///< Tuner cadence
};

struct SchedulerSettings {
    int maxDerivedPasses = 4;                       ///< drain() iteration cap
    bool neighborNotifications = true;              ///< Synthesize face-neighbour physics updates
};

struct PipelineSettings {
    CacheSettings cache;
    ConcurrencySettings concurrency;
    SchedulerSettings scheduler;
    std::string blockDefinitions;                   ///< Path to block YAML ("" = built-in set)
    std::string logLevel = "info";

    /**
     * @brief Reads [cache], [concurrency], [scheduler], [blocks] and [logging]
     *
     * Missing keys keep their defaults. Invalid combinations are corrected
     * and logged as warnings.
     */
    static PipelineSettings fromConfig(const Config& config);
};
