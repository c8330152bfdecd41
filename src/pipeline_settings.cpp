#include "pipeline_settings.h"
#include "config.h"
#include "logger.h"
#include <algorithm>

namespace {

// 30 days; keeps the millisecond conversion well inside int64_t
constexpr double MAX_TTL_SECONDS = 30.0 * 24.0 * 3600.0;

double clampThreshold(const Config& config, const char* key, double fallback) {
    double value = config.getDouble("concurrency", key, fallback);
    if (value < 0.0 || value > 1.0) {
        Logger::warning() << "[concurrency]:" << key << " = " << value
                          << " is outside [0, 1], clamping";
        value = std::clamp(value, 0.0, 1.0);
    }
    return value;
}

}  // namespace

PipelineSettings PipelineSettings::fromConfig(const Config& config) {
    PipelineSettings settings;

    // ========== Cache ==========
    int capacity = config.getInt("cache", "capacity", static_cast<int>(settings.cache.capacity));
    if (capacity < 0) {
        Logger::warning() << "[cache]:capacity must not be negative, using unbounded";
        capacity = 0;
    }
    settings.cache.capacity = static_cast<size_t>(capacity);

    double ttlSeconds = config.getDouble("cache", "ttl_seconds",
                                         settings.cache.ttl.count() / 1000.0);
    if (!(ttlSeconds >= 0.0)) {
        Logger::warning() << "[cache]:ttl_seconds must be a non-negative number, disabling expiry";
        ttlSeconds = 0.0;
    } else if (ttlSeconds > MAX_TTL_SECONDS) {
        Logger::warning() << "[cache]:ttl_seconds " << ttlSeconds << " is too large, using "
                          << MAX_TTL_SECONDS;
        ttlSeconds = MAX_TTL_SECONDS;
    }
    settings.cache.ttl = std::chrono::milliseconds(static_cast<int64_t>(ttlSeconds * 1000.0));
    settings.cache.sweepOnInsert = config.getBool("cache", "sweep_on_insert", settings.cache.sweepOnInsert);

    // ========== Concurrency ==========
    ConcurrencySettings& cc = settings.concurrency;
    int minPar = config.getInt("concurrency", "min_parallelism", static_cast<int>(cc.minParallelism));
    int maxPar = config.getInt("concurrency", "max_parallelism", static_cast<int>(cc.maxParallelism));
    minPar = std::max(1, minPar);
    maxPar = std::max(1, maxPar);
    if (minPar > maxPar) {
        Logger::warning() << "[concurrency]:min_parallelism (" << minPar
                          << ") exceeds max_parallelism (" << maxPar << "), swapping";
        std::swap(minPar, maxPar);
    }
    cc.minParallelism = static_cast<uint32_t>(minPar);
    cc.maxParallelism = static_cast<uint32_t>(maxPar);

    int initial = config.getInt("concurrency", "initial_limit", static_cast<int>(cc.initialLimit));
    int clampedInitial = std::clamp(initial, minPar, maxPar);
    if (clampedInitial != initial) {
        Logger::warning() << "[concurrency]:initial_limit " << initial << " clamped to " << clampedInitial;
    }
    cc.initialLimit = static_cast<uint32_t>(clampedInitial);

    cc.highCpuThreshold = clampThreshold(config, "high_cpu", cc.highCpuThreshold);
    cc.highMemThreshold = clampThreshold(config, "high_mem", cc.highMemThreshold);
    cc.lowCpuThreshold = clampThreshold(config, "low_cpu", cc.lowCpuThreshold);
    cc.lowMemThreshold = clampThreshold(config, "low_mem", cc.lowMemThreshold);
    if (cc.lowCpuThreshold > cc.highCpuThreshold) {
        Logger::warning() << "[concurrency]:low_cpu exceeds high_cpu, using high_cpu for both";
        cc.lowCpuThreshold = cc.highCpuThreshold;
    }
    if (cc.lowMemThreshold > cc.highMemThreshold) {
        Logger::warning() << "[concurrency]:low_mem exceeds high_mem, using high_mem for both";
        cc.lowMemThreshold = cc.highMemThreshold;
    }

    int maxAdjust = config.getInt("concurrency", "max_consecutive_adjustments",
                                  cc.maxConsecutiveAdjustments);
    cc.maxConsecutiveAdjustments = static_cast<uint8_t>(std::clamp(maxAdjust, 0, 255));

    int intervalMs = config.getInt("concurrency", "sample_interval_ms",
                                   static_cast<int>(cc.sampleInterval.count()));
    cc.sampleInterval = std::chrono::milliseconds(std::max(10, intervalMs));

    // ========== Scheduler ==========
    int passes = config.getInt("scheduler", "max_derived_passes", settings.scheduler.maxDerivedPasses);
    if (passes < 1) {
        Logger::warning() << "[scheduler]:max_derived_passes must be at least 1";
        passes = 1;
    }
    settings.scheduler.maxDerivedPasses = passes;
    settings.scheduler.neighborNotifications =
        config.getBool("scheduler", "neighbor_notifications", settings.scheduler.neighborNotifications);

    // ========== Misc ==========
    settings.blockDefinitions = config.getString("blocks", "definitions", settings.blockDefinitions);
    settings.logLevel = config.getString("logging", "level", settings.logLevel);

    return settings;
}
