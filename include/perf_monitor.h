/**
 * @file perf_monitor.h
 * @brief Timing and counter collection for the streaming pipeline
 *
 * Tracks how long cache loads and batch passes take so a bench run can show
 * where time goes as the concurrency limit moves.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <map>
#include <mutex>

/**
 * @brief Scoped timer for automatic timing measurements
 *
 * Usage:
 * @code
 *   {
 *       ScopedTimer timer("cache_load");
 *       // ... code to measure ...
 *   }  // Timer records into PerformanceMonitor when destroyed
 * @endcode
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string m_label;
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief Aggregated samples for one timing label
 */
struct TimingStats {
    uint64_t count = 0;
    double totalMs = 0.0;
    double maxMs = 0.0;

    double averageMs() const { return count > 0 ? totalMs / static_cast<double>(count) : 0.0; }
};

/**
 * @brief Singleton performance monitor
 *
 * Disabled by default; recording calls return immediately until
 * setEnabled(true). Thread-safe.
 */
class PerformanceMonitor {
public:
    static PerformanceMonitor& instance();

    void recordTiming(const std::string& label, double milliseconds);
    void incrementCounter(const std::string& label, uint64_t amount = 1);

    TimingStats getTiming(const std::string& label) const;
    uint64_t getCounter(const std::string& label) const;

    /// Logs every timing and counter at INFO level
    void printReport() const;
    void reset();

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

private:
    PerformanceMonitor() = default;
    ~PerformanceMonitor() = default;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    std::atomic<bool> m_enabled{false};
    std::map<std::string, TimingStats> m_timings;
    std::map<std::string, uint64_t> m_counters;
    mutable std::mutex m_mutex;
};

#define PERF_CONCAT_INNER(a, b) a##b
#define PERF_CONCAT(a, b) PERF_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under @p label
 */
#define PERF_SCOPE(label) ScopedTimer PERF_CONCAT(perfTimer_, __LINE__)(label)
