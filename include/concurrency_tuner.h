/**
 * @file concurrency_tuner.h
 * @brief Background thread that feeds the concurrency controller on a fixed cadence
 *
 * The controller is sampled once per interval regardless of how many batches
 * ran. Throughput is the rate of change of a caller-supplied work counter.
 *
 * Usage:
 * @code
 *   ConcurrencyTuner tuner(controller, metrics,
 *                          [&] { return scheduler.totalRequestsApplied(); },
 *                          settings.concurrency.sampleInterval);
 *   tuner.start();
 *   // ...
 *   tuner.stop();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

class ConcurrencyController;
class SystemMetricsSource;

class ConcurrencyTuner {
public:
    /// Monotonic count of completed work items; throughput is its rate of change
    using WorkCounter = std::function<uint64_t()>;

    ConcurrencyTuner(ConcurrencyController& controller,
                     SystemMetricsSource& metrics,
                     WorkCounter completedWork,
                     std::chrono::milliseconds interval);
    ~ConcurrencyTuner();

    ConcurrencyTuner(const ConcurrencyTuner&) = delete;
    ConcurrencyTuner& operator=(const ConcurrencyTuner&) = delete;

    void start();

    /// Safe to call multiple times
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Takes one sample now; the background thread calls this each interval
     * @return Throughput (work items per second) that was reported
     */
    double tick();

    uint64_t sampleCount() const { return m_samples.load(); }

private:
    void threadMain();

    ConcurrencyController& m_controller;
    SystemMetricsSource& m_metrics;
    WorkCounter m_completedWork;
    std::chrono::milliseconds m_interval;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCV;

    std::mutex m_tickMutex;
    uint64_t m_lastCount = 0;
    std::chrono::steady_clock::time_point m_lastTick;
    std::atomic<uint64_t> m_samples{0};
};
