/**
 * @file concurrency_controller.h
 * @brief Feedback-controlled parallelism budget shared by batch consumers
 *
 * The controller owns a single number, the current parallelism limit, and
 * moves it by at most one step per sample() based on CPU load, memory
 * pressure and whether throughput is still improving.
 *
 * THREAD SAFETY:
 * - currentLimit() is a lock-free atomic read, callable from any thread
 * - sample() serialises writers with a mutex; readers never wait on it
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include "pipeline_settings.h"

/**
 * @brief Which branch of the adjustment policy a sample took
 */
enum class AdjustmentReason : uint8_t {
    None,               ///< No sample taken yet
    ResourceShortage,   ///< CPU or memory above the high threshold: step down
    Headroom,           ///< Load low and throughput rising: step up
    Cooldown,           ///< Too many consecutive increases: hold and reset
    Hold,               ///< Nothing matched: hold
    InvalidSample       ///< Non-finite input: hold
};

const char* toString(AdjustmentReason reason);

/**
 * @brief Coarse memory pressure bands used in log output
 */
enum class PressureLevel : uint8_t {
    Low,        ///< < 0.5
    Normal,     ///< [0.5, 0.7)
    Medium,     ///< [0.7, 0.85)
    High,       ///< [0.85, 0.95)
    Critical    ///< >= 0.95
};

PressureLevel classifyPressure(double memoryPressure);
const char* toString(PressureLevel level);

/**
 * @brief Mutable controller state; written only inside sample()
 */
struct ConcurrencyState {
    uint32_t currentLimit = 1;
    double lastThroughputSample = 0.0;
    uint8_t consecutiveAdjustments = 0;
    std::chrono::steady_clock::time_point lastSampleTime{};
    AdjustmentReason lastReason = AdjustmentReason::None;
};

class ConcurrencyController {
public:
    explicit ConcurrencyController(const ConcurrencySettings& settings);

    ConcurrencyController(const ConcurrencyController&) = delete;
    ConcurrencyController& operator=(const ConcurrencyController&) = delete;

    /// Live parallelism budget; never blocks
    uint32_t currentLimit() const { return m_limit.load(std::memory_order_acquire); }

    /**
     * @brief Applies one step of the adjustment policy
     *
     * Policy, first match wins:
     * 1. cpu > highCpu or mem > highMem: limit - 1 (floor min), counter reset
     * 2. cpu < lowCpu and mem < lowMem and throughput rose: limit + 1 (ceiling max), counter + 1
     * 3. counter > maxConsecutiveAdjustments: hold, counter reset
     * 4. otherwise hold
     *
     * Non-finite inputs hold the limit for this cycle. Finite utilisations
     * outside [0, 1] are clamped first.
     */
    void sample(double observedThroughput, double cpuUtilization, double memoryPressure);

    /// Copy of the state as of the last sample()
    ConcurrencyState state() const;

    const ConcurrencySettings& settings() const { return m_settings; }

private:
    ConcurrencySettings m_settings;
    std::atomic<uint32_t> m_limit;

    mutable std::mutex m_stateMutex;
    ConcurrencyState m_state;
};
