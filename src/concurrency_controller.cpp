#include "concurrency_controller.h"
#include "logger.h"
#include <algorithm>
#include <cmath>

const char* toString(AdjustmentReason reason) {
    switch (reason) {
        case AdjustmentReason::None:             return "none";
        case AdjustmentReason::ResourceShortage: return "resource shortage";
        case AdjustmentReason::Headroom:         return "headroom";
        case AdjustmentReason::Cooldown:         return "cooldown";
        case AdjustmentReason::Hold:             return "hold";
        case AdjustmentReason::InvalidSample:    return "invalid sample";
    }
    return "unknown";
}

PressureLevel classifyPressure(double memoryPressure) {
    if (memoryPressure >= 0.95) return PressureLevel::Critical;
    if (memoryPressure >= 0.85) return PressureLevel::High;
    if (memoryPressure >= 0.70) return PressureLevel::Medium;
    if (memoryPressure >= 0.50) return PressureLevel::Normal;
    return PressureLevel::Low;
}

const char* toString(PressureLevel level) {
    switch (level) {
        case PressureLevel::Low:      return "low";
        case PressureLevel::Normal:   return "normal";
        case PressureLevel::Medium:   return "medium";
        case PressureLevel::High:     return "high";
        case PressureLevel::Critical: return "critical";
    }
    return "unknown";
}

ConcurrencyController::ConcurrencyController(const ConcurrencySettings& settings)
    : m_settings(settings)
    , m_limit(0)
{
    if (m_settings.minParallelism == 0) {
        m_settings.minParallelism = 1;
    }
    if (m_settings.maxParallelism < m_settings.minParallelism) {
        m_settings.maxParallelism = m_settings.minParallelism;
    }

    m_state.currentLimit = std::clamp(m_settings.initialLimit,
                                      m_settings.minParallelism,
                                      m_settings.maxParallelism);
    m_state.lastSampleTime = std::chrono::steady_clock::now();
    m_limit.store(m_state.currentLimit, std::memory_order_release);

    Logger::info() << "ConcurrencyController starting at limit " << m_state.currentLimit
                   << " (bounds " << m_settings.minParallelism << "-" << m_settings.maxParallelism << ")";
}

void ConcurrencyController::sample(double observedThroughput, double cpuUtilization, double memoryPressure) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_state.lastSampleTime = std::chrono::steady_clock::now();

    if (!std::isfinite(observedThroughput) || !std::isfinite(cpuUtilization) || !std::isfinite(memoryPressure)) {
        m_state.lastReason = AdjustmentReason::InvalidSample;
        if (std::isfinite(observedThroughput)) {
            m_state.lastThroughputSample = observedThroughput;
        }
        Logger::debug() << "Ignoring non-finite concurrency sample";
        return;
    }

    double cpu = std::clamp(cpuUtilization, 0.0, 1.0);
    double mem = std::clamp(memoryPressure, 0.0, 1.0);
    uint32_t previous = m_state.currentLimit;

    if (cpu > m_settings.highCpuThreshold || mem > m_settings.highMemThreshold) {
        m_state.currentLimit = std::max(m_settings.minParallelism, previous > 0 ? previous - 1 : 0);
        m_state.consecutiveAdjustments = 0;
        m_state.lastReason = AdjustmentReason::ResourceShortage;
    } else if (cpu < m_settings.lowCpuThreshold &&
               mem < m_settings.lowMemThreshold &&
               observedThroughput > m_state.lastThroughputSample) {
        m_state.currentLimit = std::min(m_settings.maxParallelism, previous + 1);
        if (m_state.consecutiveAdjustments < UINT8_MAX) {
            m_state.consecutiveAdjustments++;
        }
        m_state.lastReason = AdjustmentReason::Headroom;
    } else if (m_state.consecutiveAdjustments > m_settings.maxConsecutiveAdjustments) {
        m_state.consecutiveAdjustments = 0;
        m_state.lastReason = AdjustmentReason::Cooldown;
    } else {
        m_state.lastReason = AdjustmentReason::Hold;
    }

    m_state.lastThroughputSample = observedThroughput;
    m_limit.store(m_state.currentLimit, std::memory_order_release);

    if (m_state.currentLimit != previous) {
        Logger::info() << "Concurrency limit " << previous << " -> " << m_state.currentLimit
                       << " (" << toString(m_state.lastReason) << ", cpu " << cpu
                       << ", memory " << toString(classifyPressure(mem)) << ")";
    }
}

ConcurrencyState ConcurrencyController::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}
