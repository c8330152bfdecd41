/**
 * @file perf_monitor.cpp
 * @brief Implementation of performance monitoring system
 */

#include "perf_monitor.h"
#include "logger.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

// ============================================================================
// ScopedTimer Implementation
// ============================================================================

ScopedTimer::ScopedTimer(const std::string& label)
    : m_label(label)
    , m_start(std::chrono::steady_clock::now())
{
}

ScopedTimer::~ScopedTimer() {
    auto end = std::chrono::steady_clock::now();
    double milliseconds = std::chrono::duration<double, std::milli>(end - m_start).count();
    PerformanceMonitor::instance().recordTiming(m_label, milliseconds);
}

// ============================================================================
// PerformanceMonitor Implementation
// ============================================================================

PerformanceMonitor& PerformanceMonitor::instance() {
    static PerformanceMonitor instance;
    return instance;
}

void PerformanceMonitor::recordTiming(const std::string& label, double milliseconds) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    TimingStats& stats = m_timings[label];
    stats.count++;
    stats.totalMs += milliseconds;
    stats.maxMs = std::max(stats.maxMs, milliseconds);
}

void PerformanceMonitor::incrementCounter(const std::string& label, uint64_t amount) {
    if (!m_enabled) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_counters[label] += amount;
}

TimingStats PerformanceMonitor::getTiming(const std::string& label) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_timings.find(label);
    return it != m_timings.end() ? it->second : TimingStats{};
}

uint64_t PerformanceMonitor::getCounter(const std::string& label) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_counters.find(label);
    return it != m_counters.end() ? it->second : 0;
}

void PerformanceMonitor::printReport() const {
    if (!m_enabled) return;

    // Format under the lock, log outside it
    std::ostringstream report;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        report << std::fixed << std::setprecision(2);
        report << "\n=========================== Pipeline Performance ===========================\n";

        if (m_timings.empty() && m_counters.empty()) {
            report << "No data collected yet.\n";
        }

        for (const auto& [label, stats] : m_timings) {
            report << std::left << std::setw(24) << label
                   << " n=" << stats.count
                   << " avg=" << stats.averageMs() << " ms"
                   << " max=" << stats.maxMs << " ms\n";
        }
        for (const auto& [label, value] : m_counters) {
            report << std::left << std::setw(24) << label << " " << value << "\n";
        }
        report << "============================================================================";
    }

    Logger::info() << report.str();
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timings.clear();
    m_counters.clear();
}
