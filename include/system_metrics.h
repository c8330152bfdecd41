/**
 * @file system_metrics.h
 * @brief CPU and memory load sources consumed by the concurrency tuner
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

/**
 * @brief One load observation, both values in [0, 1]
 */
struct SystemSample {
    double cpuUtilization = 0.0;
    double memoryPressure = 0.0;
};

/**
 * @brief Interface for anything that can report current system load
 */
class SystemMetricsSource {
public:
    virtual ~SystemMetricsSource() = default;

    /// Must be safe to call from the tuner thread
    virtual SystemSample read() = 0;
};

/**
 * @brief Linux load source backed by /proc/stat and /proc/meminfo
 *
 * CPU utilisation is the busy fraction of jiffies since the previous read(),
 * so the first read() after construction measures since construction.
 * Memory pressure is 1 - MemAvailable / MemTotal.
 *
 * If a proc file cannot be read the previous value is reported again and a
 * warning is logged once.
 */
class ProcSystemMetrics : public SystemMetricsSource {
public:
    explicit ProcSystemMetrics(std::string procRoot = "/proc");

    SystemSample read() override;

private:
    struct CpuTimes {
        uint64_t busy = 0;
        uint64_t total = 0;
    };

    bool readCpuTimes(CpuTimes& out) const;
    bool readMemoryPressure(double& out) const;

    std::string m_procRoot;
    std::mutex m_mutex;
    CpuTimes m_lastCpu;
    SystemSample m_last;
    bool m_warned = false;
};

/**
 * @brief Reports whatever was last set; used by tests and the bench's --fixed-load mode
 */
class FixedSystemMetrics : public SystemMetricsSource {
public:
    FixedSystemMetrics(double cpu = 0.0, double memory = 0.0);

    void set(double cpu, double memory);
    SystemSample read() override;

private:
    std::mutex m_mutex;
    SystemSample m_sample;
};
