#include "system_metrics.h"
#include "logger.h"
#include <algorithm>
#include <fstream>
#include <sstream>

ProcSystemMetrics::ProcSystemMetrics(std::string procRoot)
    : m_procRoot(std::move(procRoot))
{
    if (!readCpuTimes(m_lastCpu)) {
        Logger::warning() << "Cannot read " << m_procRoot << "/stat, CPU utilisation will report 0";
        m_warned = true;
    }
}

bool ProcSystemMetrics::readCpuTimes(CpuTimes& out) const {
    std::ifstream file(m_procRoot + "/stat");
    if (!file.is_open()) {
        return false;
    }

    // First line: "cpu  user nice system idle iowait irq softirq steal ..."
    std::string line;
    if (!std::getline(file, line) || line.compare(0, 3, "cpu") != 0) {
        return false;
    }

    std::istringstream fields(line.substr(3));
    uint64_t values[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    int parsed = 0;
    while (parsed < 8 && fields >> values[parsed]) {
        ++parsed;
    }
    if (parsed < 4) {
        return false;
    }

    uint64_t idle = values[3] + values[4];  // idle + iowait
    uint64_t total = 0;
    for (int i = 0; i < parsed; ++i) {
        total += values[i];
    }

    out.total = total;
    out.busy = total - idle;
    return true;
}

bool ProcSystemMetrics::readMemoryPressure(double& out) const {
    std::ifstream file(m_procRoot + "/meminfo");
    if (!file.is_open()) {
        return false;
    }

    uint64_t memTotal = 0;
    uint64_t memAvailable = 0;
    bool haveAvailable = false;

    std::string name;
    uint64_t value = 0;
    std::string unit;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        if (!(fields >> name >> value)) {
            continue;
        }
        if (name == "MemTotal:") {
            memTotal = value;
        } else if (name == "MemAvailable:") {
            memAvailable = value;
            haveAvailable = true;
        }
    }

    if (memTotal == 0 || !haveAvailable) {
        return false;
    }

    out = 1.0 - static_cast<double>(std::min(memAvailable, memTotal)) / static_cast<double>(memTotal);
    return true;
}

SystemSample ProcSystemMetrics::read() {
    std::lock_guard<std::mutex> lock(m_mutex);

    CpuTimes now;
    if (readCpuTimes(now)) {
        uint64_t totalDelta = now.total > m_lastCpu.total ? now.total - m_lastCpu.total : 0;
        uint64_t busyDelta = now.busy > m_lastCpu.busy ? now.busy - m_lastCpu.busy : 0;
        if (totalDelta > 0) {
            m_last.cpuUtilization = std::clamp(static_cast<double>(busyDelta) / static_cast<double>(totalDelta), 0.0, 1.0);
        }
        m_lastCpu = now;
    } else if (!m_warned) {
        Logger::warning() << "Cannot read " << m_procRoot << "/stat, reusing last CPU sample";
        m_warned = true;
    }

    double memory = 0.0;
    if (readMemoryPressure(memory)) {
        m_last.memoryPressure = memory;
    } else if (!m_warned) {
        Logger::warning() << "Cannot read " << m_procRoot << "/meminfo, reusing last memory sample";
        m_warned = true;
    }

    return m_last;
}

FixedSystemMetrics::FixedSystemMetrics(double cpu, double memory) {
    m_sample.cpuUtilization = cpu;
    m_sample.memoryPressure = memory;
}

void FixedSystemMetrics::set(double cpu, double memory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sample.cpuUtilization = cpu;
    m_sample.memoryPressure = memory;
}

SystemSample FixedSystemMetrics::read() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sample;
}
