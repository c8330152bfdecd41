#include "concurrency_tuner.h"
#include "concurrency_controller.h"
#include "system_metrics.h"
#include "logger.h"

ConcurrencyTuner::ConcurrencyTuner(ConcurrencyController& controller,
                                   SystemMetricsSource& metrics,
                                   WorkCounter completedWork,
                                   std::chrono::milliseconds interval)
    : m_controller(controller)
    , m_metrics(metrics)
    , m_completedWork(std::move(completedWork))
    , m_interval(interval)
    , m_lastTick(std::chrono::steady_clock::now())
{
    m_lastCount = m_completedWork ? m_completedWork() : 0;
}

ConcurrencyTuner::~ConcurrencyTuner() {
    stop();
}

void ConcurrencyTuner::start() {
    if (m_running.load()) {
        Logger::warning() << "ConcurrencyTuner already running";
        return;
    }

    m_running.store(true);
    m_thread = std::thread(&ConcurrencyTuner::threadMain, this);
    Logger::info() << "ConcurrencyTuner started (interval " << m_interval.count() << " ms)";
}

void ConcurrencyTuner::stop() {
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_running.store(false);
    }
    m_wakeCV.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }

    Logger::info() << "ConcurrencyTuner stopped after " << m_samples.load() << " samples";
}

double ConcurrencyTuner::tick() {
    std::lock_guard<std::mutex> lock(m_tickMutex);

    auto now = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(now - m_lastTick).count();
    uint64_t count = m_completedWork ? m_completedWork() : 0;
    uint64_t delta = count >= m_lastCount ? count - m_lastCount : 0;

    double throughput = elapsed > 0.0 ? static_cast<double>(delta) / elapsed : 0.0;
    m_lastCount = count;
    m_lastTick = now;

    SystemSample load = m_metrics.read();
    m_controller.sample(throughput, load.cpuUtilization, load.memoryPressure);
    m_samples++;

    Logger::debug() << "Tuner sample: " << throughput << " req/s, cpu " << load.cpuUtilization
                    << ", mem " << load.memoryPressure << " -> limit " << m_controller.currentLimit();
    return throughput;
}

void ConcurrencyTuner::threadMain() {
    std::unique_lock<std::mutex> lock(m_wakeMutex);
    while (m_running.load()) {
        if (m_wakeCV.wait_for(lock, m_interval, [this] { return !m_running.load(); })) {
            break;
        }

        lock.unlock();
        tick();
        lock.lock();
    }
}
