/**
 * @file main.cpp
 * @brief Bench driver for the chunk cache and batch pipeline
 *
 * Streams random block and entity edits through the scheduler while the
 * concurrency tuner samples system load, then prints cache statistics and
 * the performance report.
 *
 * Usage:
 *   chunk_pipeline_bench [--config FILE] [--rounds N] [--requests N]
 *                        [--radius R] [--fixed-load CPU MEM] [--debug]
 */

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "bench_options.h"
#include "block_registry.h"
#include "chunk_cache.h"
#include "chunk_data.h"
#include "concurrency_controller.h"
#include "concurrency_tuner.h"
#include "config.h"
#include "logger.h"
#include "perf_monitor.h"
#include "pipeline_settings.h"
#include "spatial_batch_scheduler.h"
#include "system_metrics.h"

namespace {

std::vector<UpdateRequest> makeRandomEdits(std::mt19937& rng, int count, int radius, int surfaceHeight) {
    const int extent = (radius + 1) * ChunkDims::WIDTH;
    std::uniform_int_distribution<int> horizontal(-extent, extent - 1);
    std::uniform_int_distribution<int> vertical(surfaceHeight - 8, surfaceHeight + 8);
    std::uniform_int_distribution<int> blockPick(0, 7);
    std::uniform_int_distribution<int> kindPick(0, 9);
    std::uniform_real_distribution<float> step(-1.0f, 1.0f);

    std::vector<UpdateRequest> requests;
    requests.reserve(count);
    for (int i = 0; i < count; ++i) {
        glm::ivec3 pos(horizontal(rng), vertical(rng), horizontal(rng));
        if (kindPick(rng) == 0) {
            uint32_t entityID = static_cast<uint32_t>(i % 64);
            requests.push_back(UpdateRequest::entity(pos, entityID, glm::vec3(step(rng), 0.0f, step(rng))));
        } else {
            requests.push_back(UpdateRequest::block(pos, blockPick(rng)));
        }
    }
    return requests;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        BenchOptions options = parseBenchOptions(argc, argv);
        if (options.help) {
            printBenchUsage();
            return 0;
        }

        // Load configuration first
        Config& config = Config::instance();
        if (!config.loadFromFile(options.configPath)) {
            Logger::warning() << "Failed to load " << options.configPath << ", using default values";
        }

        PipelineSettings settings = PipelineSettings::fromConfig(config);
        Logger::setMinLevel(options.debug ? LogLevel::DEBUG : Logger::parseLevel(settings.logLevel));
        PerformanceMonitor::instance().setEnabled(config.getBool("bench", "perf_monitor", true));

        BlockRegistry blocks = BlockRegistry::withDefaults();
        if (!settings.blockDefinitions.empty() && !blocks.loadFromFile(settings.blockDefinitions)) {
            Logger::warning() << "Block definitions incomplete, continuing with built-in set";
        }

        const int surfaceHeight = config.getInt("bench", "surface_height", 64);
        const int loaderLatencyMs = config.getInt("bench", "loader_latency_ms", 2);
        const int stoneID = std::max(0, blocks.idForName("stone"));

        ChunkDataCache cache(
            [&](const ChunkKey& key) {
                if (loaderLatencyMs > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(loaderLatencyMs));
                }
                return ChunkData::flat(key, surfaceHeight, stoneID);
            },
            settings.cache);

        ConcurrencyController controller(settings.concurrency);
        SpatialBatchScheduler scheduler(cache, controller, blocks, settings.scheduler);

        std::unique_ptr<SystemMetricsSource> metrics;
        if (options.fixedLoad) {
            Logger::info() << "Using fixed load: cpu " << options.fixedCpu << ", mem " << options.fixedMem;
            metrics = std::make_unique<FixedSystemMetrics>(options.fixedCpu, options.fixedMem);
        } else {
            metrics = std::make_unique<ProcSystemMetrics>();
        }

        ConcurrencyTuner tuner(controller, *metrics,
                               [&scheduler]() { return scheduler.totalRequestsApplied(); },
                               settings.concurrency.sampleInterval);

        Logger::info() << "Prefetching radius " << options.radius << " around origin...";
        size_t prefetched = cache.prefetch(ChunkKey{0, 0}, options.radius);
        Logger::info() << "Prefetched " << prefetched << " chunks";

        tuner.start();

        std::mt19937 rng(config.getInt("bench", "seed", 1337));
        ApplySummary total;
        auto benchStart = std::chrono::steady_clock::now();

        for (int round = 0; round < options.rounds; ++round) {
            std::vector<UpdateRequest> edits = makeRandomEdits(rng, options.requestsPerRound,
                                                               options.radius, surfaceHeight);
            try {
                total.merge(scheduler.submit(edits));
                total.merge(scheduler.drain());
            } catch (const BatchError& e) {
                Logger::error() << "Round " << round << " failed: " << e.what();
            }

            Logger::info() << "Round " << (round + 1) << "/" << options.rounds
                           << " limit=" << controller.currentLimit()
                           << " applied=" << total.requestsApplied
                           << " cached=" << cache.size();
        }

        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - benchStart).count();
        tuner.stop();

        CacheStats stats = cache.stats();
        ConcurrencyState state = controller.state();

        std::cout << "\n=== Chunk Pipeline Bench ===\n"
                  << "Requests applied:   " << total.requestsApplied << "\n"
                  << "Requests rejected:  " << total.requestsRejected << "\n"
                  << "Derived queued:     " << total.derivedRequestsQueued << "\n"
                  << "Chunks touched:     " << total.chunksTouched << "\n"
                  << "Group failures:     " << total.failures.size() << "\n"
                  << "Throughput:         " << (seconds > 0.0 ? total.requestsApplied / seconds : 0.0) << " req/s\n"
                  << "Cache hits/misses:  " << stats.hits << " / " << stats.misses
                  << " (hit rate " << (stats.hitRate * 100.0) << "%)\n"
                  << "Cache size:         " << stats.size << " (evictions " << stats.evictions << ")\n"
                  << "Final limit:        " << state.currentLimit
                  << " (" << toString(state.lastReason) << ")\n"
                  << "Tuner samples:      " << tuner.sampleCount() << "\n";

        PerformanceMonitor::instance().printReport();
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        printBenchUsage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return 1;
    }
}
