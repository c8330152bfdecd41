/**
 * @file spatial_batch_scheduler.h
 * @brief Applies update requests chunk-by-chunk with adaptive parallelism
 *
 * A pass works like this:
 * 1. Requests are partitioned into one UpdateBatch per chunk key
 * 2. The controller's limit is read once; min(limit, batches) workers run the pass
 * 3. Each batch copies its chunk out of the cache, applies every request in
 *    order and writes the copy back with ChunkCache::put()
 * 4. Applied block changes queue neighbor notifications and lighting
 *    updates, which flushDerived() applies in a later pass
 *
 * Batches for different keys run in any order; requests for one key are
 * applied in submission order, so the last write to a position wins.
 * Passes are serialized. submit() does not return until every batch of its
 * pass has either been written back, failed or been abandoned.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>
#include "chunk_cache.h"
#include "chunk_data.h"
#include "pipeline_errors.h"
#include "pipeline_settings.h"
#include "update_request.h"

class BlockRegistry;
class ConcurrencyController;

using ChunkDataCache = ChunkCache<ChunkData>;

/**
 * @brief Shared cancel flag; copies observe the same state
 *
 * Batches that have not written back when the token fires are abandoned.
 * A batch that already wrote back stays applied.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

struct GroupFailure {
    ChunkKey key;
    BatchErrorKind kind = BatchErrorKind::ChunkUnavailable;
    std::string reason;
};

struct ApplySummary {
    size_t chunksTouched = 0;           ///< Batches written back
    size_t requestsApplied = 0;
    size_t requestsRejected = 0;        ///< Outside the vertical range
    size_t derivedRequestsQueued = 0;
    size_t chunksCancelled = 0;
    bool cancelled = false;
    std::vector<GroupFailure> failures;

    bool hasFailures() const { return !failures.empty(); }

    /// Accumulates another pass into this one (used by drain)
    void merge(const ApplySummary& other);
};

class SpatialBatchScheduler {
public:
    /**
     * @brief Starts the worker pool sized to the controller's max parallelism
     */
    SpatialBatchScheduler(ChunkDataCache& cache,
                          ConcurrencyController& controller,
                          const BlockRegistry& blocks,
                          const SchedulerSettings& settings = SchedulerSettings());
    ~SpatialBatchScheduler();

    SpatialBatchScheduler(const SpatialBatchScheduler&) = delete;
    SpatialBatchScheduler& operator=(const SpatialBatchScheduler&) = delete;

    /**
     * @brief Applies @p requests and queues the updates they imply
     * @throws BatchError (AllGroupsFailed) if every batch failed
     */
    ApplySummary submit(const std::vector<UpdateRequest>& requests,
                        CancellationToken token = CancellationToken());

    /**
     * @brief Applies the derived requests queued by earlier passes
     * @throws BatchError (AllGroupsFailed) if every batch failed
     */
    ApplySummary flushDerived(CancellationToken token = CancellationToken());

    /**
     * @brief Runs flushDerived() until nothing is queued or @p maxPasses is hit
     *
     * A pass that throws ends the drain; the exception propagates.
     */
    ApplySummary drain(int maxPasses);
    ApplySummary drain() { return drain(m_settings.maxDerivedPasses); }

    size_t pendingDerivedCount() const;

    /// Monotonic count of applied requests, for throughput sampling
    uint64_t totalRequestsApplied() const { return m_totalApplied.load(); }

    size_t workerCount() const { return m_workers.size(); }

    const SchedulerSettings& settings() const { return m_settings; }

private:
    struct BatchOutcome {
        enum class Status { Pending, Applied, Failed, Cancelled };

        Status status = Status::Pending;
        size_t applied = 0;
        size_t rejected = 0;
        std::vector<UpdateRequest> derived;
        std::string error;
    };

    ApplySummary runPass(const std::vector<UpdateRequest>& requests, const CancellationToken& token,
                         const char* passName);
    void applyBatch(const UpdateBatch& batch, const CancellationToken& token, BatchOutcome& outcome);
    void applyRequest(ChunkData& chunk, const UpdateRequest& request, BatchOutcome& outcome) const;
    void deriveFromBlockChange(const UpdateRequest& request, int replacedBlock, BatchOutcome& outcome) const;
    uint8_t computeLight(const ChunkData& chunk, const glm::ivec3& local) const;

    void workerThreadFunction();
    void enqueue(std::function<void()> task);

    ChunkDataCache& m_cache;
    ConcurrencyController& m_controller;
    const BlockRegistry& m_blocks;
    SchedulerSettings m_settings;

    std::mutex m_passMutex;             ///< One pass at a time

    mutable std::mutex m_derivedMutex;
    std::vector<UpdateRequest> m_derived;

    std::atomic<uint64_t> m_totalApplied{0};

    // Worker pool
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running{false};
    std::mutex m_taskMutex;
    std::condition_variable m_taskCV;
    std::queue<std::function<void()>> m_tasks;
};
