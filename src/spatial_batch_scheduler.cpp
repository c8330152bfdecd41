#include "spatial_batch_scheduler.h"
#include "block_registry.h"
#include "concurrency_controller.h"
#include "logger.h"
#include "perf_monitor.h"
#include <algorithm>

namespace {

const glm::ivec3 FACE_OFFSETS[6] = {
    glm::ivec3( 1,  0,  0), glm::ivec3(-1,  0,  0),
    glm::ivec3( 0,  1,  0), glm::ivec3( 0, -1,  0),
    glm::ivec3( 0,  0,  1), glm::ivec3( 0,  0, -1)
};

constexpr uint8_t MAX_LIGHT = 15;

}  // namespace

void ApplySummary::merge(const ApplySummary& other) {
    chunksTouched += other.chunksTouched;
    requestsApplied += other.requestsApplied;
    requestsRejected += other.requestsRejected;
    derivedRequestsQueued += other.derivedRequestsQueued;
    chunksCancelled += other.chunksCancelled;
    cancelled = cancelled || other.cancelled;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
}

SpatialBatchScheduler::SpatialBatchScheduler(ChunkDataCache& cache,
                                             ConcurrencyController& controller,
                                             const BlockRegistry& blocks,
                                             const SchedulerSettings& settings)
    : m_cache(cache)
    , m_controller(controller)
    , m_blocks(blocks)
    , m_settings(settings)
{
    size_t numWorkers = std::max<uint32_t>(1, controller.settings().maxParallelism);

    m_running.store(true);
    for (size_t i = 0; i < numWorkers; ++i) {
        m_workers.emplace_back(&SpatialBatchScheduler::workerThreadFunction, this);
    }

    Logger::info() << "SpatialBatchScheduler started with " << numWorkers << " worker threads";
}

SpatialBatchScheduler::~SpatialBatchScheduler() {
    {
        std::lock_guard<std::mutex> lock(m_taskMutex);
        m_running.store(false);
    }
    m_taskCV.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

ApplySummary SpatialBatchScheduler::submit(const std::vector<UpdateRequest>& requests,
                                           CancellationToken token) {
    std::lock_guard<std::mutex> passLock(m_passMutex);
    return runPass(requests, token, "submit");
}

ApplySummary SpatialBatchScheduler::flushDerived(CancellationToken token) {
    std::lock_guard<std::mutex> passLock(m_passMutex);

    std::vector<UpdateRequest> derived;
    {
        std::lock_guard<std::mutex> lock(m_derivedMutex);
        derived.swap(m_derived);
    }

    return runPass(derived, token, "flushDerived");
}

ApplySummary SpatialBatchScheduler::drain(int maxPasses) {
    ApplySummary total;
    int passes = 0;

    while (passes < maxPasses && pendingDerivedCount() > 0) {
        total.merge(flushDerived());
        ++passes;
    }

    size_t remaining = pendingDerivedCount();
    if (remaining > 0) {
        Logger::debug() << "drain stopped after " << passes << " pass(es) with "
                        << remaining << " derived request(s) still queued";
    }
    return total;
}

size_t SpatialBatchScheduler::pendingDerivedCount() const {
    std::lock_guard<std::mutex> lock(m_derivedMutex);
    return m_derived.size();
}

ApplySummary SpatialBatchScheduler::runPass(const std::vector<UpdateRequest>& requests,
                                            const CancellationToken& token,
                                            const char* passName) {
    PERF_SCOPE("batch_pass");

    ApplySummary summary;
    std::vector<UpdateBatch> batches = partitionByChunk(requests);
    if (batches.empty()) {
        return summary;
    }

    // Read once so every batch of this pass sees the same bound
    size_t limit = std::max<uint32_t>(1, m_controller.currentLimit());
    size_t parallelism = std::min({limit, batches.size(), m_workers.size()});

    std::vector<BatchOutcome> outcomes(batches.size());
    std::atomic<size_t> nextBatch{0};

    std::mutex doneMutex;
    std::condition_variable doneCV;
    size_t activeRunners = parallelism;

    for (size_t i = 0; i < parallelism; ++i) {
        enqueue([&]() {
            for (;;) {
                size_t index = nextBatch.fetch_add(1);
                if (index >= batches.size()) {
                    break;
                }
                applyBatch(batches[index], token, outcomes[index]);
            }

            // Notify under the lock: once it is released runPass may return
            // and destroy doneCV
            std::lock_guard<std::mutex> lock(doneMutex);
            --activeRunners;
            doneCV.notify_all();
        });
    }

    {
        std::unique_lock<std::mutex> lock(doneMutex);
        doneCV.wait(lock, [&]() { return activeRunners == 0; });
    }

    // ===== Collect results =====
    std::vector<UpdateRequest> derived;
    for (size_t i = 0; i < batches.size(); ++i) {
        BatchOutcome& outcome = outcomes[i];
        switch (outcome.status) {
            case BatchOutcome::Status::Applied:
                summary.chunksTouched++;
                summary.requestsApplied += outcome.applied;
                summary.requestsRejected += outcome.rejected;
                derived.insert(derived.end(), outcome.derived.begin(), outcome.derived.end());
                break;
            case BatchOutcome::Status::Failed:
                summary.failures.push_back(GroupFailure{batches[i].key, BatchErrorKind::ChunkUnavailable,
                                                        outcome.error});
                break;
            case BatchOutcome::Status::Cancelled:
            case BatchOutcome::Status::Pending:
                summary.chunksCancelled++;
                break;
        }
    }
    summary.cancelled = token.isCancelled();
    summary.derivedRequestsQueued = derived.size();

    if (!derived.empty()) {
        std::lock_guard<std::mutex> lock(m_derivedMutex);
        m_derived.insert(m_derived.end(), derived.begin(), derived.end());
    }

    PerformanceMonitor::instance().incrementCounter("requests_applied", summary.requestsApplied);

    Logger::debug() << passName << ": " << batches.size() << " chunk(s) at parallelism " << parallelism
                    << ", " << summary.requestsApplied << " applied, "
                    << summary.derivedRequestsQueued << " derived queued";

    if (summary.chunksCancelled > 0) {
        Logger::info() << passName << " cancelled: " << summary.chunksCancelled << " of "
                       << batches.size() << " chunk(s) abandoned";
    }

    if (!summary.failures.empty()) {
        if (summary.failures.size() == batches.size()) {
            std::vector<ChunkKey> keys;
            keys.reserve(summary.failures.size());
            for (const GroupFailure& failure : summary.failures) {
                keys.push_back(failure.key);
            }
            Logger::error() << passName << ": all " << batches.size() << " chunk group(s) failed";
            throw BatchError(BatchErrorKind::AllGroupsFailed, std::move(keys),
                             std::string(passName) + ": all chunk groups failed");
        }

        Logger::warning() << passName << ": " << summary.failures.size() << " of " << batches.size()
                          << " chunk group(s) failed";
    }

    return summary;
}

void SpatialBatchScheduler::applyBatch(const UpdateBatch& batch, const CancellationToken& token,
                                       BatchOutcome& outcome) {
    if (token.isCancelled()) {
        outcome.status = BatchOutcome::Status::Cancelled;
        return;
    }

    try {
        ChunkData chunk = m_cache.get(batch.key);

        for (const UpdateRequest& request : batch.requests) {
            applyRequest(chunk, request, outcome);
        }

        // Last chance to abandon; after put() the batch is visible
        if (token.isCancelled()) {
            outcome.status = BatchOutcome::Status::Cancelled;
            outcome.derived.clear();
            return;
        }

        m_cache.put(batch.key, std::move(chunk));
        outcome.status = BatchOutcome::Status::Applied;
        m_totalApplied.fetch_add(outcome.applied);

    } catch (const ChunkLoadError& e) {
        outcome.status = BatchOutcome::Status::Failed;
        outcome.error = e.reason();
        Logger::warning() << "Chunk " << batch.key << " unavailable, skipping "
                          << batch.requests.size() << " request(s): " << e.reason();
    } catch (const std::exception& e) {
        outcome.status = BatchOutcome::Status::Failed;
        outcome.error = e.what();
        Logger::error() << "Failed to apply batch for chunk " << batch.key << ": " << e.what();
    }
}

void SpatialBatchScheduler::applyRequest(ChunkData& chunk, const UpdateRequest& request,
                                         BatchOutcome& outcome) const {
    glm::ivec3 local = worldToChunkCoords(request.worldPos).local;

    if (request.type == UpdateType::Entity) {
        chunk.moveEntity(request.entityID, request.entityDelta);
        outcome.applied++;
        return;
    }

    if (!isWithinHeight(local.y)) {
        outcome.rejected++;
        Logger::debug() << "Rejected " << toString(request.type) << " update at y=" << local.y
                        << " in chunk " << chunk.key();
        return;
    }

    switch (request.type) {
        case UpdateType::Block: {
            int replaced = chunk.getBlock(local);
            chunk.setBlock(local, request.blockID, request.metadata);
            deriveFromBlockChange(request, replaced, outcome);
            break;
        }
        case UpdateType::Lighting:
            chunk.setLight(local, computeLight(chunk, local));
            break;
        case UpdateType::Physics:
            chunk.scheduleTick(local);
            break;
        case UpdateType::Entity:
            break;
    }
    outcome.applied++;
}

void SpatialBatchScheduler::deriveFromBlockChange(const UpdateRequest& request, int replacedBlock,
                                                  BatchOutcome& outcome) const {
    if (m_settings.neighborNotifications) {
        for (const glm::ivec3& offset : FACE_OFFSETS) {
            glm::ivec3 neighbor = request.worldPos + offset;
            if (!isWithinHeight(neighbor.y)) {
                continue;
            }
            outcome.derived.push_back(UpdateRequest::neighborNotification(neighbor));
        }
    }

    if (m_blocks.affectsLight(request.blockID) || m_blocks.affectsLight(replacedBlock)) {
        outcome.derived.push_back(UpdateRequest::lighting(request.worldPos));
    }
}

uint8_t SpatialBatchScheduler::computeLight(const ChunkData& chunk, const glm::ivec3& local) const {
    int blockID = chunk.getBlock(local);
    uint8_t level = m_blocks.lightEmission(blockID);
    if (m_blocks.isOpaque(blockID)) {
        return level;
    }

    // Open to the sky above the top layer
    if (local.y == ChunkDims::HEIGHT - 1) {
        return MAX_LIGHT;
    }

    // Neighbours in other chunks are not consulted
    for (const glm::ivec3& offset : FACE_OFFSETS) {
        glm::ivec3 neighbor = local + offset;
        if (!ChunkData::inBounds(neighbor)) {
            continue;
        }
        uint8_t neighborLight = chunk.getLight(neighbor);
        if (neighborLight > 0) {
            level = std::max<uint8_t>(level, static_cast<uint8_t>(neighborLight - 1));
        }
    }
    return level;
}

void SpatialBatchScheduler::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_taskMutex);
        m_tasks.push(std::move(task));
    }
    m_taskCV.notify_one();
}

void SpatialBatchScheduler::workerThreadFunction() {
    Logger::debug() << "Batch worker started (ID: " << std::this_thread::get_id() << ")";

    while (true) {
        std::function<void()> task;

        // Wait for work
        {
            std::unique_lock<std::mutex> lock(m_taskMutex);
            m_taskCV.wait(lock, [this]() {
                return !m_tasks.empty() || !m_running.load();
            });

            if (!m_running.load() && m_tasks.empty()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        task();
    }

    Logger::debug() << "Batch worker exiting (ID: " << std::this_thread::get_id() << ")";
}
