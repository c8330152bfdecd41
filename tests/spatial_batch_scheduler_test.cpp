/**
 * @file spatial_batch_scheduler_test.cpp
 * @brief Partitioning, ordering, derived-update and failure tests for the batch scheduler
 *
 * Tests:
 * 1. Partitioning by chunk key, including negative coordinates
 * 2. In-order application within a chunk (last write wins) and write-back
 * 3. Neighbor notifications and lighting updates from block changes
 * 4. Per-group failures, AllGroupsFailed, cancellation
 * 5. Parallelism bounded by the controller's limit
 */

#include "test_utils.h"
#include "block_registry.h"
#include "concurrency_controller.h"
#include "logger.h"
#include "spatial_batch_scheduler.h"
#include <algorithm>
#include <atomic>
#include <thread>

namespace {

const int SURFACE = 64;
const int STONE = 1;
const int GLASS = 4;
const int TORCH = 6;

ChunkData flatLoader(const ChunkKey& key) {
    return ChunkData::flat(key, SURFACE, STONE);
}

CacheSettings unboundedCache() {
    CacheSettings settings;
    settings.capacity = 0;
    settings.ttl = std::chrono::milliseconds(0);
    return settings;
}

ConcurrencySettings concurrencyUpTo(uint32_t maxParallelism) {
    ConcurrencySettings settings;
    settings.minParallelism = 1;
    settings.maxParallelism = maxParallelism;
    settings.initialLimit = maxParallelism;
    return settings;
}

struct PipelineFixture {
    explicit PipelineFixture(uint32_t maxParallelism = 4,
                             ChunkDataCache::Loader loader = flatLoader,
                             SchedulerSettings schedulerSettings = SchedulerSettings())
        : cache(std::move(loader), unboundedCache())
        , blocks(BlockRegistry::withDefaults())
        , controller(concurrencyUpTo(maxParallelism))
        , scheduler(cache, controller, blocks, schedulerSettings)
    {
    }

    int blockAt(const glm::ivec3& world) {
        ChunkBlockCoordinates coords = worldToChunkCoords(world);
        return cache.get(coords.key).getBlock(coords.local);
    }

    ChunkDataCache cache;
    BlockRegistry blocks;
    ConcurrencyController controller;
    SpatialBatchScheduler scheduler;
};

}  // namespace

// ============================================================
// Test 1: Partitioning
// ============================================================

TEST(PartitionUsesFloorDivision) {
    std::vector<UpdateRequest> requests = {
        UpdateRequest::block(glm::ivec3(-1, 70, 0), STONE),
        UpdateRequest::block(glm::ivec3(15, 70, 15), STONE),
        UpdateRequest::block(glm::ivec3(16, 70, -17), STONE),
        UpdateRequest::block(glm::ivec3(-16, 70, 3), GLASS),
        UpdateRequest::block(glm::ivec3(0, 70, 0), GLASS),
    };

    std::vector<UpdateBatch> batches = partitionByChunk(requests);
    ASSERT_EQ(batches.size(), 3u);

    // First-seen key order
    ASSERT_TRUE(batches[0].key == (ChunkKey{-1, 0}));
    ASSERT_TRUE(batches[1].key == (ChunkKey{0, 0}));
    ASSERT_TRUE(batches[2].key == (ChunkKey{1, -2}));

    // x = -1 and x = -16 both land in chunk -1, in submission order
    ASSERT_EQ(batches[0].requests.size(), 2u);
    ASSERT_EQ(batches[0].requests[0].worldPos.x, -1);
    ASSERT_EQ(batches[0].requests[1].worldPos.x, -16);

    ChunkBlockCoordinates coords = worldToChunkCoords(glm::ivec3(-1, 70, -1));
    ASSERT_EQ(coords.local.x, 15);
    ASSERT_EQ(coords.local.z, 15);
}

TEST(EmptySubmissionIsNoOp) {
    PipelineFixture fixture;
    ApplySummary summary = fixture.scheduler.submit({});
    ASSERT_EQ(summary.chunksTouched, 0u);
    ASSERT_EQ(summary.requestsApplied, 0u);
    ASSERT_FALSE(summary.hasFailures());
    ASSERT_EQ(fixture.cache.size(), 0u);
}

// ============================================================
// Test 2: Ordering and Write-back
// ============================================================

TEST(LastWriteWinsWithinChunk) {
    PipelineFixture fixture;
    glm::ivec3 pos(5, 70, 5);

    ApplySummary summary = fixture.scheduler.submit({
        UpdateRequest::block(pos, STONE),
        UpdateRequest::block(pos, GLASS),
        UpdateRequest::block(pos, TORCH, 3),
    });

    ASSERT_EQ(summary.chunksTouched, 1u);
    ASSERT_EQ(summary.requestsApplied, 3u);

    // Visible to get() as soon as submit returns
    ChunkData chunk = fixture.cache.get(ChunkKey{0, 0});
    ASSERT_EQ(chunk.getBlock(glm::ivec3(5, 70, 5)), TORCH);
    ASSERT_EQ(chunk.getMetadata(glm::ivec3(5, 70, 5)), 3);
    ASSERT_EQ(fixture.scheduler.totalRequestsApplied(), 3u);
}

TEST(OutOfRangeHeightIsRejected) {
    PipelineFixture fixture;

    ApplySummary summary = fixture.scheduler.submit({
        UpdateRequest::block(glm::ivec3(1, 256, 1), STONE),
        UpdateRequest::block(glm::ivec3(1, -1, 1), STONE),
        UpdateRequest::physics(glm::ivec3(1, 300, 1)),
    });

    ASSERT_EQ(summary.requestsApplied, 0u);
    ASSERT_EQ(summary.requestsRejected, 3u);
    ASSERT_EQ(summary.derivedRequestsQueued, 0u);
}

TEST(EntityMovesAccumulate) {
    PipelineFixture fixture;
    glm::ivec3 pos(-20, 65, 40);

    fixture.scheduler.submit({
        UpdateRequest::entity(pos, 42, glm::vec3(1.0f, 0.0f, 0.5f)),
        UpdateRequest::entity(pos, 42, glm::vec3(1.0f, 2.0f, 0.5f)),
    });

    ChunkData chunk = fixture.cache.get(chunkKeyForWorld(pos));
    ASSERT_EQ(chunk.entities().size(), 1u);
    const glm::vec3& moved = chunk.entities().at(42);
    ASSERT_NEAR(moved.x, 2.0, 1e-6);
    ASSERT_NEAR(moved.y, 2.0, 1e-6);
    ASSERT_NEAR(moved.z, 1.0, 1e-6);
}

// ============================================================
// Test 3: Derived Updates
// ============================================================

TEST(BlockChangeQueuesNeighborsAndLighting) {
    PipelineFixture fixture;

    // Stone into air: six faces plus lighting
    ApplySummary summary = fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(3, 70, 3), STONE)});
    ASSERT_EQ(summary.derivedRequestsQueued, 7u);

    // Glass into air: neither block affects light
    summary = fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(3, 80, 3), GLASS)});
    ASSERT_EQ(summary.derivedRequestsQueued, 6u);

    // Bottom layer: the face below is outside the column
    summary = fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(3, 0, 3), GLASS)});
    ASSERT_EQ(summary.derivedRequestsQueued, 6u);

    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 19u);
}

TEST(NeighborNotificationsCanBeDisabled) {
    SchedulerSettings settings;
    settings.neighborNotifications = false;
    PipelineFixture fixture(4, flatLoader, settings);

    ApplySummary summary = fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(3, 70, 3), STONE)});
    ASSERT_EQ(summary.derivedRequestsQueued, 1u);
}

TEST(FlushDerivedCrossesChunkBorders) {
    PipelineFixture fixture;

    fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(0, 70, 0), STONE)});
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 7u);

    ApplySummary summary = fixture.scheduler.flushDerived();
    ASSERT_EQ(summary.requestsApplied, 7u);
    ASSERT_EQ(summary.chunksTouched, 3u);       // (0,0), (-1,0), (0,-1)
    ASSERT_EQ(summary.derivedRequestsQueued, 0u);
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 0u);

    ChunkData west = fixture.cache.get(ChunkKey{-1, 0});
    ASSERT_TRUE(west.hasPendingTick(glm::ivec3(15, 70, 0)));

    ChunkData north = fixture.cache.get(ChunkKey{0, -1});
    ASSERT_TRUE(north.hasPendingTick(glm::ivec3(0, 70, 15)));

    ChunkData home = fixture.cache.get(ChunkKey{0, 0});
    ASSERT_EQ(home.pendingTickCount(), 4u);
}

TEST(LightingFollowsBlockChanges) {
    PipelineFixture fixture;
    glm::ivec3 open(8, 70, 8);
    glm::ivec3 buried(8, 30, 8);

    fixture.scheduler.submit({
        UpdateRequest::block(open, STONE),
        UpdateRequest::block(buried, TORCH),
    });
    fixture.scheduler.drain();

    ChunkData chunk = fixture.cache.get(ChunkKey{0, 0});
    ASSERT_EQ(chunk.getLight(open), 0);
    ASSERT_EQ(chunk.getLight(buried), 14);

    // Removing the stone lets neighbouring sky light back in
    fixture.scheduler.submit({UpdateRequest::block(open, BlockID::AIR)});
    fixture.scheduler.drain();
    ASSERT_EQ(fixture.cache.get(ChunkKey{0, 0}).getLight(open), 14);
}

TEST(DrainStopsAtPassCap) {
    PipelineFixture fixture;

    fixture.scheduler.submit({UpdateRequest::block(glm::ivec3(1, 70, 1), STONE)});
    ApplySummary none = fixture.scheduler.drain(0);
    ASSERT_EQ(none.requestsApplied, 0u);
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 7u);

    ApplySummary drained = fixture.scheduler.drain();
    ASSERT_EQ(drained.requestsApplied, 7u);
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 0u);

    // Nothing queued: flushDerived is a no-op
    ApplySummary empty = fixture.scheduler.flushDerived();
    ASSERT_EQ(empty.chunksTouched, 0u);
}

// ============================================================
// Test 4: Failures and Cancellation
// ============================================================

TEST(OneFailingChunkDoesNotFailSubmission) {
    PipelineFixture fixture(4, [](const ChunkKey& key) {
        if (key == ChunkKey{1, 0}) {
            throw std::runtime_error("region offline");
        }
        return flatLoader(key);
    });

    // 3 requests for (0,0), 2 for (1,0)
    ApplySummary summary = fixture.scheduler.submit({
        UpdateRequest::block(glm::ivec3(1, 70, 1), STONE),
        UpdateRequest::block(glm::ivec3(17, 70, 1), STONE),
        UpdateRequest::block(glm::ivec3(2, 70, 1), STONE),
        UpdateRequest::block(glm::ivec3(18, 70, 1), STONE),
        UpdateRequest::block(glm::ivec3(3, 70, 1), STONE),
    });

    ASSERT_EQ(summary.chunksTouched, 1u);
    ASSERT_EQ(summary.requestsApplied, 3u);
    ASSERT_EQ(summary.failures.size(), 1u);
    ASSERT_TRUE(summary.failures[0].key == (ChunkKey{1, 0}));
    ASSERT_TRUE(summary.failures[0].kind == BatchErrorKind::ChunkUnavailable);
    ASSERT_EQ(summary.failures[0].reason, std::string("region offline"));

    ASSERT_EQ(fixture.blockAt(glm::ivec3(2, 70, 1)), STONE);
}

TEST(AllGroupsFailedIsThrown) {
    PipelineFixture fixture(4, [](const ChunkKey&) -> ChunkData {
        throw std::runtime_error("storage unavailable");
    });

    try {
        fixture.scheduler.submit({
            UpdateRequest::block(glm::ivec3(0, 70, 0), STONE),
            UpdateRequest::block(glm::ivec3(40, 70, 0), STONE),
        });
        ASSERT_TRUE(false);
    } catch (const BatchError& e) {
        ASSERT_TRUE(e.kind() == BatchErrorKind::AllGroupsFailed);
        ASSERT_EQ(e.keys().size(), 2u);
    }

    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 0u);
    ASSERT_EQ(fixture.scheduler.totalRequestsApplied(), 0u);
}

TEST(CancelledTokenAbandonsEveryGroup) {
    PipelineFixture fixture;
    CancellationToken token;
    token.cancel();

    ApplySummary summary = fixture.scheduler.submit({
        UpdateRequest::block(glm::ivec3(0, 70, 0), STONE),
        UpdateRequest::block(glm::ivec3(40, 70, 0), STONE),
    }, token);

    ASSERT_TRUE(summary.cancelled);
    ASSERT_EQ(summary.chunksCancelled, 2u);
    ASSERT_EQ(summary.chunksTouched, 0u);
    ASSERT_EQ(summary.requestsApplied, 0u);
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 0u);
    ASSERT_EQ(fixture.cache.size(), 0u);
}

TEST(CancelMidPassKeepsCompletedWriteBacks) {
    CancellationToken token;

    // One worker, so (0,0) is finished before (1,0) is loaded
    PipelineFixture fixture(1, [token](const ChunkKey& key) {
        if (key == ChunkKey{1, 0}) {
            CancellationToken copy = token;
            copy.cancel();
        }
        return flatLoader(key);
    });

    ApplySummary summary = fixture.scheduler.submit({
        UpdateRequest::block(glm::ivec3(1, 70, 1), GLASS),
        UpdateRequest::block(glm::ivec3(17, 70, 1), GLASS),
    }, token);

    ASSERT_TRUE(summary.cancelled);
    ASSERT_EQ(summary.chunksTouched, 1u);
    ASSERT_EQ(summary.chunksCancelled, 1u);

    // All-or-nothing per chunk
    ASSERT_EQ(fixture.blockAt(glm::ivec3(1, 70, 1)), GLASS);
    ASSERT_EQ(fixture.blockAt(glm::ivec3(17, 70, 1)), BlockID::AIR);

    // Only the completed chunk queued derived updates
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 6u);
}

// ============================================================
// Test 5: Bounded Parallelism
// ============================================================

TEST(ParallelismBoundedByLimit) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    PipelineFixture fixture(2, [&](const ChunkKey& key) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(3));
        --active;
        return flatLoader(key);
    });

    std::vector<UpdateRequest> requests;
    for (int cx = 0; cx < 6; cx++) {
        for (int cz = 0; cz < 4; cz++) {
            for (int i = 0; i < 5; i++) {
                requests.push_back(UpdateRequest::block(glm::ivec3(cx * 16 + i, 70, cz * 16), GLASS));
            }
        }
    }

    ApplySummary summary = fixture.scheduler.submit(requests);

    ASSERT_EQ(summary.chunksTouched, 24u);
    ASSERT_EQ(summary.requestsApplied, 120u);
    ASSERT_LE(peak.load(), 2);
    ASSERT_GE(peak.load(), 1);

    std::cout << "  Peak concurrent loads: " << peak.load() << " (limit 2)\n";
}

TEST(ManyChunksApplyEveryRequest) {
    PipelineFixture fixture(8);

    std::vector<UpdateRequest> requests;
    for (int x = -64; x < 64; x++) {
        for (int z = -64; z < 64; z += 8) {
            requests.push_back(UpdateRequest::block(glm::ivec3(x, 100, z), GLASS));
        }
    }

    ApplySummary summary = fixture.scheduler.submit(requests);
    ASSERT_EQ(summary.requestsApplied, requests.size());
    ASSERT_EQ(summary.chunksTouched, 64u);
    ASSERT_FALSE(summary.hasFailures());

    size_t glassCount = 0;
    for (int cx = -4; cx < 4; cx++) {
        for (int cz = -4; cz < 4; cz++) {
            glassCount += fixture.cache.get(ChunkKey{cx, cz}).countBlocks(GLASS);
        }
    }
    ASSERT_EQ(glassCount, requests.size());
}

TEST(BackToBackPassesAtFullParallelism) {
    PipelineFixture fixture(8);

    // Small passes finish fast, so runners and the submitting thread keep
    // racing at the end of each pass
    const int PASSES = 5000;
    std::vector<UpdateRequest> requests;
    for (int cx = 0; cx < 8; cx++) {
        requests.push_back(UpdateRequest::entity(glm::ivec3(cx * 16 + 1, 70, 1), static_cast<uint32_t>(cx),
                                                 glm::vec3(0.0f, 0.0f, 0.0f)));
    }

    size_t applied = 0;
    size_t touched = 0;
    for (int pass = 0; pass < PASSES; pass++) {
        ApplySummary summary = fixture.scheduler.submit(requests);
        applied += summary.requestsApplied;
        touched += summary.chunksTouched;
    }

    ASSERT_EQ(applied, static_cast<size_t>(PASSES) * 8u);
    ASSERT_EQ(touched, static_cast<size_t>(PASSES) * 8u);
    ASSERT_EQ(fixture.scheduler.totalRequestsApplied(), static_cast<uint64_t>(PASSES) * 8u);
    ASSERT_EQ(fixture.scheduler.pendingDerivedCount(), 0u);
}

// ============================================================
// Main Entry Point
// ============================================================

int main() {
    try {
        std::cout << "========================================\n";
        std::cout << "SPATIAL BATCH SCHEDULER TESTS\n";
        std::cout << "========================================\n\n";

        Logger::setMinLevel(LogLevel::ERROR);
        run_all_tests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "TEST FAILURE: " << e.what() << std::endl;
        return 1;
    }
}
