/**
 * @file chunk_data.h
 * @brief Block, light, entity and scheduled-tick storage for one chunk column
 *
 * ChunkData is the value type held by the chunk cache. It is a plain value:
 * the scheduler copies it out of the cache, applies a batch to the copy and
 * writes the copy back, so no locking lives here.
 */

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <vector>
#include <glm/glm.hpp>
#include "chunk_key.h"

namespace BlockID {
    constexpr int AIR = 0;  ///< Air (empty space, non-solid)
}

class ChunkData {
public:
    ChunkData();
    explicit ChunkData(const ChunkKey& key);

    /**
     * @brief Builds a column filled with @p fillBlock up to (not including) @p surfaceHeight
     *
     * Stand-in terrain for the bench and tests; real chunks come from the
     * injected loader.
     */
    static ChunkData flat(const ChunkKey& key, int surfaceHeight, int fillBlock);

    const ChunkKey& key() const { return m_key; }

    /// True if @p local addresses a block inside this column
    static bool inBounds(const glm::ivec3& local);

    int getBlock(const glm::ivec3& local) const;
    uint8_t getMetadata(const glm::ivec3& local) const;
    void setBlock(const glm::ivec3& local, int blockID, uint8_t metadata = 0);

    /// Light level 0-15
    uint8_t getLight(const glm::ivec3& local) const;
    void setLight(const glm::ivec3& local, uint8_t level);

    // ========== Scheduled physics ticks ==========

    void scheduleTick(const glm::ivec3& local);
    bool hasPendingTick(const glm::ivec3& local) const;
    size_t pendingTickCount() const { return m_pendingTicks.size(); }

    // ========== Entities ==========

    /**
     * @brief Moves an entity by @p delta, creating it at the origin of the delta if unknown
     */
    void moveEntity(uint32_t entityID, const glm::vec3& delta);
    const std::map<uint32_t, glm::vec3>& entities() const { return m_entities; }

    /// Incremented by every mutation; lets callers detect write-back
    uint64_t version() const { return m_version; }

    size_t countBlocks(int blockID) const;

private:
    static int index(const glm::ivec3& local);

    ChunkKey m_key;
    std::vector<uint16_t> m_blocks;
    std::vector<uint8_t> m_metadata;
    std::vector<uint8_t> m_light;
    std::set<int> m_pendingTicks;
    std::map<uint32_t, glm::vec3> m_entities;
    uint64_t m_version = 0;
};
