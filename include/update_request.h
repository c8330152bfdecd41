/**
 * @file update_request.h
 * @brief Fine-grained world updates and their per-chunk batches
 */

#pragma once

#include <cstdint>
#include <vector>
#include <glm/glm.hpp>
#include "chunk_key.h"

enum class UpdateType : uint8_t {
    Block,      ///< Place or replace a block
    Entity,     ///< Move an entity by a delta
    Lighting,   ///< Recompute light at one position
    Physics     ///< Schedule a block tick
};

const char* toString(UpdateType type);

/**
 * @brief One update addressed by world block position
 *
 * Only the payload fields matching @c type are meaningful. Neighbor
 * notifications are Physics requests synthesized by the scheduler after a
 * block change; @c neighborNotify marks them.
 */
struct UpdateRequest {
    glm::ivec3 worldPos{0};
    UpdateType type = UpdateType::Block;

    // Block payload
    int blockID = 0;
    uint8_t metadata = 0;

    // Entity payload
    uint32_t entityID = 0;
    glm::vec3 entityDelta{0.0f};

    bool neighborNotify = false;

    ChunkKey chunkKey() const { return chunkKeyForWorld(worldPos); }

    static UpdateRequest block(const glm::ivec3& pos, int blockID, uint8_t metadata = 0) {
        UpdateRequest request;
        request.worldPos = pos;
        request.type = UpdateType::Block;
        request.blockID = blockID;
        request.metadata = metadata;
        return request;
    }

    static UpdateRequest entity(const glm::ivec3& pos, uint32_t entityID, const glm::vec3& delta) {
        UpdateRequest request;
        request.worldPos = pos;
        request.type = UpdateType::Entity;
        request.entityID = entityID;
        request.entityDelta = delta;
        return request;
    }

    static UpdateRequest lighting(const glm::ivec3& pos) {
        UpdateRequest request;
        request.worldPos = pos;
        request.type = UpdateType::Lighting;
        return request;
    }

    static UpdateRequest physics(const glm::ivec3& pos) {
        UpdateRequest request;
        request.worldPos = pos;
        request.type = UpdateType::Physics;
        return request;
    }

    static UpdateRequest neighborNotification(const glm::ivec3& pos) {
        UpdateRequest request = physics(pos);
        request.neighborNotify = true;
        return request;
    }
};

/**
 * @brief Requests sharing one chunk, in submission order
 */
struct UpdateBatch {
    ChunkKey key;
    std::vector<UpdateRequest> requests;
};

/**
 * @brief Splits @p requests into one batch per chunk key
 *
 * Batches appear in order of each key's first request; requests keep their
 * relative order inside a batch.
 */
std::vector<UpdateBatch> partitionByChunk(const std::vector<UpdateRequest>& requests);
