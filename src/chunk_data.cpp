#include "chunk_data.h"
#include <algorithm>

ChunkData::ChunkData()
    : ChunkData(ChunkKey{})
{
}

ChunkData::ChunkData(const ChunkKey& key)
    : m_key(key)
    , m_blocks(ChunkDims::VOLUME, static_cast<uint16_t>(BlockID::AIR))
    , m_metadata(ChunkDims::VOLUME, 0)
    , m_light(ChunkDims::VOLUME, 0)
{
}

ChunkData ChunkData::flat(const ChunkKey& key, int surfaceHeight, int fillBlock) {
    ChunkData chunk(key);
    int top = std::clamp(surfaceHeight, 0, ChunkDims::HEIGHT);
    const size_t layer = static_cast<size_t>(ChunkDims::WIDTH) * ChunkDims::WIDTH;

    // Y is the slowest-varying axis, so each layer is contiguous
    std::fill(chunk.m_blocks.begin(), chunk.m_blocks.begin() + layer * top,
              static_cast<uint16_t>(fillBlock));
    std::fill(chunk.m_light.begin() + layer * top, chunk.m_light.end(), static_cast<uint8_t>(15));
    return chunk;
}

bool ChunkData::inBounds(const glm::ivec3& local) {
    return local.x >= 0 && local.x < ChunkDims::WIDTH &&
           local.z >= 0 && local.z < ChunkDims::WIDTH &&
           isWithinHeight(local.y);
}

int ChunkData::index(const glm::ivec3& local) {
    return (local.y * ChunkDims::WIDTH + local.z) * ChunkDims::WIDTH + local.x;
}

int ChunkData::getBlock(const glm::ivec3& local) const {
    if (!inBounds(local)) {
        return BlockID::AIR;
    }
    return m_blocks[index(local)];
}

uint8_t ChunkData::getMetadata(const glm::ivec3& local) const {
    if (!inBounds(local)) {
        return 0;
    }
    return m_metadata[index(local)];
}

void ChunkData::setBlock(const glm::ivec3& local, int blockID, uint8_t metadata) {
    if (!inBounds(local)) {
        return;
    }
    int i = index(local);
    m_blocks[i] = static_cast<uint16_t>(blockID);
    m_metadata[i] = metadata;
    ++m_version;
}

uint8_t ChunkData::getLight(const glm::ivec3& local) const {
    if (!inBounds(local)) {
        return 0;
    }
    return m_light[index(local)];
}

void ChunkData::setLight(const glm::ivec3& local, uint8_t level) {
    if (!inBounds(local)) {
        return;
    }
    m_light[index(local)] = std::min<uint8_t>(level, 15);
    ++m_version;
}

void ChunkData::scheduleTick(const glm::ivec3& local) {
    if (!inBounds(local)) {
        return;
    }
    m_pendingTicks.insert(index(local));
    ++m_version;
}

bool ChunkData::hasPendingTick(const glm::ivec3& local) const {
    return inBounds(local) && m_pendingTicks.count(index(local)) > 0;
}

void ChunkData::moveEntity(uint32_t entityID, const glm::vec3& delta) {
    auto it = m_entities.emplace(entityID, glm::vec3(0.0f)).first;
    it->second += delta;
    ++m_version;
}

size_t ChunkData::countBlocks(int blockID) const {
    return static_cast<size_t>(std::count(m_blocks.begin(), m_blocks.end(),
                                          static_cast<uint16_t>(blockID)));
}
