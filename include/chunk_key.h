/**
 * @file chunk_key.h
 * @brief Chunk column key and world-to-chunk coordinate conversion
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <glm/glm.hpp>

namespace ChunkDims {
    constexpr int WIDTH = 16;          ///< Blocks along X and Z per chunk column
    constexpr int HEIGHT = 256;        ///< Blocks along Y per chunk column
    constexpr int WIDTH_SHIFT = 4;     ///< log2(WIDTH)
    constexpr int WIDTH_MASK = WIDTH - 1;
    constexpr int VOLUME = WIDTH * WIDTH * HEIGHT;
}

/**
 * @brief Identifies one chunk column in the XZ plane
 */
struct ChunkKey {
    int x = 0;
    int z = 0;

    bool operator==(const ChunkKey& other) const {
        return x == other.x && z == other.z;
    }
    bool operator!=(const ChunkKey& other) const {
        return !(*this == other);
    }
};

inline std::ostream& operator<<(std::ostream& out, const ChunkKey& key) {
    return out << "(" << key.x << ", " << key.z << ")";
}

namespace std {
    template<>
    struct hash<ChunkKey> {
        size_t operator()(const ChunkKey& key) const {
            // Pack both halves into 64 bits so (x, z) and (z, x) never collide
            uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(key.x)) << 32)
                            | static_cast<uint32_t>(key.z);
            return hash<uint64_t>()(packed);
        }
    };
}

/**
 * @brief Chunk key plus block position inside that chunk
 */
struct ChunkBlockCoordinates {
    ChunkKey key;
    glm::ivec3 local;   ///< x,z in [0, WIDTH), y unchanged
};

/**
 * @brief Converts a world block position to its chunk key and local position
 *
 * Arithmetic right shift floors negatives, so x = -1 lands in chunk -1 at
 * local 15 rather than chunk 0.
 */
inline ChunkBlockCoordinates worldToChunkCoords(const glm::ivec3& world) {
    ChunkBlockCoordinates coords;
    coords.key.x = world.x >> ChunkDims::WIDTH_SHIFT;
    coords.key.z = world.z >> ChunkDims::WIDTH_SHIFT;
    coords.local = glm::ivec3(world.x & ChunkDims::WIDTH_MASK,
                              world.y,
                              world.z & ChunkDims::WIDTH_MASK);
    return coords;
}

inline ChunkKey chunkKeyForWorld(const glm::ivec3& world) {
    return worldToChunkCoords(world).key;
}

inline bool isWithinHeight(int y) {
    return y >= 0 && y < ChunkDims::HEIGHT;
}
