#include "update_request.h"
#include <unordered_map>

const char* toString(UpdateType type) {
    switch (type) {
        case UpdateType::Block:    return "block";
        case UpdateType::Entity:   return "entity";
        case UpdateType::Lighting: return "lighting";
        case UpdateType::Physics:  return "physics";
    }
    return "unknown";
}

std::vector<UpdateBatch> partitionByChunk(const std::vector<UpdateRequest>& requests) {
    std::vector<UpdateBatch> batches;
    std::unordered_map<ChunkKey, size_t> batchIndex;

    for (const UpdateRequest& request : requests) {
        ChunkKey key = request.chunkKey();
        auto it = batchIndex.find(key);
        if (it == batchIndex.end()) {
            it = batchIndex.emplace(key, batches.size()).first;
            batches.push_back(UpdateBatch{key, {}});
        }
        batches[it->second].requests.push_back(request);
    }

    return batches;
}
