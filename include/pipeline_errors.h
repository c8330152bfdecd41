/**
 * @file pipeline_errors.h
 * @brief Exceptions raised by the chunk cache and the batch scheduler
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "chunk_key.h"

/**
 * @brief A chunk could not be produced by the loader
 *
 * Every caller waiting on the same in-flight load receives the same error.
 * Errors are never cached, so calling get() again retries the load.
 */
class ChunkLoadError : public std::runtime_error {
public:
    ChunkLoadError(const ChunkKey& key, const std::string& reason)
        : std::runtime_error(describe(key, reason))
        , m_key(key)
        , m_reason(reason)
    {
    }

    const ChunkKey& key() const { return m_key; }
    const std::string& reason() const { return m_reason; }

private:
    static std::string describe(const ChunkKey& key, const std::string& reason) {
        std::ostringstream out;
        out << "failed to load chunk " << key << ": " << reason;
        return out.str();
    }

    ChunkKey m_key;
    std::string m_reason;
};

enum class BatchErrorKind {
    ChunkUnavailable,   ///< One group's chunk could not be loaded or written
    AllGroupsFailed     ///< No group in the submission succeeded
};

/**
 * @brief Scheduler failure
 *
 * ChunkUnavailable is reported per group inside ApplySummary; only
 * AllGroupsFailed is thrown out of submit()/flushDerived().
 */
class BatchError : public std::runtime_error {
public:
    BatchError(BatchErrorKind kind, std::vector<ChunkKey> keys, const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind)
        , m_keys(std::move(keys))
    {
    }

    BatchErrorKind kind() const { return m_kind; }
    const std::vector<ChunkKey>& keys() const { return m_keys; }

private:
    BatchErrorKind m_kind;
    std::vector<ChunkKey> m_keys;
};
