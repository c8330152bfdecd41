/**
 * @file chunk_cache.h
 * @brief Deduplicating, TTL and LRU bounded cache over an injected chunk loader
 *
 * ARCHITECTURE:
 * - One mutex guards both the entry map and the in-flight load map
 * - The loader always runs with the mutex released
 * - A key is in at most one of the two maps at a time ("loading" or "loaded")
 *
 * FAN-IN:
 * - The first get() for an absent key creates a LoadTicket and runs the loader
 * - Every later get() for that key blocks on the ticket's condition variable
 * - When the load finishes all waiters receive the same value or the same error
 *
 * INVALIDATION DURING A LOAD:
 * - invalidate() detaches the ticket instead of blocking on it
 * - The load still completes for the callers already waiting on it, but the
 *   result is not stored; the next get() starts a fresh load
 */

#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "cache_entry.h"
#include "chunk_key.h"
#include "logger.h"
#include "perf_monitor.h"
#include "pipeline_errors.h"
#include "pipeline_settings.h"

template<typename V>
class ChunkCache {
public:
    /// Produces the value for a key; throws (any std::exception) on failure
    using Loader = std::function<V(const ChunkKey&)>;

    ChunkCache(Loader loader, const CacheSettings& settings, TimeSource clock = steadyNow)
        : m_loader(std::move(loader))
        , m_settings(settings)
        , m_clock(std::move(clock))
    {
        Logger::debug() << "ChunkCache created (capacity " << m_settings.capacity
                        << ", ttl " << m_settings.ttl.count() << " ms)";
    }

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    /**
     * @brief Returns a copy of the chunk for @p key, loading it at most once
     *
     * @throws ChunkLoadError if the loader failed (for this caller and every
     *         caller that was waiting on the same load)
     */
    V get(const ChunkKey& key) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto now = m_clock();

        auto entryIt = m_entries.find(key);
        if (entryIt != m_entries.end()) {
            if (!isExpired(entryIt->second, now)) {
                entryIt->second.lastAccessed = now;
                ++m_hits;
                PerformanceMonitor::instance().incrementCounter("cache_hit");
                return entryIt->second.value;
            }
            m_entries.erase(entryIt);
            ++m_evictions;
        }

        ++m_misses;
        PerformanceMonitor::instance().incrementCounter("cache_miss");

        auto ticketIt = m_tickets.find(key);
        if (ticketIt != m_tickets.end()) {
            std::shared_ptr<LoadTicket> ticket = ticketIt->second;
            ticket->cv.wait(lock, [&ticket] { return ticket->done; });
            return resolve(*ticket);
        }

        auto ticket = std::make_shared<LoadTicket>();
        m_tickets.emplace(key, ticket);
        lock.unlock();

        std::optional<V> loaded;
        std::exception_ptr error;
        try {
            PERF_SCOPE("cache_load");
            loaded.emplace(m_loader(key));
        } catch (const ChunkLoadError&) {
            error = std::current_exception();
        } catch (const std::exception& e) {
            error = std::make_exception_ptr(ChunkLoadError(key, e.what()));
        } catch (...) {
            error = std::make_exception_ptr(ChunkLoadError(key, "unknown loader failure"));
        }

        lock.lock();

        auto currentIt = m_tickets.find(key);
        if (currentIt != m_tickets.end() && currentIt->second == ticket) {
            m_tickets.erase(currentIt);
        }

        if (loaded) {
            ++m_loads;
            if (ticket->detached) {
                Logger::debug() << "Chunk " << key << " was invalidated while loading, result not cached";
            } else {
                insertLocked(key, *loaded, m_clock());
            }
            ticket->value = std::move(loaded);
        } else {
            ++m_loadFailures;
            ticket->error = error;
            Logger::warning() << "Chunk load failed for " << key << ", not cached";
        }

        ticket->done = true;
        ticket->cv.notify_all();
        return resolve(*ticket);
    }

    /**
     * @brief Inserts or replaces the entry for @p key
     *
     * Used for write-back after a batch. A load still in flight for the key
     * is detached so its older result cannot overwrite this value.
     */
    void put(const ChunkKey& key, V value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        detachTicketLocked(key);
        insertLocked(key, std::move(value), m_clock());
    }

    /**
     * @brief Drops the entry or in-flight load for @p key; no-op if absent
     */
    void invalidate(const ChunkKey& key) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.erase(key);
        if (detachTicketLocked(key)) {
            Logger::debug() << "Invalidated chunk " << key << " while its load was in flight";
        }
    }

    /**
     * @brief Removes entries with now - insertedAt > ttl
     * @return Number of entries removed
     */
    size_t evictExpired(std::chrono::milliseconds ttl) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return evictExpiredLocked(ttl, m_clock());
    }

    size_t evictExpired() {
        return evictExpired(m_settings.ttl);
    }

    /**
     * @brief Removes least-recently-accessed entries until size <= targetSize
     * @return Number of entries removed
     */
    size_t evictLru(size_t targetSize) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return evictLruLocked(targetSize);
    }

    /**
     * @brief Loads every key within @p radius of @p center, nearest ring first
     *
     * Keys already cached are skipped. Load failures are logged and skipped.
     * @return Number of chunks loaded
     */
    size_t prefetch(const ChunkKey& center, int radius) {
        std::vector<ChunkKey> keys;
        for (int dx = -radius; dx <= radius; ++dx) {
            for (int dz = -radius; dz <= radius; ++dz) {
                keys.push_back(ChunkKey{center.x + dx, center.z + dz});
            }
        }

        std::sort(keys.begin(), keys.end(), [&center](const ChunkKey& a, const ChunkKey& b) {
            int ax = a.x - center.x, az = a.z - center.z;
            int bx = b.x - center.x, bz = b.z - center.z;
            int ringA = std::max(std::abs(ax), std::abs(az));
            int ringB = std::max(std::abs(bx), std::abs(bz));
            if (ringA != ringB) return ringA < ringB;
            int distA = ax * ax + az * az;
            int distB = bx * bx + bz * bz;
            if (distA != distB) return distA < distB;
            return a.x != b.x ? a.x < b.x : a.z < b.z;
        });

        size_t loaded = 0;
        for (const ChunkKey& key : keys) {
            if (contains(key)) {
                continue;
            }
            try {
                get(key);
                ++loaded;
            } catch (const ChunkLoadError& e) {
                Logger::warning() << "Prefetch skipped " << key << ": " << e.reason();
            }
        }

        Logger::debug() << "Prefetched " << loaded << " chunk(s) around " << center;
        return loaded;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        CacheStats out;
        out.hits = m_hits;
        out.misses = m_misses;
        out.size = m_entries.size();
        uint64_t requests = m_hits + m_misses;
        out.hitRate = requests > 0 ? static_cast<double>(m_hits) / static_cast<double>(requests) : 0.0;
        out.loads = m_loads;
        out.loadFailures = m_loadFailures;
        out.evictions = m_evictions;
        out.inFlight = m_tickets.size();
        return out;
    }

    /// True if a fresh entry exists (does not count as an access)
    bool contains(const ChunkKey& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(key);
        return it != m_entries.end() && !isExpired(it->second, m_clock());
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

    /// Drops every entry and detaches every in-flight load
    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        for (auto& [key, ticket] : m_tickets) {
            ticket->detached = true;
        }
        m_tickets.clear();
    }

    const CacheSettings& settings() const { return m_settings; }

private:
    struct LoadTicket {
        std::condition_variable cv;
        bool done = false;
        bool detached = false;          ///< Invalidated or superseded; do not store the result
        std::optional<V> value;
        std::exception_ptr error;
    };

    V resolve(const LoadTicket& ticket) const {
        if (ticket.error) {
            std::rethrow_exception(ticket.error);
        }
        return *ticket.value;
    }

    bool isExpired(const CacheEntry<V>& entry, CacheClock::time_point now) const {
        return m_settings.ttl.count() > 0 && now - entry.insertedAt > m_settings.ttl;
    }

    bool detachTicketLocked(const ChunkKey& key) {
        auto it = m_tickets.find(key);
        if (it == m_tickets.end()) {
            return false;
        }
        it->second->detached = true;
        m_tickets.erase(it);
        return true;
    }

    void insertLocked(const ChunkKey& key, V value, CacheClock::time_point now) {
        if (m_settings.sweepOnInsert && m_settings.ttl.count() > 0) {
            evictExpiredLocked(m_settings.ttl, now);
        }

        CacheEntry<V>& entry = m_entries.insert_or_assign(key, CacheEntry<V>{std::move(value), now, now, 0}).first->second;
        entry.insertionSeq = m_nextSeq++;

        if (m_settings.capacity > 0 && m_entries.size() > m_settings.capacity) {
            evictLruLocked(m_settings.capacity);
        }
    }

    size_t evictExpiredLocked(std::chrono::milliseconds ttl, CacheClock::time_point now) {
        size_t removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (now - it->second.insertedAt > ttl) {
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        if (removed > 0) {
            m_evictions += removed;
            Logger::debug() << "Evicted " << removed << " expired chunk(s)";
        }
        return removed;
    }

    size_t evictLruLocked(size_t targetSize) {
        if (m_entries.size() <= targetSize) {
            return 0;
        }

        using EntryIt = typename std::unordered_map<ChunkKey, CacheEntry<V>>::iterator;
        std::vector<EntryIt> order;
        order.reserve(m_entries.size());
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            order.push_back(it);
        }

        size_t toRemove = m_entries.size() - targetSize;
        std::partial_sort(order.begin(), order.begin() + toRemove, order.end(),
            [](const EntryIt& a, const EntryIt& b) {
                if (a->second.lastAccessed != b->second.lastAccessed) {
                    return a->second.lastAccessed < b->second.lastAccessed;
                }
                return a->second.insertionSeq < b->second.insertionSeq;
            });

        for (size_t i = 0; i < toRemove; ++i) {
            Logger::debug() << "LRU evicting chunk " << order[i]->first;
            m_entries.erase(order[i]);
        }

        m_evictions += toRemove;
        return toRemove;
    }

    Loader m_loader;
    CacheSettings m_settings;
    TimeSource m_clock;

    mutable std::mutex m_mutex;
    std::unordered_map<ChunkKey, CacheEntry<V>> m_entries;
    std::unordered_map<ChunkKey, std::shared_ptr<LoadTicket>> m_tickets;

    uint64_t m_nextSeq = 0;
    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_loads = 0;
    uint64_t m_loadFailures = 0;
    uint64_t m_evictions = 0;
};
