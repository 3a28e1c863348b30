#pragma once

#include "../types/cache_entry.hpp"
#include "../types/config.hpp"
#include "../types/request_types.hpp"
#include "persistence.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace AdaptiveGovernor
{

/**
 * Capacity- and TTL-bounded key/value store.
 *
 * Every operation, including get(), takes the single store lock exclusively:
 * a hit mutates access metadata. The sum of live payload sizes never exceeds
 * the current capacity; room is made before a new entry is admitted.
 *
 * Eviction ranks entries by accessCount / max(1 ms, idle time) and removes
 * the lowest scores first, oldest insertion first on ties. Expired entries
 * are always dropped before any live entry is considered.
 */
class CacheStore
{
    public:
    explicit CacheStore(const CacheConfig &config, TimeSource time_source = defaultTimeSource());
    ~CacheStore();

    CacheStore(const CacheStore &) = delete;
    CacheStore &operator=(const CacheStore &) = delete;

    // ttl of zero means no expiry
    GovernorStatus put(const std::string &key, Payload value, Milliseconds ttl = Milliseconds{ 0 });
    GovernorStatus putJson(const std::string &key, const nlohmann::json &value, Milliseconds ttl = Milliseconds{ 0 });

    std::optional<Payload> get(const std::string &key);
    std::optional<nlohmann::json> getJson(const std::string &key);

    // Stores every member of the loader's JSON object under "critical:<name>".
    // Returns how many were admitted; a throwing loader admits nothing.
    size_t preload(const std::function<nlohmann::json()> &loader, Milliseconds ttl = Milliseconds{ 24 * 60 * 60 * 1000 });

    // Expire-on-read check that leaves access metadata untouched
    bool contains(const std::string &key);

    void remove(const std::string &key);
    void clear();

    JanitorReport runJanitorPass();

    // Lowers capacity and evicts down to it. Never raises capacity.
    JanitorReport shrinkTo(size_t target_capacity);
    void restoreCapacity();

    // Drops idle and rarely read entries, then shrinks capacity
    JanitorReport aggressiveCleanup();

    CacheStats stats() const;
    size_t capacity() const;

    void setPersistenceBackend(std::shared_ptr<PersistenceBackend> backend);

    // Both wait on mirror I/O with the store lock released
    size_t restoreFromPersistence();
    void flushPersistence();

    private:
    using EntryMap = std::unordered_map<std::string, CacheEntry>;

    GovernorStatus admit(const std::string &key, Payload value, Milliseconds ttl, uint64_t access_count, bool mirror_write);
    size_t evictLocked(size_t bytes_needed, TimePoint now, const std::string &protected_key, std::string_view reason);
    JanitorReport removeExpiredLocked(TimePoint now, const std::string &protected_key);
    JanitorReport shrinkLocked(size_t target_capacity, TimePoint now);
    void eraseLocked(EntryMap::iterator it, std::string_view reason);
    void mirrorStoreLocked(const CacheEntry &entry);
    void publishLocked() const;

    static double score(const CacheEntry &entry, TimePoint now);

    CacheConfig config;
    TimeSource now;

    mutable std::mutex cache_mutex;
    EntryMap entries;
    size_t current_size = 0;
    size_t current_capacity = 0;
    uint64_t next_sequence = 0;

    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;

    // Shared so restore and flush can wait on mirror I/O without the store lock
    std::shared_ptr<PersistenceMirror> mirror;
};

} // namespace AdaptiveGovernor
