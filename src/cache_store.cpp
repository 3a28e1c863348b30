#include "../include/adaptive-governor/cache_store.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include "../include/adaptive-governor/metrics_collector.hpp"
#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <tuple>
#include <vector>

namespace AdaptiveGovernor
{

namespace
{

int64_t wallClockDeadlineMs(const CacheEntry &entry, TimePoint now)
{
    auto deadline = entry.deadline();
    if (!deadline)
    {
        return 0;
    }

    auto remaining = std::chrono::duration_cast<Milliseconds>(*deadline - now);
    auto wall_now = std::chrono::duration_cast<Milliseconds>(std::chrono::system_clock::now().time_since_epoch());
    return (wall_now + remaining).count();
}

} // namespace

CacheStore::CacheStore(const CacheConfig &config, TimeSource time_source)
: config(config), now(time_source ? std::move(time_source) : defaultTimeSource()), current_capacity(config.capacity_bytes)
{
    GlobalMetrics::instance().updateCacheCapacity(current_capacity);
}

CacheStore::~CacheStore()
{
    if (mirror)
    {
        mirror->shutdown();
    }
}

double CacheStore::score(const CacheEntry &entry, TimePoint now)
{
    auto idle_ms = std::chrono::duration_cast<Milliseconds>(now - entry.last_access_at).count();
    return static_cast<double>(entry.access_count) / static_cast<double>(std::max<int64_t>(1, idle_ms));
}

GovernorStatus CacheStore::put(const std::string &key, Payload value, Milliseconds ttl)
{
    return admit(key, std::move(value), ttl, 1, true);
}

GovernorStatus CacheStore::putJson(const std::string &key, const nlohmann::json &value, Milliseconds ttl)
{
    std::string serialized;
    try
    {
        serialized = value.dump();
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn(LogCategory::CACHE, "Cannot encode value for {}: {}", key, e.what());
        GlobalMetrics::instance().recordCacheAdmissionRejected("encoding");
        return GovernorStatus::ENCODING_FAILED;
    }

    return put(key, Payload(serialized.begin(), serialized.end()), ttl);
}

size_t CacheStore::preload(const std::function<nlohmann::json()> &loader, Milliseconds ttl)
{
    nlohmann::json critical;
    try
    {
        critical = loader();
    }
    catch (const std::exception &e)
    {
        Logger::warn(LogCategory::CACHE, "Preloading critical data failed: {}", e.what());
        return 0;
    }

    if (!critical.is_object())
    {
        Logger::warn(LogCategory::CACHE, "Preload loader returned {} instead of an object", critical.type_name());
        return 0;
    }

    size_t admitted = 0;
    for (const auto &[name, value] : critical.items())
    {
        if (putJson("critical:" + name, value, ttl) == GovernorStatus::SUCCESS)
        {
            admitted++;
        }
    }

    Logger::info(LogCategory::CACHE, "Preloaded {} of {} critical entries", admitted, critical.size());
    return admitted;
}

GovernorStatus CacheStore::admit(const std::string &key, Payload value, Milliseconds ttl, uint64_t access_count, bool mirror_write)
{
    const size_t size = value.size();

    std::lock_guard<std::mutex> lock(cache_mutex);
    const TimePoint current = now();

    if (size > current_capacity)
    {
        Logger::warn(LogCategory::CACHE, "Entry {} ({} bytes) exceeds capacity {}", key, size, current_capacity);
        GlobalMetrics::instance().recordCacheAdmissionRejected("capacity");
        return GovernorStatus::CAPACITY_UNAVAILABLE;
    }

    auto existing = entries.find(key);
    const size_t reclaimed = existing != entries.end() ? existing->second.size() : 0;
    const size_t projected = current_size - reclaimed + size;

    if (projected > current_capacity)
    {
        evictLocked(projected - current_capacity, current, key, "capacity");

        if (current_size - reclaimed + size > current_capacity)
        {
            Logger::warn(LogCategory::CACHE, "No room for {} ({} bytes) after eviction", key, size);
            GlobalMetrics::instance().recordCacheAdmissionRejected("capacity");
            return GovernorStatus::CAPACITY_UNAVAILABLE;
        }
    }

    if (existing != entries.end())
    {
        // Overwrite keeps the key's access history, but restarts its TTL
        CacheEntry &entry = existing->second;
        current_size -= entry.size();
        entry.payload = std::move(value);
        entry.created_at = current;
        entry.last_access_at = current;
        entry.ttl = ttl;
        entry.access_count = std::max(entry.access_count, access_count);
        entry.sequence = next_sequence++;
    }
    else
    {
        CacheEntry entry;
        entry.key = key;
        entry.payload = std::move(value);
        entry.created_at = current;
        entry.last_access_at = current;
        entry.ttl = ttl;
        entry.access_count = access_count;
        entry.sequence = next_sequence++;
        existing = entries.emplace(key, std::move(entry)).first;
    }

    current_size += size;

    Logger::trace(LogCategory::CACHE, "Stored {} ({} bytes, ttl {} ms), usage {}/{}", key, size, ttl.count(),
                  current_size, current_capacity);

    if (mirror_write)
    {
        mirrorStoreLocked(existing->second);
    }
    publishLocked();

    return GovernorStatus::SUCCESS;
}

std::optional<Payload> CacheStore::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(cache_mutex);
    const TimePoint current = now();

    auto it = entries.find(key);
    if (it == entries.end())
    {
        misses++;
        GlobalMetrics::instance().recordCacheMiss();
        return std::nullopt;
    }

    if (it->second.isExpired(current))
    {
        Logger::debug(LogCategory::CACHE, "Expired on read: {}", key);
        eraseLocked(it, "expired");
        expirations++;
        misses++;
        GlobalMetrics::instance().recordCacheExpiration();
        GlobalMetrics::instance().recordCacheMiss();
        publishLocked();
        return std::nullopt;
    }

    CacheEntry &entry = it->second;
    entry.access_count++;
    entry.last_access_at = current;
    hits++;
    GlobalMetrics::instance().recordCacheHit();

    return entry.payload;
}

std::optional<nlohmann::json> CacheStore::getJson(const std::string &key)
{
    auto payload = get(key);
    if (!payload)
    {
        return std::nullopt;
    }

    nlohmann::json parsed = nlohmann::json::parse(payload->begin(), payload->end(), nullptr, false);
    if (parsed.is_discarded())
    {
        Logger::warn(LogCategory::CACHE, "Cached value for {} is not valid JSON", key);
        return std::nullopt;
    }

    return parsed;
}

bool CacheStore::contains(const std::string &key)
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = entries.find(key);
    if (it == entries.end())
    {
        return false;
    }

    if (it->second.isExpired(now()))
    {
        eraseLocked(it, "expired");
        expirations++;
        GlobalMetrics::instance().recordCacheExpiration();
        publishLocked();
        return false;
    }

    return true;
}

void CacheStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto it = entries.find(key);
    if (it == entries.end())
    {
        return;
    }

    eraseLocked(it, "removed");
    publishLocked();
}

void CacheStore::clear()
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    Logger::info(LogCategory::CACHE, "Clearing {} entries ({} bytes)", entries.size(), current_size);
    entries.clear();
    current_size = 0;

    if (mirror)
    {
        mirror->enqueueClear();
    }
    publishLocked();
}

JanitorReport CacheStore::runJanitorPass()
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    JanitorReport report = removeExpiredLocked(now(), {});
    if (report.removed_entries > 0)
    {
        Logger::debug(LogCategory::CACHE, "Janitor removed {} expired entries ({} bytes)", report.removed_entries,
                      report.reclaimed_bytes);
        publishLocked();
    }

    return report;
}

JanitorReport CacheStore::shrinkTo(size_t target_capacity)
{
    std::lock_guard<std::mutex> lock(cache_mutex);
    JanitorReport report = shrinkLocked(target_capacity, now());
    publishLocked();
    return report;
}

void CacheStore::restoreCapacity()
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    if (current_capacity != config.capacity_bytes)
    {
        Logger::info(LogCategory::CACHE, "Capacity restored {} -> {}", current_capacity, config.capacity_bytes);
        current_capacity = config.capacity_bytes;
        publishLocked();
    }
}

JanitorReport CacheStore::aggressiveCleanup()
{
    std::lock_guard<std::mutex> lock(cache_mutex);
    const TimePoint current = now();
    const auto idle_limit = std::chrono::seconds(config.aggressive_idle_seconds);

    JanitorReport report;
    for (auto it = entries.begin(); it != entries.end();)
    {
        const CacheEntry &entry = it->second;
        bool stale = current - entry.last_access_at > idle_limit;
        bool cold = entry.access_count < config.aggressive_min_access_count;

        if (entry.isExpired(current) || stale || cold)
        {
            report.reclaimed_bytes += entry.size();
            report.removed_entries++;
            evictions++;
            auto next = std::next(it);
            eraseLocked(it, "cleanup");
            it = next;
        }
        else
        {
            ++it;
        }
    }

    auto reduced = static_cast<size_t>(std::llround(static_cast<double>(current_capacity) * config.aggressive_shrink_ratio));
    JanitorReport shrink = shrinkLocked(std::max(config.min_capacity_bytes, reduced), current);
    report.reclaimed_bytes += shrink.reclaimed_bytes;
    report.removed_entries += shrink.removed_entries;

    Logger::info(LogCategory::CACHE, "Aggressive cleanup removed {} entries ({} bytes), capacity now {}",
                 report.removed_entries, report.reclaimed_bytes, current_capacity);
    publishLocked();

    return report;
}

CacheStats CacheStore::stats() const
{
    std::lock_guard<std::mutex> lock(cache_mutex);

    CacheStats result;
    result.size_bytes = current_size;
    result.entry_count = entries.size();
    result.capacity = current_capacity;
    result.normal_capacity = config.capacity_bytes;
    result.utilization_ratio =
    current_capacity > 0 ? static_cast<double>(current_size) / static_cast<double>(current_capacity) : 0.0;
    result.hits = hits;
    result.misses = misses;
    result.evictions = evictions;
    result.expirations = expirations;

    result.top_entries.reserve(entries.size());
    for (const auto &[key, entry] : entries)
    {
        result.top_entries.push_back({ key, entry.size(), entry.access_count });
    }

    std::sort(result.top_entries.begin(), result.top_entries.end(),
              [](const CacheEntrySummary &a, const CacheEntrySummary &b)
              {
                  return std::tie(b.size_bytes, a.key) < std::tie(a.size_bytes, b.key);
              });

    if (result.top_entries.size() > config.top_entries_count)
    {
        result.top_entries.resize(config.top_entries_count);
    }

    return result;
}

size_t CacheStore::capacity() const
{
    std::lock_guard<std::mutex> lock(cache_mutex);
    return current_capacity;
}

void CacheStore::setPersistenceBackend(std::shared_ptr<PersistenceBackend> backend)
{
    std::shared_ptr<PersistenceMirror> previous;

    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        previous = std::move(mirror);
        if (backend)
        {
            mirror = std::make_shared<PersistenceMirror>(std::move(backend));
        }
    }

    // Drains outside the store lock
    previous.reset();
}

size_t CacheStore::restoreFromPersistence()
{
    std::shared_ptr<PersistenceMirror> active;

    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        active = mirror;
    }

    if (!active)
    {
        return 0;
    }

    active->flush();
    std::vector<PersistedEntry> persisted = active->loadAll();

    const auto wall_now = std::chrono::duration_cast<Milliseconds>(std::chrono::system_clock::now().time_since_epoch());
    size_t restored = 0;

    for (auto &entry : persisted)
    {
        {
            // Live values are newer than their mirrored copy
            std::lock_guard<std::mutex> lock(cache_mutex);
            if (entries.find(entry.key) != entries.end())
            {
                continue;
            }
        }

        Milliseconds ttl{ 0 };
        if (entry.expires_at_ms != 0)
        {
            ttl = Milliseconds(entry.expires_at_ms) - wall_now;
            if (ttl.count() <= 0)
            {
                continue;
            }
        }

        if (admit(entry.key, std::move(entry.payload), ttl, entry.access_count, false) == GovernorStatus::SUCCESS)
        {
            restored++;
        }
    }

    Logger::info(LogCategory::PERSISTENCE, "Restored {} of {} mirrored entries", restored, persisted.size());
    return restored;
}

void CacheStore::flushPersistence()
{
    std::shared_ptr<PersistenceMirror> active;

    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        active = mirror;
    }

    if (active)
    {
        active->flush();
    }
}

size_t CacheStore::evictLocked(size_t bytes_needed, TimePoint now, const std::string &protected_key, std::string_view reason)
{
    JanitorReport expired = removeExpiredLocked(now, protected_key);
    size_t freed = expired.reclaimed_bytes;

    if (freed >= bytes_needed)
    {
        return freed;
    }

    struct Candidate
    {
        double score;
        TimePoint created_at;
        uint64_t sequence;
        std::string key;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(entries.size());
    for (const auto &[key, entry] : entries)
    {
        if (key != protected_key)
        {
            candidates.push_back({ score(entry, now), entry.created_at, entry.sequence, key });
        }
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate &a, const Candidate &b)
              {
                  return std::tie(a.score, a.created_at, a.sequence) < std::tie(b.score, b.created_at, b.sequence);
              });

    for (const auto &candidate : candidates)
    {
        if (freed >= bytes_needed)
        {
            break;
        }

        auto it = entries.find(candidate.key);
        freed += it->second.size();
        evictions++;
        Logger::debug(LogCategory::CACHE, "Evicting {} ({} bytes, score {:.6f}, reason {})", candidate.key,
                      it->second.size(), candidate.score, reason);
        eraseLocked(it, reason);
    }

    return freed;
}

JanitorReport CacheStore::removeExpiredLocked(TimePoint now, const std::string &protected_key)
{
    JanitorReport report;

    for (auto it = entries.begin(); it != entries.end();)
    {
        if (it->first != protected_key && it->second.isExpired(now))
        {
            report.reclaimed_bytes += it->second.size();
            report.removed_entries++;
            auto next = std::next(it);
            eraseLocked(it, "expired");
            it = next;
        }
        else
        {
            ++it;
        }
    }

    expirations += report.removed_entries;
    if (report.removed_entries > 0)
    {
        GlobalMetrics::instance().recordCacheExpiration(report.removed_entries);
    }

    return report;
}

JanitorReport CacheStore::shrinkLocked(size_t target_capacity, TimePoint now)
{
    JanitorReport report;

    if (target_capacity >= current_capacity)
    {
        Logger::debug(LogCategory::CACHE, "Ignoring shrink to {} (capacity already {})", target_capacity, current_capacity);
        return report;
    }

    Logger::info(LogCategory::CACHE, "Shrinking capacity {} -> {}", current_capacity, target_capacity);
    current_capacity = target_capacity;

    if (current_size > current_capacity)
    {
        const size_t before_entries = entries.size();
        const size_t before_size = current_size;
        evictLocked(current_size - current_capacity, now, {}, "shrink");
        report.removed_entries = before_entries - entries.size();
        report.reclaimed_bytes = before_size - current_size;
    }

    return report;
}

void CacheStore::eraseLocked(EntryMap::iterator it, std::string_view reason)
{
    current_size -= it->second.size();

    if (mirror)
    {
        mirror->enqueueErase(it->first);
    }

    if (reason != "removed" && reason != "expired")
    {
        GlobalMetrics::instance().recordCacheEviction(reason);
    }

    entries.erase(it);
}

void CacheStore::mirrorStoreLocked(const CacheEntry &entry)
{
    if (!mirror)
    {
        return;
    }

    PersistedEntry persisted;
    persisted.key = entry.key;
    persisted.payload = entry.payload;
    persisted.access_count = entry.access_count;
    persisted.expires_at_ms = wallClockDeadlineMs(entry, entry.created_at);
    mirror->enqueueStore(std::move(persisted));
}

void CacheStore::publishLocked() const
{
    auto &metrics = GlobalMetrics::instance();
    metrics.updateCacheSize(current_size);
    metrics.updateCacheEntryCount(entries.size());
    metrics.updateCacheCapacity(current_capacity);
}

} // namespace AdaptiveGovernor
