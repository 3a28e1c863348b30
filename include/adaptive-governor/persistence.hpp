#pragma once

#include "../types/cache_entry.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace AdaptiveGovernor
{

// Durable form of a cache entry. Expiry is stored as wall-clock milliseconds
// since the epoch because steady-clock time points do not survive a restart.
struct PersistedEntry
{
    std::string key;
    Payload payload;
    uint64_t access_count = 1;
    int64_t expires_at_ms = 0; // 0 = no expiry
};

class PersistenceBackend
{
    public:
    virtual ~PersistenceBackend() = default;

    virtual void store(const PersistedEntry &entry) = 0;
    virtual void erase(const std::string &key) = 0;
    virtual void clear() = 0;
    virtual std::vector<PersistedEntry> loadAll() = 0;
};

// Keeps every mirrored entry in a single JSON document on disk.
// Each mutation rewrites the file; it only ever runs on the mirror thread.
class JsonFilePersistence : public PersistenceBackend
{
    public:
    explicit JsonFilePersistence(std::string path);

    void store(const PersistedEntry &entry) override;
    void erase(const std::string &key) override;
    void clear() override;
    std::vector<PersistedEntry> loadAll() override;

    const std::string &path() const
    {
        return file_path;
    }

    private:
    struct Document;

    void ensureLoaded();
    void writeFile();

    std::string file_path;
    std::mutex file_mutex;
    std::shared_ptr<Document> document;
};

// Applies mirror operations to a backend on its own worker thread so cache
// operations never wait on I/O. Failures are logged and dropped.
//
// At most one operation is pending per key: a newer store or erase replaces
// the queued one in place, and clear() discards everything queued before it.
// Past max_pending distinct keys new operations are dropped with a warning.
class PersistenceMirror
{
    public:
    static constexpr size_t DEFAULT_MAX_PENDING = 10000;

    explicit PersistenceMirror(std::shared_ptr<PersistenceBackend> backend, size_t max_pending = DEFAULT_MAX_PENDING);
    ~PersistenceMirror();

    PersistenceMirror(const PersistenceMirror &) = delete;
    PersistenceMirror &operator=(const PersistenceMirror &) = delete;

    void enqueueStore(PersistedEntry entry);
    void enqueueErase(const std::string &key);
    void enqueueClear();

    // Blocks until every queued operation has been applied
    void flush();

    // Synchronous read used at start-up and on foreground; empty on failure
    std::vector<PersistedEntry> loadAll();

    size_t getPendingCount() const;

    void shutdown();

    private:
    struct PendingOperation
    {
        enum class Kind
        {
            STORE,
            ERASE,
            CLEAR
        };

        Kind kind = Kind::STORE;
        PersistedEntry entry{};
    };

    void enqueue(PendingOperation operation);
    void apply(const PendingOperation &operation);
    bool idleLocked() const;
    void workerThread();

    std::shared_ptr<PersistenceBackend> backend;
    size_t max_pending;

    std::thread worker;
    std::deque<std::string> order;
    std::unordered_map<std::string, PendingOperation> pending;
    bool clear_pending = false;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::condition_variable idle_condition;
    bool busy = false;
    bool stopped = false;
    std::atomic<bool> shutdown_requested{ false };
};

} // namespace AdaptiveGovernor
