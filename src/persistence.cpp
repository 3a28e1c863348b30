#include "../include/adaptive-governor/persistence.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include "../include/adaptive-governor/metrics_collector.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace AdaptiveGovernor
{

struct JsonFilePersistence::Document
{
    nlohmann::json entries = nlohmann::json::object();
};

JsonFilePersistence::JsonFilePersistence(std::string path) : file_path(std::move(path))
{
}

void JsonFilePersistence::ensureLoaded()
{
    if (document)
    {
        return;
    }

    document = std::make_shared<Document>();

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        // First run, nothing mirrored yet
        return;
    }

    nlohmann::json parsed = nlohmann::json::parse(file, nullptr, false);
    if (parsed.is_discarded() || !parsed.contains("entries") || !parsed["entries"].is_object())
    {
        Logger::warn(LogCategory::PERSISTENCE, "Ignoring unreadable mirror file: {}", file_path);
        return;
    }

    document->entries = std::move(parsed["entries"]);
}

void JsonFilePersistence::writeFile()
{
    std::filesystem::path target(file_path);
    std::filesystem::path temp = target;
    temp += ".tmp";

    if (target.has_parent_path())
    {
        std::filesystem::create_directories(target.parent_path());
    }

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("cannot open " + temp.string() + " for writing");
        }

        nlohmann::json root;
        root["version"] = 1;
        root["entries"] = document->entries;
        out << root.dump();

        if (!out.good())
        {
            throw std::runtime_error("write to " + temp.string() + " failed");
        }
    }

    std::filesystem::rename(temp, target);
}

void JsonFilePersistence::store(const PersistedEntry &entry)
{
    std::lock_guard<std::mutex> lock(file_mutex);
    ensureLoaded();

    document->entries[entry.key] = {
        { "payload", entry.payload },
        { "access_count", entry.access_count },
        { "expires_at_ms", entry.expires_at_ms },
    };
    writeFile();
}

void JsonFilePersistence::erase(const std::string &key)
{
    std::lock_guard<std::mutex> lock(file_mutex);
    ensureLoaded();

    if (document->entries.erase(key) > 0)
    {
        writeFile();
    }
}

void JsonFilePersistence::clear()
{
    std::lock_guard<std::mutex> lock(file_mutex);
    ensureLoaded();

    document->entries = nlohmann::json::object();
    writeFile();
}

std::vector<PersistedEntry> JsonFilePersistence::loadAll()
{
    std::lock_guard<std::mutex> lock(file_mutex);
    ensureLoaded();

    std::vector<PersistedEntry> result;
    result.reserve(document->entries.size());

    for (const auto &[key, value] : document->entries.items())
    {
        if (!value.is_object() || !value.contains("payload") || !value["payload"].is_array())
        {
            Logger::warn(LogCategory::PERSISTENCE, "Skipping malformed mirrored entry: {}", key);
            continue;
        }

        PersistedEntry entry;
        entry.key = key;
        entry.payload = value["payload"].get<Payload>();
        entry.access_count = value.value("access_count", uint64_t{ 1 });
        entry.expires_at_ms = value.value("expires_at_ms", int64_t{ 0 });
        result.push_back(std::move(entry));
    }

    return result;
}

PersistenceMirror::PersistenceMirror(std::shared_ptr<PersistenceBackend> backend, size_t max_pending)
: backend(std::move(backend)), max_pending(max_pending == 0 ? DEFAULT_MAX_PENDING : max_pending)
{
    worker = std::thread(&PersistenceMirror::workerThread, this);
}

PersistenceMirror::~PersistenceMirror()
{
    shutdown();
}

void PersistenceMirror::enqueueStore(PersistedEntry entry)
{
    enqueue(PendingOperation{ PendingOperation::Kind::STORE, std::move(entry) });
}

void PersistenceMirror::enqueueErase(const std::string &key)
{
    PendingOperation operation{ PendingOperation::Kind::ERASE, {} };
    operation.entry.key = key;
    enqueue(std::move(operation));
}

void PersistenceMirror::enqueueClear()
{
    enqueue(PendingOperation{ PendingOperation::Kind::CLEAR, {} });
}

void PersistenceMirror::enqueue(PendingOperation operation)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (shutdown_requested)
        {
            Logger::debug(LogCategory::PERSISTENCE, "Mirror stopped, dropping operation on {}", operation.entry.key);
            return;
        }

        if (operation.kind == PendingOperation::Kind::CLEAR)
        {
            if (!pending.empty())
            {
                Logger::debug(LogCategory::PERSISTENCE, "Clear supersedes {} queued mirror operations", pending.size());
            }
            pending.clear();
            order.clear();
            clear_pending = true;
        }
        else if (auto it = pending.find(operation.entry.key); it != pending.end())
        {
            it->second = std::move(operation);
        }
        else if (pending.size() >= max_pending)
        {
            Logger::warn(LogCategory::PERSISTENCE, "Mirror queue full ({} keys), dropping operation on {}", max_pending,
                         operation.entry.key);
            GlobalMetrics::instance().recordPersistenceFailure("queue_full");
            return;
        }
        else
        {
            order.push_back(operation.entry.key);
            std::string key = operation.entry.key;
            pending.emplace(std::move(key), std::move(operation));
        }
    }
    queue_condition.notify_one();
}

bool PersistenceMirror::idleLocked() const
{
    return pending.empty() && !clear_pending && !busy;
}

void PersistenceMirror::flush()
{
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock,
                        [this]
                        {
                            return idleLocked() || stopped;
                        });
}

std::vector<PersistedEntry> PersistenceMirror::loadAll()
{
    try
    {
        return backend->loadAll();
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::PERSISTENCE, "Loading mirrored entries failed: {}", e.what());
        GlobalMetrics::instance().recordPersistenceFailure("load");
        return {};
    }
}

size_t PersistenceMirror::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return pending.size() + (clear_pending ? 1 : 0) + (busy ? 1 : 0);
}

void PersistenceMirror::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        shutdown_requested = true;
    }

    queue_condition.notify_all();

    if (worker.joinable())
    {
        worker.join();
    }
}

void PersistenceMirror::apply(const PendingOperation &operation)
{
    switch (operation.kind)
    {
    case PendingOperation::Kind::STORE:
        backend->store(operation.entry);
        break;
    case PendingOperation::Kind::ERASE:
        backend->erase(operation.entry.key);
        break;
    case PendingOperation::Kind::CLEAR:
        backend->clear();
        break;
    }
}

void PersistenceMirror::workerThread()
{
    while (true)
    {
        PendingOperation next;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock,
                                 [this]
                                 {
                                     return !pending.empty() || clear_pending || shutdown_requested;
                                 });

            // Drain what is already queued before stopping
            if (pending.empty() && !clear_pending)
            {
                stopped = true;
                idle_condition.notify_all();
                break;
            }

            // A queued clear predates every pending key operation
            if (clear_pending)
            {
                next.kind = PendingOperation::Kind::CLEAR;
                clear_pending = false;
            }
            else
            {
                auto node = pending.extract(order.front());
                order.pop_front();
                next = std::move(node.mapped());
            }
            busy = true;
        }

        const char *name = next.kind == PendingOperation::Kind::STORE   ? "store"
                           : next.kind == PendingOperation::Kind::ERASE ? "erase"
                                                                         : "clear";
        try
        {
            apply(next);
        }
        catch (const std::exception &e)
        {
            Logger::error(LogCategory::PERSISTENCE, "Mirror {} of {} failed: {}", name, next.entry.key, e.what());
            GlobalMetrics::instance().recordPersistenceFailure(name);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            busy = false;
        }
        idle_condition.notify_all();
    }
}

} // namespace AdaptiveGovernor
