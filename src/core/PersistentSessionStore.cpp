#include "leasekeeper/core/PersistentSessionStore.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/logging/LogRegistry.hpp"
#include "leasekeeper/security/SessionToken.hpp"
#include "leasekeeper/storage/StorageErrors.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace leasekeeper::core
{

PersistentSessionStore::PersistentSessionStore(std::unique_ptr<ISessionStore> inner,
                                               std::unique_ptr<leasekeeper::storage::ISnapshotRepository> repository,
                                               ClockSource clock)
    : m_inner(std::move(inner)), m_repository(std::move(repository)), m_clock(std::move(clock)),
      m_log(leasekeeper::logging::LogRegistry::persistence())
{
    if (!m_inner)
    {
        throw ConfigurationError("persistent store: inner store is required");
    }
    load();
}

void PersistentSessionStore::create(std::string_view id)
{
    m_inner->create(id);
    persist();
}

std::string PersistentSessionStore::create()
{
    std::string id{ m_inner->create() };
    persist();
    return id;
}

bool PersistentSessionStore::isActive(std::string_view id)
{
    return m_inner->isActive(id);
}

DeleteResult PersistentSessionStore::remove(std::string_view id)
{
    const DeleteResult result{ m_inner->remove(id) };
    persist();
    return result;
}

std::size_t PersistentSessionStore::cleanup()
{
    const std::size_t removed{ m_inner->cleanup() };
    if (removed > 0U)
    {
        persist();
    }
    return removed;
}

std::size_t PersistentSessionStore::count()
{
    return m_inner->count();
}

std::optional<SessionInfo> PersistentSessionStore::info(std::string_view id)
{
    return m_inner->info(id);
}

std::string PersistentSessionStore::generateId()
{
    return m_inner->generateId();
}

std::chrono::seconds PersistentSessionStore::ttl() const noexcept
{
    return m_inner->ttl();
}

StoreSnapshot PersistentSessionStore::snapshot() const
{
    return m_inner->snapshot();
}

void PersistentSessionStore::restore(const std::vector<SessionEntry>& entries)
{
    m_inner->restore(entries);
    persist();
}

bool PersistentSessionStore::isDurable() const noexcept
{
    return m_repository != nullptr;
}

void PersistentSessionStore::load()
{
    if (!m_repository)
    {
        return;
    }

    const auto& location{ m_repository->location() };

    std::optional<leasekeeper::storage::LoadedSnapshot> loaded{};
    try
    {
        loaded = m_repository->load();
    }
    catch (const leasekeeper::storage::SnapshotFormatError& e)
    {
        m_log->warn("Ignoring corrupt session snapshot {}: {}", location.string(), e.what());
        return;
    }
    catch (const leasekeeper::storage::PersistenceIoError& e)
    {
        m_log->error("Error loading sessions from {}: {}", location.string(), e.what());
        return;
    }

    if (!loaded)
    {
        m_log->debug("No session snapshot at {}, starting empty", location.string());
        return;
    }

    const auto now{ m_clock.now() };
    std::vector<SessionEntry> live{};
    live.reserve(loaded->sessions.size());
    std::size_t pruned{};
    std::size_t malformed{ loaded->skippedEntries };
    for (auto& session : loaded->sessions)
    {
        if (!leasekeeper::security::isWellFormedSessionId(session.id))
        {
            ++malformed;
            continue;
        }
        const auto expiresAt{ m_clock.fromUnixSeconds(session.expiresAtUnix) };
        if (expiresAt <= now)
        {
            ++pruned;
            continue;
        }
        live.push_back(SessionEntry{ std::move(session.id), expiresAt });
    }

    m_inner->restore(live);
    m_log->info("Loaded {} sessions from {} ({} expired pruned, {} malformed skipped)", live.size(),
              location.string(), pruned, malformed);
}

void PersistentSessionStore::persist()
{
    if (!m_repository)
    {
        return;
    }

    const StoreSnapshot snap{ m_inner->snapshot() };

    std::lock_guard<std::mutex> lock(m_fileMutex);
    if (m_hasWritten && snap.generation <= m_writtenGeneration)
    {
        return;
    }

    std::vector<leasekeeper::storage::PersistedSession> out{};
    out.reserve(snap.entries.size());
    for (const auto& entry : snap.entries)
    {
        out.push_back(leasekeeper::storage::PersistedSession{ entry.id, m_clock.toUnixSeconds(entry.expiresAt) });
    }

    try
    {
        m_repository->save(out);
        m_hasWritten = true;
        m_writtenGeneration = snap.generation;
        m_log->debug("Saved {} sessions to {}", out.size(), m_repository->location().string());
    }
    catch (const leasekeeper::storage::PersistenceIoError& e)
    {
        m_log->error("Error saving sessions to {}: {}", m_repository->location().string(), e.what());
    }
}

} // namespace leasekeeper::core
