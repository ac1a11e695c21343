#include "leasekeeper/core/SessionStore.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/logging/LogRegistry.hpp"
#include "leasekeeper/security/SessionToken.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace leasekeeper::core
{
namespace
{

void requireWellFormedId(std::string_view id, const char* what)
{
    if (!leasekeeper::security::isWellFormedSessionId(id))
    {
        throw InvalidArgument(what);
    }
}

} // namespace

SessionStore::SessionStore(std::chrono::seconds ttl, std::shared_ptr<leasekeeper::random::IRandomSource> random,
                           ClockSource clock)
    : m_ttl(ttl), m_random(std::move(random)), m_clock(std::move(clock)),
      m_log(leasekeeper::logging::LogRegistry::store())
{
    if (m_ttl.count() <= 0)
    {
        throw ConfigurationError("session store: ttl must be a positive number of seconds");
    }
    if (m_ttl > g_kMaxSessionTtl)
    {
        throw ConfigurationError("session store: ttl exceeds the maximum of " +
                                 std::to_string(g_kMaxSessionTtl.count()) + " seconds");
    }
    if (!m_random)
    {
        throw ConfigurationError("session store: random source is required");
    }

    m_log->info("Session store initialized with {}s expiry", m_ttl.count());
}

void SessionStore::create(std::string_view id)
{
    requireWellFormedId(id, "create: session id must be 1-256 printable non-space ASCII characters");

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto expiresAt{ m_clock.now() + m_ttl };
        if (auto it{ m_expiries.find(id) }; it != m_expiries.end())
        {
            it->second = expiresAt;
        }
        else
        {
            m_expiries.emplace(std::string{ id }, expiresAt);
        }
        ++m_generation;
    }

    m_log->debug("Session created: {}", id);
}

std::string SessionStore::create()
{
    std::string id{ generateId() };
    create(id);
    return id;
}

bool SessionStore::isActive(std::string_view id)
{
    if (!leasekeeper::security::isWellFormedSessionId(id))
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return checkLocked(id, m_clock.now(), false);
}

bool SessionStore::touchIfActive(std::string_view id)
{
    if (!leasekeeper::security::isWellFormedSessionId(id))
    {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    return checkLocked(id, m_clock.now(), true);
}

DeleteResult SessionStore::remove(std::string_view id)
{
    requireWellFormedId(id, "remove: session id must be 1-256 printable non-space ASCII characters");

    bool wasLive{ false };
    bool found{ false };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it{ m_expiries.find(id) };
        if (it != m_expiries.end())
        {
            found = true;
            wasLive = m_clock.now() < it->second;
            m_expiries.erase(it);
            ++m_generation;
        }
    }

    if (!found)
    {
        m_log->debug("Session not found for deletion: {}", id);
        return DeleteResult::Absent;
    }
    if (!wasLive)
    {
        m_log->debug("Session already expired at deletion: {}", id);
        return DeleteResult::Absent;
    }
    m_log->debug("Session deleted: {}", id);
    return DeleteResult::Removed;
}

std::size_t SessionStore::cleanup()
{
    std::size_t removed{};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        removed = pruneLocked(m_clock.now());
    }

    if (removed > 0U)
    {
        m_log->info("Cleaned up {} expired sessions", removed);
    }
    return removed;
}

std::size_t SessionStore::count()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneLocked(m_clock.now());
    return m_expiries.size();
}

std::optional<SessionInfo> SessionStore::info(std::string_view id)
{
    if (!leasekeeper::security::isWellFormedSessionId(id))
    {
        return std::nullopt;
    }

    ClockSource::TimePoint now{};
    ClockSource::TimePoint expiresAt{};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        now = m_clock.now();
        if (!checkLocked(id, now, false))
        {
            return std::nullopt;
        }
        expiresAt = m_expiries.find(id)->second;
    }

    SessionInfo out{};
    out.id = std::string{ id };
    out.expiresAt = expiresAt;
    out.createdAt = expiresAt - m_ttl;
    out.age = now - out.createdAt;
    out.remaining = expiresAt - now;
    out.createdAtWall = m_clock.toWall(out.createdAt);
    out.expiresAtWall = m_clock.toWall(out.expiresAt);
    return out;
}

std::string SessionStore::generateId()
{
    auto token{ leasekeeper::security::generateSessionToken(*m_random) };
    if (!token)
    {
        throw RandomSourceError("generateId: CSPRNG failure");
    }
    return std::move(*token);
}

std::chrono::seconds SessionStore::ttl() const noexcept
{
    return m_ttl;
}

StoreSnapshot SessionStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now{ m_clock.now() };

    StoreSnapshot out{};
    out.generation = m_generation;
    out.entries.reserve(m_expiries.size());
    for (const auto& [id, expiresAt] : m_expiries)
    {
        if (now < expiresAt)
        {
            out.entries.push_back(SessionEntry{ id, expiresAt });
        }
    }
    return out;
}

void SessionStore::restore(const std::vector<SessionEntry>& entries)
{
    std::size_t restored{};
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now{ m_clock.now() };
        for (const auto& entry : entries)
        {
            if (entry.expiresAt <= now || !leasekeeper::security::isWellFormedSessionId(entry.id))
            {
                continue;
            }
            m_expiries.insert_or_assign(entry.id, entry.expiresAt);
            ++restored;
        }
        if (restored > 0U)
        {
            ++m_generation;
        }
    }

    m_log->debug("Restored {} of {} sessions", restored, entries.size());
}

const ClockSource& SessionStore::clock() const noexcept
{
    return m_clock;
}

bool SessionStore::checkLocked(std::string_view id, ClockSource::TimePoint now, bool refresh)
{
    auto it{ m_expiries.find(id) };
    if (it == m_expiries.end())
    {
        return false;
    }

    if (now >= it->second)
    {
        m_expiries.erase(it);
        ++m_generation;
        m_log->debug("Session expired: {}", id);
        return false;
    }

    if (refresh)
    {
        it->second = now + m_ttl;
        ++m_generation;
    }
    return true;
}

std::size_t SessionStore::pruneLocked(ClockSource::TimePoint now)
{
    std::size_t removed{};
    for (auto it{ m_expiries.begin() }; it != m_expiries.end();)
    {
        if (it->second <= now)
        {
            it = m_expiries.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    if (removed > 0U)
    {
        ++m_generation;
    }
    return removed;
}

} // namespace leasekeeper::core
