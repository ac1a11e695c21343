#include "leasekeeper/core/SlidingSessionStore.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/logging/LogRegistry.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace leasekeeper::core
{

SlidingSessionStore::SlidingSessionStore(std::unique_ptr<SessionStore> inner)
    : m_inner(std::move(inner)), m_log(leasekeeper::logging::LogRegistry::store())
{
    if (!m_inner)
    {
        throw ConfigurationError("sliding store: inner store is required");
    }
}

void SlidingSessionStore::create(std::string_view id)
{
    m_inner->create(id);
}

std::string SlidingSessionStore::create()
{
    return m_inner->create();
}

bool SlidingSessionStore::isActive(std::string_view id)
{
    const bool live{ m_inner->touchIfActive(id) };
    if (live)
    {
        m_log->debug("Sliding session refreshed: {}", id);
    }
    return live;
}

DeleteResult SlidingSessionStore::remove(std::string_view id)
{
    return m_inner->remove(id);
}

std::size_t SlidingSessionStore::cleanup()
{
    return m_inner->cleanup();
}

std::size_t SlidingSessionStore::count()
{
    return m_inner->count();
}

std::optional<SessionInfo> SlidingSessionStore::info(std::string_view id)
{
    return m_inner->info(id);
}

std::string SlidingSessionStore::generateId()
{
    return m_inner->generateId();
}

std::chrono::seconds SlidingSessionStore::ttl() const noexcept
{
    return m_inner->ttl();
}

StoreSnapshot SlidingSessionStore::snapshot() const
{
    return m_inner->snapshot();
}

void SlidingSessionStore::restore(const std::vector<SessionEntry>& entries)
{
    m_inner->restore(entries);
}

} // namespace leasekeeper::core
