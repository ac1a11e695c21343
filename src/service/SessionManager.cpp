#include "leasekeeper/service/SessionManager.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/service/SessionStoreFactory.hpp"
#include <utility>

namespace leasekeeper::service
{

SessionManager::SessionManager(const leasekeeper::config::StoreConfig& config, leasekeeper::core::ClockSource clock)
    : m_store(makeSessionStore(config, std::move(clock))), m_policy(config.policy),
      m_persistent(config.isPersistent())
{
}

SessionManager::SessionManager(std::unique_ptr<leasekeeper::core::ISessionStore> store,
                               leasekeeper::config::ExpiryPolicy policy, bool persistent)
    : m_store(std::move(store)), m_policy(policy), m_persistent(persistent)
{
    if (!m_store)
    {
        throw leasekeeper::core::ConfigurationError("session manager: store is required");
    }
}

void SessionManager::create(std::string_view id)
{
    m_store->create(id);
}

std::string SessionManager::create()
{
    return m_store->create();
}

bool SessionManager::isActive(std::string_view id)
{
    return m_store->isActive(id);
}

leasekeeper::core::DeleteResult SessionManager::remove(std::string_view id)
{
    return m_store->remove(id);
}

bool SessionManager::endSession(std::string_view id)
{
    return remove(id) == leasekeeper::core::DeleteResult::Removed;
}

std::size_t SessionManager::cleanup()
{
    return m_store->cleanup();
}

std::size_t SessionManager::count()
{
    return m_store->count();
}

std::optional<leasekeeper::core::SessionInfo> SessionManager::info(std::string_view id)
{
    return m_store->info(id);
}

std::string SessionManager::generateId()
{
    return m_store->generateId();
}

std::chrono::seconds SessionManager::ttl() const noexcept
{
    return m_store->ttl();
}

leasekeeper::config::ExpiryPolicy SessionManager::policy() const noexcept
{
    return m_policy;
}

bool SessionManager::isPersistent() const noexcept
{
    return m_persistent;
}

leasekeeper::core::ISessionStore& SessionManager::store() noexcept
{
    return *m_store;
}

} // namespace leasekeeper::service
