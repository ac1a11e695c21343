#ifndef INCLUDE_LEASEKEEPER_SERVICE_SESSIONMANAGER_HPP
#define INCLUDE_LEASEKEEPER_SERVICE_SESSIONMANAGER_HPP

#include "leasekeeper/config/StoreConfig.hpp"
#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/ISessionStore.hpp"
#include "leasekeeper/core/SessionInfo.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace leasekeeper::service
{

// Owns one store and exposes the session lifecycle to applications.
// Thread-safe to the extent of the wrapped store (all shipped stores are).
class SessionManager final
{
public:
    // Throws ConfigurationError for an invalid configuration.
    explicit SessionManager(const leasekeeper::config::StoreConfig& config, leasekeeper::core::ClockSource clock = {});

    // Takes an already assembled store; `policy` and `persistent` only feed the accessors.
    // Throws ConfigurationError if `store` is null.
    SessionManager(std::unique_ptr<leasekeeper::core::ISessionStore> store, leasekeeper::config::ExpiryPolicy policy,
                   bool persistent = false);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;
    ~SessionManager() = default;

    void create(std::string_view id);
    [[nodiscard]] std::string create();
    [[nodiscard]] bool isActive(std::string_view id);
    [[nodiscard]] leasekeeper::core::DeleteResult remove(std::string_view id);

    // Same as remove(); true iff a live session was removed.
    bool endSession(std::string_view id);

    std::size_t cleanup();
    [[nodiscard]] std::size_t count();
    [[nodiscard]] std::optional<leasekeeper::core::SessionInfo> info(std::string_view id);
    [[nodiscard]] std::string generateId();

    [[nodiscard]] std::chrono::seconds ttl() const noexcept;
    [[nodiscard]] leasekeeper::config::ExpiryPolicy policy() const noexcept;
    [[nodiscard]] bool isPersistent() const noexcept;

    [[nodiscard]] leasekeeper::core::ISessionStore& store() noexcept;

private:
    std::unique_ptr<leasekeeper::core::ISessionStore> m_store;
    leasekeeper::config::ExpiryPolicy m_policy;
    bool m_persistent;
};

} // namespace leasekeeper::service

#endif // INCLUDE_LEASEKEEPER_SERVICE_SESSIONMANAGER_HPP
