#ifndef INCLUDE_LEASEKEEPER_SERVICE_SESSIONREGISTRY_HPP
#define INCLUDE_LEASEKEEPER_SERVICE_SESSIONREGISTRY_HPP

#include "leasekeeper/config/RegistryConfig.hpp"
#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/service/SessionManager.hpp"
#include <cstddef>
#include <memory>

namespace leasekeeper::service
{

struct CleanupReport final
{
    std::size_t driver{};
    std::size_t rider{};
    std::size_t delivery{};

    [[nodiscard]] std::size_t total() const noexcept
    {
        return driver + rider + delivery;
    }
};

struct ActiveCounts final
{
    std::size_t driver{};
    std::size_t rider{};
    std::size_t delivery{};
};

// One SessionManager per actor type, built up front from a RegistryConfig.
class SessionRegistry final
{
public:
    // Throws ConfigurationError naming the actor whose configuration is invalid.
    explicit SessionRegistry(
        const leasekeeper::config::RegistryConfig& config = leasekeeper::config::defaultRegistryConfig(),
        const leasekeeper::core::ClockSource& clock = {});

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;
    SessionRegistry(SessionRegistry&&) = delete;
    SessionRegistry& operator=(SessionRegistry&&) = delete;
    ~SessionRegistry() = default;

    [[nodiscard]] SessionManager& manager(leasekeeper::config::ActorType actor) noexcept;

    CleanupReport cleanupAll();
    [[nodiscard]] ActiveCounts activeCounts();

private:
    std::unique_ptr<SessionManager> m_driver;
    std::unique_ptr<SessionManager> m_rider;
    std::unique_ptr<SessionManager> m_delivery;
};

} // namespace leasekeeper::service

#endif // INCLUDE_LEASEKEEPER_SERVICE_SESSIONREGISTRY_HPP
