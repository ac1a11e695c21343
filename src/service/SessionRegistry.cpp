#include "leasekeeper/service/SessionRegistry.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/logging/LogRegistry.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace leasekeeper::service
{
namespace
{

[[nodiscard]] std::unique_ptr<SessionManager> makeManager(const leasekeeper::config::RegistryConfig& config,
                                                          leasekeeper::config::ActorType actor,
                                                          const leasekeeper::core::ClockSource& clock)
{
    try
    {
        return std::make_unique<SessionManager>(config.forActor(actor), clock);
    }
    catch (const leasekeeper::core::ConfigurationError& e)
    {
        throw leasekeeper::core::ConfigurationError(std::string{ leasekeeper::config::toString(actor) } + ": " +
                                                    e.what());
    }
}

} // namespace

SessionRegistry::SessionRegistry(const leasekeeper::config::RegistryConfig& config,
                                 const leasekeeper::core::ClockSource& clock)
    : m_driver(makeManager(config, leasekeeper::config::ActorType::Driver, clock)),
      m_rider(makeManager(config, leasekeeper::config::ActorType::Rider, clock)),
      m_delivery(makeManager(config, leasekeeper::config::ActorType::Delivery, clock))
{
}

SessionManager& SessionRegistry::manager(leasekeeper::config::ActorType actor) noexcept
{
    switch (actor)
    {
    case leasekeeper::config::ActorType::Driver:
        return *m_driver;
    case leasekeeper::config::ActorType::Delivery:
        return *m_delivery;
    case leasekeeper::config::ActorType::Rider:
        break;
    }
    return *m_rider;
}

CleanupReport SessionRegistry::cleanupAll()
{
    CleanupReport report{};
    report.driver = m_driver->cleanup();
    report.rider = m_rider->cleanup();
    report.delivery = m_delivery->cleanup();

    if (report.total() > 0U)
    {
        leasekeeper::logging::LogRegistry::store()->info(
            "Cleaned up {} expired sessions (driver {}, rider {}, delivery {})", report.total(), report.driver,
            report.rider, report.delivery);
    }
    return report;
}

ActiveCounts SessionRegistry::activeCounts()
{
    return ActiveCounts{ m_driver->count(), m_rider->count(), m_delivery->count() };
}

} // namespace leasekeeper::service
