#include "leasekeeper/service/SessionStoreFactory.hpp"

#include "leasekeeper/core/PersistentSessionStore.hpp"
#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/core/SessionStore.hpp"
#include "leasekeeper/core/SlidingSessionStore.hpp"
#include "leasekeeper/random/providers/NativeRandomSourceFactory.hpp"
#include "leasekeeper/storage/json/JsonSnapshotRepositoryFactory.hpp"
#include <string>
#include <utility>

#if defined(LSK_ENABLE_OPENSSL)
#include "leasekeeper/random/providers/OpenSslRandomSourceFactory.hpp"
#endif

namespace leasekeeper::service
{

std::shared_ptr<leasekeeper::random::IRandomSource> makeRandomSource(leasekeeper::config::RandomProvider provider)
{
    switch (provider)
    {
    case leasekeeper::config::RandomProvider::Native:
        return leasekeeper::random::providers::makeNativeRandomSource();
    case leasekeeper::config::RandomProvider::OpenSsl:
#if defined(LSK_ENABLE_OPENSSL)
        return leasekeeper::random::providers::makeOpenSslRandomSource();
#else
        throw leasekeeper::core::ConfigurationError("random provider 'openssl' is not available in this build");
#endif
    }
    throw leasekeeper::core::ConfigurationError("unknown random provider");
}

std::unique_ptr<leasekeeper::core::ISessionStore> makeSessionStore(const leasekeeper::config::StoreConfig& config,
                                                                   leasekeeper::core::ClockSource clock)
{
    config.validate();

    auto base{ std::make_unique<leasekeeper::core::SessionStore>(
        config.ttl(), makeRandomSource(config.randomProvider), clock) };

    std::unique_ptr<leasekeeper::core::ISessionStore> store{};
    if (config.policy == leasekeeper::config::ExpiryPolicy::Sliding)
    {
        store = std::make_unique<leasekeeper::core::SlidingSessionStore>(std::move(base));
    }
    else
    {
        store = std::move(base);
    }

    if (!config.isPersistent())
    {
        return store;
    }

    return std::make_unique<leasekeeper::core::PersistentSessionStore>(
        std::move(store), leasekeeper::storage::json::makeJsonSnapshotRepository(config.storagePath),
        std::move(clock));
}

} // namespace leasekeeper::service
