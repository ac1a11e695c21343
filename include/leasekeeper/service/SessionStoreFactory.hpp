#ifndef INCLUDE_LEASEKEEPER_SERVICE_SESSIONSTOREFACTORY_HPP
#define INCLUDE_LEASEKEEPER_SERVICE_SESSIONSTOREFACTORY_HPP

#include "leasekeeper/config/StoreConfig.hpp"
#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/ISessionStore.hpp"
#include "leasekeeper/random/IRandomSource.hpp"
#include <memory>

namespace leasekeeper::service
{

// Throws ConfigurationError if the provider was not compiled in (OpenSSL without LSK_ENABLE_OPENSSL).
[[nodiscard]] std::shared_ptr<leasekeeper::random::IRandomSource>
makeRandomSource(leasekeeper::config::RandomProvider provider);

// Assembles the policy described by `config`: a fixed-window store, wrapped in the sliding decorator when
// requested, wrapped again in the persistence adapter when a storage path is set.
// Every layer shares `clock`. Throws ConfigurationError for an invalid configuration.
[[nodiscard]] std::unique_ptr<leasekeeper::core::ISessionStore>
makeSessionStore(const leasekeeper::config::StoreConfig& config, leasekeeper::core::ClockSource clock = {});

} // namespace leasekeeper::service

#endif // INCLUDE_LEASEKEEPER_SERVICE_SESSIONSTOREFACTORY_HPP
