#ifndef INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_OPENSSLRANDOMSOURCEFACTORY_HPP
#define INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_OPENSSLRANDOMSOURCEFACTORY_HPP

#include "leasekeeper/random/IRandomSource.hpp"
#include <memory>

namespace leasekeeper::random::providers
{

// Backed by OpenSSL's default DRBG (RAND_bytes).
[[nodiscard]] std::shared_ptr<leasekeeper::random::IRandomSource> makeOpenSslRandomSource();

} // namespace leasekeeper::random::providers

#endif // INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_OPENSSLRANDOMSOURCEFACTORY_HPP
