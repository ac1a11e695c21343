#ifndef INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_NATIVERANDOMSOURCEFACTORY_HPP
#define INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_NATIVERANDOMSOURCEFACTORY_HPP

#include "leasekeeper/random/IRandomSource.hpp"
#include <memory>

namespace leasekeeper::random::providers
{

[[nodiscard]] std::shared_ptr<leasekeeper::random::IRandomSource> makeNativeRandomSource();

} // namespace leasekeeper::random::providers

#endif // INCLUDE_LEASEKEEPER_RANDOM_PROVIDERS_NATIVERANDOMSOURCEFACTORY_HPP
