#ifndef INCLUDE_LEASEKEEPER_CORE_SESSIONERRORS_HPP
#define INCLUDE_LEASEKEEPER_CORE_SESSIONERRORS_HPP

#include <stdexcept>

namespace leasekeeper::core
{

// Invalid construction parameters (ttl, policy, provider). Raised before any store exists.
class ConfigurationError final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

// Empty or malformed session identifier passed to a mutating call.
class InvalidArgument final : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

class RandomSourceError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_SESSIONERRORS_HPP
