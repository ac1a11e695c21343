#ifndef INCLUDE_LEASEKEEPER_SECURITY_SECURERANDOM_HPP
#define INCLUDE_LEASEKEEPER_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace leasekeeper::security
{

// OS CSPRNG (getrandom on Linux, BCryptGenRandom on Windows).
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace leasekeeper::security

#endif // INCLUDE_LEASEKEEPER_SECURITY_SECURERANDOM_HPP
