#ifndef INCLUDE_LEASEKEEPER_SECURITY_SESSIONTOKEN_HPP
#define INCLUDE_LEASEKEEPER_SECURITY_SESSIONTOKEN_HPP

#include "leasekeeper/random/IRandomSource.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace leasekeeper::security
{

constexpr std::size_t g_kSessionTokenBytes{ 16U };
constexpr std::size_t g_kSessionTokenHexChars{ g_kSessionTokenBytes * 2U };
constexpr std::size_t g_kMaxSessionIdBytes{ 256U };

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

// 128 bits from `source`, rendered as 32 lowercase hex characters.
// Returns std::nullopt if the random source failed.
[[nodiscard]] std::optional<std::string> generateSessionToken(leasekeeper::random::IRandomSource& source);

// Accepts 1..g_kMaxSessionIdBytes printable, non-space ASCII characters.
[[nodiscard]] bool isWellFormedSessionId(std::string_view id) noexcept;

} // namespace leasekeeper::security

#endif // INCLUDE_LEASEKEEPER_SECURITY_SESSIONTOKEN_HPP
