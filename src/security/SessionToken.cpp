#include "leasekeeper/security/SessionToken.hpp"

#include <algorithm>
#include <array>

namespace leasekeeper::security
{

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

std::optional<std::string> generateSessionToken(leasekeeper::random::IRandomSource& source)
{
    std::array<std::uint8_t, g_kSessionTokenBytes> raw{};
    if (!source.randomBytes(std::span<std::uint8_t>{ raw }))
    {
        return std::nullopt;
    }
    return toHex(std::span<const std::uint8_t>{ raw });
}

bool isWellFormedSessionId(std::string_view id) noexcept
{
    if (id.empty() || id.size() > g_kMaxSessionIdBytes)
    {
        return false;
    }

    constexpr char kFirstPrintable{ '!' };
    constexpr char kLastPrintable{ '~' };
    return std::all_of(id.begin(), id.end(), [](char c) { return c >= kFirstPrintable && c <= kLastPrintable; });
}

} // namespace leasekeeper::security
