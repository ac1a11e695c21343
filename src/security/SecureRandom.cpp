#include "leasekeeper/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace leasekeeper::security
{
namespace
{

#if defined(_WIN32)

[[nodiscard]] bool fillChunk(std::span<std::uint8_t> chunk) noexcept
{
    const NTSTATUS status{ BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(chunk.data()),
                                           static_cast<ULONG>(chunk.size()), BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status);
}

constexpr std::size_t g_kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };

#else

// getrandom() may return short reads for large requests or when interrupted by a signal.
[[nodiscard]] bool fillChunk(std::span<std::uint8_t> chunk) noexcept
{
    while (!chunk.empty())
    {
        const ssize_t got{ ::getrandom(chunk.data(), chunk.size(), 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > chunk.size())
        {
            return false;
        }
        chunk = chunk.subspan(static_cast<std::size_t>(got));
    }
    return true;
}

constexpr std::size_t g_kMaxChunk{ static_cast<std::size_t>(std::numeric_limits<ssize_t>::max()) };

#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const std::size_t len{ (out.size() > g_kMaxChunk) ? g_kMaxChunk : out.size() };
        if (!fillChunk(out.first(len)))
        {
            return false;
        }
        out = out.subspan(len);
    }
    return true;
}

} // namespace leasekeeper::security
