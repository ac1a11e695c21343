#include "leasekeeper/random/providers/OpenSslRandomSourceFactory.hpp"

#include <cstddef>
#include <limits>
#include <openssl/rand.h>

namespace leasekeeper::random::providers
{
namespace
{

constexpr std::size_t g_kMaxRandChunk{ static_cast<std::size_t>(std::numeric_limits<int>::max()) };

class OpenSslRandomSource final : public leasekeeper::random::IRandomSource
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        while (!out.empty())
        {
            const std::size_t len{ (out.size() > g_kMaxRandChunk) ? g_kMaxRandChunk : out.size() };
            if (RAND_bytes(out.data(), static_cast<int>(len)) != 1)
            {
                return false;
            }
            out = out.subspan(len);
        }
        return true;
    }
};

} // namespace

std::shared_ptr<leasekeeper::random::IRandomSource> makeOpenSslRandomSource()
{
    return std::make_shared<OpenSslRandomSource>();
}

} // namespace leasekeeper::random::providers
