#include "leasekeeper/random/providers/NativeRandomSourceFactory.hpp"

#include "leasekeeper/security/SecureRandom.hpp"

namespace leasekeeper::random::providers
{
namespace
{

class NativeRandomSource final : public leasekeeper::random::IRandomSource
{
public:
    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return leasekeeper::security::secureRandomFill(out);
    }
};

} // namespace

std::shared_ptr<leasekeeper::random::IRandomSource> makeNativeRandomSource()
{
    return std::make_shared<NativeRandomSource>();
}

} // namespace leasekeeper::random::providers
