#ifndef INCLUDE_LEASEKEEPER_RANDOM_IRANDOMSOURCE_HPP
#define INCLUDE_LEASEKEEPER_RANDOM_IRANDOMSOURCE_HPP

#include <cstdint>
#include <span>

namespace leasekeeper::random
{

class IRandomSource
{
public:
    IRandomSource() = default;
    IRandomSource(const IRandomSource&) = delete;
    IRandomSource& operator=(const IRandomSource&) = delete;
    IRandomSource(IRandomSource&&) = delete;
    IRandomSource& operator=(IRandomSource&&) = delete;
    virtual ~IRandomSource() = default;

    // Fills `out` with cryptographically secure bytes. Returns false if the generator failed;
    // the contents of `out` are unspecified in that case. Must be safe to call concurrently.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;
};

} // namespace leasekeeper::random

#endif // INCLUDE_LEASEKEEPER_RANDOM_IRANDOMSOURCE_HPP
