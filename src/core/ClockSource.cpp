#include "leasekeeper/core/ClockSource.hpp"

#include <cmath>
#include <utility>

namespace leasekeeper::core
{

ClockSource::ClockSource() : m_now(Clock::now), m_wallNow(WallClock::now)
{
}

ClockSource::ClockSource(NowProvider nowProvider, WallNowProvider wallNowProvider)
    : m_now(std::move(nowProvider)), m_wallNow(std::move(wallNowProvider))
{
}

ClockSource::TimePoint ClockSource::now() const
{
    return m_now();
}

ClockSource::WallTimePoint ClockSource::wallNow() const
{
    return m_wallNow();
}

ClockSource::WallTimePoint ClockSource::toWall(TimePoint instant) const
{
    const auto offset{ instant - now() };
    return wallNow() + std::chrono::duration_cast<WallClock::duration>(offset);
}

ClockSource::TimePoint ClockSource::fromWall(WallTimePoint instant) const
{
    const auto offset{ instant - wallNow() };
    return now() + std::chrono::duration_cast<Duration>(offset);
}

double ClockSource::toUnixSeconds(TimePoint instant) const
{
    return wallToUnixSeconds(toWall(instant));
}

ClockSource::TimePoint ClockSource::fromUnixSeconds(double unixSeconds) const
{
    return fromWall(unixSecondsToWall(unixSeconds));
}

double wallToUnixSeconds(ClockSource::WallTimePoint instant) noexcept
{
    using Seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<Seconds>(instant.time_since_epoch()).count();
}

ClockSource::WallTimePoint unixSecondsToWall(double unixSeconds) noexcept
{
    using Seconds = std::chrono::duration<double>;
    // Keeps the nanosecond representation of system_clock from overflowing on garbage input.
    constexpr double kLimitSeconds{ 4.0e9 };
    if (!std::isfinite(unixSeconds))
    {
        return ClockSource::WallTimePoint{};
    }
    const double clamped{ std::fmax(-kLimitSeconds, std::fmin(unixSeconds, kLimitSeconds)) };
    const auto sinceEpoch{ std::chrono::duration_cast<ClockSource::WallClock::duration>(Seconds{ clamped }) };
    return ClockSource::WallTimePoint{ sinceEpoch };
}

} // namespace leasekeeper::core
