#ifndef INCLUDE_LEASEKEEPER_CORE_CLOCKSOURCE_HPP
#define INCLUDE_LEASEKEEPER_CORE_CLOCKSOURCE_HPP

#include <chrono>
#include <functional>

namespace leasekeeper::core
{

// Expiry arithmetic runs on the monotonic clock only. The wall clock is consulted
// when an instant has to leave the process (persisted snapshots, JSON records).
class ClockSource final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;
    using WallClock = std::chrono::system_clock;
    using WallTimePoint = WallClock::time_point;
    using NowProvider = std::function<TimePoint()>;
    using WallNowProvider = std::function<WallTimePoint()>;

    ClockSource();
    ClockSource(NowProvider nowProvider, WallNowProvider wallNowProvider);

    [[nodiscard]] TimePoint now() const;
    [[nodiscard]] WallTimePoint wallNow() const;

    // Maps a monotonic instant onto the wall timeline (and back) using the current offset between the two clocks.
    [[nodiscard]] WallTimePoint toWall(TimePoint instant) const;
    [[nodiscard]] TimePoint fromWall(WallTimePoint instant) const;

    [[nodiscard]] double toUnixSeconds(TimePoint instant) const;
    [[nodiscard]] TimePoint fromUnixSeconds(double unixSeconds) const;

private:
    NowProvider m_now;
    WallNowProvider m_wallNow;
};

// Longest accepted session lifetime (50 years). Keeps `now + ttl` well inside the nanosecond range of both clocks
// and inside the range of persisted Unix timestamps.
inline constexpr std::chrono::seconds g_kMaxSessionTtl{ 50LL * 365 * 24 * 60 * 60 };

[[nodiscard]] double wallToUnixSeconds(ClockSource::WallTimePoint instant) noexcept;
[[nodiscard]] ClockSource::WallTimePoint unixSecondsToWall(double unixSeconds) noexcept;

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_CLOCKSOURCE_HPP
