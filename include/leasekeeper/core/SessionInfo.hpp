#ifndef INCLUDE_LEASEKEEPER_CORE_SESSIONINFO_HPP
#define INCLUDE_LEASEKEEPER_CORE_SESSIONINFO_HPP

#include "leasekeeper/core/ClockSource.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <string_view>

namespace leasekeeper::core
{

enum class DeleteResult : std::uint8_t
{
    Removed,
    Absent,
};

[[nodiscard]] std::string_view toString(DeleteResult result) noexcept;

// Point-in-time view of a live session. `createdAt` is the instant of creation or of the last sliding refresh.
struct SessionInfo final
{
    std::string id;
    ClockSource::Duration age{};
    ClockSource::Duration remaining{};
    ClockSource::TimePoint createdAt{};
    ClockSource::TimePoint expiresAt{};
    ClockSource::WallTimePoint createdAtWall{};
    ClockSource::WallTimePoint expiresAtWall{};
};

// {"session_id", "start_time", "expires_at", "age_seconds", "remaining_seconds"}; times are Unix seconds,
// age/remaining are rounded to two decimals.
void to_json(nlohmann::json& j, const SessionInfo& info);

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_SESSIONINFO_HPP
