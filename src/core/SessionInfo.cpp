#include "leasekeeper/core/SessionInfo.hpp"

#include <chrono>
#include <cmath>
#include <nlohmann/json.hpp>

namespace leasekeeper::core
{
namespace
{

[[nodiscard]] double roundedSeconds(ClockSource::Duration d) noexcept
{
    constexpr double kScale{ 100.0 };
    const double secs{ std::chrono::duration<double>(d).count() };
    return std::round(secs * kScale) / kScale;
}

} // namespace

std::string_view toString(DeleteResult result) noexcept
{
    switch (result)
    {
    case DeleteResult::Removed:
        return "Deleted";
    case DeleteResult::Absent:
        return "Not Found";
    }
    return "Not Found";
}

void to_json(nlohmann::json& j, const SessionInfo& info)
{
    j = nlohmann::json{
        { "session_id", info.id },
        { "start_time", wallToUnixSeconds(info.createdAtWall) },
        { "expires_at", wallToUnixSeconds(info.expiresAtWall) },
        { "age_seconds", roundedSeconds(info.age) },
        { "remaining_seconds", roundedSeconds(info.remaining) },
    };
}

} // namespace leasekeeper::core
