#include "leasekeeper/config/RegistryConfig.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace leasekeeper::config
{
namespace
{

constexpr std::int64_t g_kDriverTtlSeconds{ 1800 };
constexpr std::int64_t g_kRiderTtlSeconds{ 3600 };
constexpr std::int64_t g_kDeliveryTtlSeconds{ 2700 };
constexpr const char* g_kDeliveryStorageFile{ "delivery_sessions.json" };

} // namespace

std::string_view toString(ActorType actor) noexcept
{
    switch (actor)
    {
    case ActorType::Driver:
        return "driver";
    case ActorType::Rider:
        return "rider";
    case ActorType::Delivery:
        return "delivery";
    }
    return "rider";
}

std::optional<ActorType> actorTypeFromString(std::string_view name) noexcept
{
    for (const auto actor : g_kAllActorTypes)
    {
        if (toString(actor) == name)
        {
            return actor;
        }
    }
    return std::nullopt;
}

const StoreConfig& RegistryConfig::forActor(ActorType actor) const noexcept
{
    switch (actor)
    {
    case ActorType::Driver:
        return driver;
    case ActorType::Delivery:
        return delivery;
    case ActorType::Rider:
        break;
    }
    return rider;
}

StoreConfig& RegistryConfig::forActor(ActorType actor) noexcept
{
    switch (actor)
    {
    case ActorType::Driver:
        return driver;
    case ActorType::Delivery:
        return delivery;
    case ActorType::Rider:
        break;
    }
    return rider;
}

void RegistryConfig::validate() const
{
    for (const auto actor : g_kAllActorTypes)
    {
        try
        {
            forActor(actor).validate();
        }
        catch (const leasekeeper::core::ConfigurationError& e)
        {
            throw leasekeeper::core::ConfigurationError(std::string{ toString(actor) } + ": " + e.what());
        }
    }
}

RegistryConfig defaultRegistryConfig()
{
    RegistryConfig out{};
    out.driver.ttlSeconds = g_kDriverTtlSeconds;
    out.driver.policy = ExpiryPolicy::Sliding;

    out.rider.ttlSeconds = g_kRiderTtlSeconds;
    out.rider.policy = ExpiryPolicy::Fixed;

    out.delivery.ttlSeconds = g_kDeliveryTtlSeconds;
    out.delivery.policy = ExpiryPolicy::Fixed;
    out.delivery.storagePath = std::filesystem::path{ g_kDeliveryStorageFile };
    return out;
}

RegistryConfig registryConfigFromJson(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw leasekeeper::core::ConfigurationError("config: registry configuration must be a JSON object");
    }

    RegistryConfig out{ defaultRegistryConfig() };
    for (const auto& [key, value] : j.items())
    {
        const auto actor{ actorTypeFromString(key) };
        if (!actor)
        {
            throw leasekeeper::core::ConfigurationError("config: unknown actor type '" + key + "'");
        }

        try
        {
            out.forActor(*actor) = storeConfigFromJson(value);
        }
        catch (const leasekeeper::core::ConfigurationError& e)
        {
            throw leasekeeper::core::ConfigurationError(key + ": " + e.what());
        }
    }
    return out;
}

RegistryConfig loadRegistryConfig(const std::filesystem::path& file)
{
    return registryConfigFromJson(readConfigDocument(file));
}

} // namespace leasekeeper::config
