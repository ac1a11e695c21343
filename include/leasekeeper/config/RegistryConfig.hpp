#ifndef INCLUDE_LEASEKEEPER_CONFIG_REGISTRYCONFIG_HPP
#define INCLUDE_LEASEKEEPER_CONFIG_REGISTRYCONFIG_HPP

#include "leasekeeper/config/StoreConfig.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string_view>

namespace leasekeeper::config
{

enum class ActorType : std::uint8_t
{
    Driver,
    Rider,
    Delivery,
};

constexpr std::array<ActorType, 3> g_kAllActorTypes{ ActorType::Driver, ActorType::Rider, ActorType::Delivery };

[[nodiscard]] std::string_view toString(ActorType actor) noexcept;
[[nodiscard]] std::optional<ActorType> actorTypeFromString(std::string_view name) noexcept;

struct RegistryConfig final
{
    StoreConfig driver{};
    StoreConfig rider{};
    StoreConfig delivery{};

    [[nodiscard]] const StoreConfig& forActor(ActorType actor) const noexcept;
    [[nodiscard]] StoreConfig& forActor(ActorType actor) noexcept;

    void validate() const;
};

// Drivers keep sessions alive while they ping (sliding, 30 min), riders get a fixed hour,
// delivery agents a fixed 45 min persisted to delivery_sessions.json.
[[nodiscard]] RegistryConfig defaultRegistryConfig();

// Missing actors keep the defaults; present ones are parsed with storeConfigFromJson().
[[nodiscard]] RegistryConfig registryConfigFromJson(const nlohmann::json& j);
[[nodiscard]] RegistryConfig loadRegistryConfig(const std::filesystem::path& file);

} // namespace leasekeeper::config

#endif // INCLUDE_LEASEKEEPER_CONFIG_REGISTRYCONFIG_HPP
