#ifndef INCLUDE_LEASEKEEPER_CONFIG_STORECONFIG_HPP
#define INCLUDE_LEASEKEEPER_CONFIG_STORECONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace leasekeeper::config
{

enum class ExpiryPolicy : std::uint8_t
{
    Fixed,
    Sliding,
};

enum class RandomProvider : std::uint8_t
{
    Native,
    OpenSsl,
};

[[nodiscard]] std::string_view toString(ExpiryPolicy policy) noexcept;
[[nodiscard]] std::string_view toString(RandomProvider provider) noexcept;
[[nodiscard]] std::optional<ExpiryPolicy> expiryPolicyFromString(std::string_view name) noexcept;
[[nodiscard]] std::optional<RandomProvider> randomProviderFromString(std::string_view name) noexcept;

struct StoreConfig final
{
    std::int64_t ttlSeconds{};
    ExpiryPolicy policy{ ExpiryPolicy::Fixed };
    // Empty keeps the store in memory only.
    std::filesystem::path storagePath{};
    RandomProvider randomProvider{ RandomProvider::Native };

    // Throws leasekeeper::core::ConfigurationError.
    void validate() const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept
    {
        return std::chrono::seconds{ ttlSeconds };
    }
    [[nodiscard]] bool isPersistent() const noexcept
    {
        return !storagePath.empty();
    }
};

// Reads {"ttl_seconds", "policy", "storage_path", "random_provider"}; only ttl_seconds is required.
// Throws leasekeeper::core::ConfigurationError naming the offending key. The result is validated.
[[nodiscard]] StoreConfig storeConfigFromJson(const nlohmann::json& j);
[[nodiscard]] StoreConfig loadStoreConfig(const std::filesystem::path& file);

// Parses a whole JSON document from `file`; shared by the config loaders.
[[nodiscard]] nlohmann::json readConfigDocument(const std::filesystem::path& file);

} // namespace leasekeeper::config

#endif // INCLUDE_LEASEKEEPER_CONFIG_STORECONFIG_HPP
