#include "leasekeeper/config/StoreConfig.hpp"

#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/logging/LogRegistry.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <spdlog/spdlog.h>

namespace leasekeeper::config
{
namespace
{

constexpr const char* g_kTtlKey{ "ttl_seconds" };
constexpr const char* g_kPolicyKey{ "policy" };
constexpr const char* g_kStoragePathKey{ "storage_path" };
constexpr const char* g_kRandomProviderKey{ "random_provider" };

[[noreturn]] void fail(const std::string& message)
{
    throw leasekeeper::core::ConfigurationError("config: " + message);
}

[[nodiscard]] std::int64_t parseTtlSeconds(const nlohmann::json& value)
{
    if (value.is_number_unsigned())
    {
        const auto raw{ value.get<std::uint64_t>() };
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
            fail("ttl_seconds is out of range");
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer())
    {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float())
    {
        // Whole-number floats such as 30.0 are accepted; 3.14 is not.
        const double raw{ value.get<double>() };
        constexpr double kMaxExact{ 9007199254740992.0 };
        if (!std::isfinite(raw) || std::trunc(raw) != raw || std::fabs(raw) > kMaxExact)
        {
            fail("ttl_seconds must be a whole number of seconds");
        }
        return static_cast<std::int64_t>(raw);
    }
    fail("ttl_seconds must be a number");
}

[[nodiscard]] std::string requireString(const nlohmann::json& j, const char* key)
{
    const auto& value{ j.at(key) };
    if (!value.is_string())
    {
        fail(std::string{ key } + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace

std::string_view toString(ExpiryPolicy policy) noexcept
{
    switch (policy)
    {
    case ExpiryPolicy::Fixed:
        return "fixed";
    case ExpiryPolicy::Sliding:
        return "sliding";
    }
    return "fixed";
}

std::string_view toString(RandomProvider provider) noexcept
{
    switch (provider)
    {
    case RandomProvider::Native:
        return "native";
    case RandomProvider::OpenSsl:
        return "openssl";
    }
    return "native";
}

std::optional<ExpiryPolicy> expiryPolicyFromString(std::string_view name) noexcept
{
    if (name == "fixed")
    {
        return ExpiryPolicy::Fixed;
    }
    if (name == "sliding")
    {
        return ExpiryPolicy::Sliding;
    }
    return std::nullopt;
}

std::optional<RandomProvider> randomProviderFromString(std::string_view name) noexcept
{
    if (name == "native")
    {
        return RandomProvider::Native;
    }
    if (name == "openssl")
    {
        return RandomProvider::OpenSsl;
    }
    return std::nullopt;
}

void StoreConfig::validate() const
{
    if (ttlSeconds <= 0)
    {
        fail("ttl_seconds must be a positive integer");
    }
    if (ttlSeconds > leasekeeper::core::g_kMaxSessionTtl.count())
    {
        fail("ttl_seconds must not exceed " + std::to_string(leasekeeper::core::g_kMaxSessionTtl.count()));
    }
}

StoreConfig storeConfigFromJson(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        fail("store configuration must be a JSON object");
    }
    if (!j.contains(g_kTtlKey))
    {
        fail("ttl_seconds is required");
    }

    StoreConfig out{};
    out.ttlSeconds = parseTtlSeconds(j.at(g_kTtlKey));

    if (j.contains(g_kPolicyKey))
    {
        const auto name{ requireString(j, g_kPolicyKey) };
        const auto policy{ expiryPolicyFromString(name) };
        if (!policy)
        {
            fail("unknown policy '" + name + "'");
        }
        out.policy = *policy;
    }

    if (j.contains(g_kStoragePathKey) && !j.at(g_kStoragePathKey).is_null())
    {
        out.storagePath = std::filesystem::path{ requireString(j, g_kStoragePathKey) };
    }

    if (j.contains(g_kRandomProviderKey))
    {
        const auto name{ requireString(j, g_kRandomProviderKey) };
        const auto provider{ randomProviderFromString(name) };
        if (!provider)
        {
            fail("unknown random_provider '" + name + "'");
        }
        out.randomProvider = *provider;
    }

    out.validate();
    return out;
}

nlohmann::json readConfigDocument(const std::filesystem::path& file)
{
    std::ifstream in{ file };
    if (!in)
    {
        fail("failed to open " + file.string());
    }

    auto doc{ nlohmann::json::parse(in, nullptr, false) };
    if (doc.is_discarded())
    {
        fail(file.string() + " is not valid JSON");
    }

    leasekeeper::logging::LogRegistry::config()->debug("Read configuration from {}", file.string());
    return doc;
}

StoreConfig loadStoreConfig(const std::filesystem::path& file)
{
    return storeConfigFromJson(readConfigDocument(file));
}

} // namespace leasekeeper::config
