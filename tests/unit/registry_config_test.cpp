#include "leasekeeper/config/RegistryConfig.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "test_utils/TestUtils.hpp"
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace
{
using leasekeeper::config::ActorType;
using leasekeeper::config::ExpiryPolicy;
using leasekeeper::core::ConfigurationError;
} // namespace

TEST(RegistryConfig, DefaultsPerActor)
{
    const auto cfg{ leasekeeper::config::defaultRegistryConfig() };

    EXPECT_EQ(cfg.driver.ttlSeconds, 1800);
    EXPECT_EQ(cfg.driver.policy, ExpiryPolicy::Sliding);
    EXPECT_FALSE(cfg.driver.isPersistent());

    EXPECT_EQ(cfg.rider.ttlSeconds, 3600);
    EXPECT_EQ(cfg.rider.policy, ExpiryPolicy::Fixed);
    EXPECT_FALSE(cfg.rider.isPersistent());

    EXPECT_EQ(cfg.delivery.ttlSeconds, 2700);
    EXPECT_EQ(cfg.delivery.policy, ExpiryPolicy::Fixed);
    EXPECT_EQ(cfg.delivery.storagePath, std::filesystem::path{ "delivery_sessions.json" });

    EXPECT_NO_THROW(cfg.validate());
}

TEST(RegistryConfig, ActorNames)
{
    EXPECT_EQ(leasekeeper::config::toString(ActorType::Driver), "driver");
    EXPECT_EQ(leasekeeper::config::toString(ActorType::Rider), "rider");
    EXPECT_EQ(leasekeeper::config::toString(ActorType::Delivery), "delivery");

    EXPECT_EQ(leasekeeper::config::actorTypeFromString("delivery"), ActorType::Delivery);
    EXPECT_FALSE(leasekeeper::config::actorTypeFromString("courier").has_value());
    EXPECT_FALSE(leasekeeper::config::actorTypeFromString("").has_value());
}

TEST(RegistryConfig, ForActorSelectsMatchingStore)
{
    auto cfg{ leasekeeper::config::defaultRegistryConfig() };
    cfg.forActor(ActorType::Rider).ttlSeconds = 99;
    EXPECT_EQ(cfg.rider.ttlSeconds, 99);
    EXPECT_EQ(&cfg.forActor(ActorType::Driver), &cfg.driver);
    EXPECT_EQ(&cfg.forActor(ActorType::Delivery), &cfg.delivery);
}

TEST(RegistryConfig, JsonOverridesOnlyNamedActors)
{
    const auto cfg{ leasekeeper::config::registryConfigFromJson(
        nlohmann::json::parse(R"({"rider": {"ttl_seconds": 120, "policy": "sliding"}})")) };

    EXPECT_EQ(cfg.rider.ttlSeconds, 120);
    EXPECT_EQ(cfg.rider.policy, ExpiryPolicy::Sliding);
    EXPECT_EQ(cfg.driver.ttlSeconds, 1800);
    EXPECT_EQ(cfg.delivery.ttlSeconds, 2700);
}

TEST(RegistryConfig, UnknownActorIsRejected)
{
    EXPECT_THROW((void)leasekeeper::config::registryConfigFromJson(
                     nlohmann::json::parse(R"({"courier": {"ttl_seconds": 10}})")),
                 ConfigurationError);
}

TEST(RegistryConfig, InvalidActorConfigNamesTheActor)
{
    try
    {
        (void)leasekeeper::config::registryConfigFromJson(nlohmann::json::parse(R"({"driver": {"ttl_seconds": -4}})"));
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(std::string{ e.what() }.rfind("driver", 0), 0U);
    }
}

TEST(RegistryConfig, ValidateReportsOffendingActor)
{
    auto cfg{ leasekeeper::config::defaultRegistryConfig() };
    cfg.delivery.ttlSeconds = 0;
    try
    {
        cfg.validate();
        FAIL() << "expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(std::string{ e.what() }.rfind("delivery", 0), 0U);
    }
}

TEST(RegistryConfig, LoadFromFile)
{
    const leasekeeper::test_utils::ScopedTempDir dir{ "registry_config_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "registry.json" };
    {
        std::ofstream out{ file };
        out << R"({"delivery": {"ttl_seconds": 600, "storage_path": null}})";
    }

    const auto cfg{ leasekeeper::config::loadRegistryConfig(file) };
    EXPECT_EQ(cfg.delivery.ttlSeconds, 600);
    EXPECT_FALSE(cfg.delivery.isPersistent());
}
