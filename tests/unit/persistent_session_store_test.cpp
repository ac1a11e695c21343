#include "leasekeeper/core/PersistentSessionStore.hpp"

#include "leasekeeper/core/SessionErrors.hpp"
#include "leasekeeper/core/SessionStore.hpp"
#include "leasekeeper/core/SlidingSessionStore.hpp"
#include "leasekeeper/random/providers/NativeRandomSourceFactory.hpp"
#include "leasekeeper/storage/StorageErrors.hpp"
#include "leasekeeper/storage/json/JsonSnapshotRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace
{
using leasekeeper::core::DeleteResult;
using leasekeeper::core::PersistentSessionStore;
using leasekeeper::core::SessionStore;
using leasekeeper::storage::LoadedSnapshot;
using leasekeeper::storage::PersistedSession;
using leasekeeper::test_utils::ManualClock;
using leasekeeper::test_utils::ScopedTempDir;
using Seconds = std::chrono::seconds;
using ::testing::_;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::Throw;

class MockSnapshotRepository final : public leasekeeper::storage::ISnapshotRepository
{
public:
    MOCK_METHOD(std::optional<LoadedSnapshot>, load, (), (const, override));
    MOCK_METHOD(void, save, (const std::vector<PersistedSession>&), (override));
    MOCK_METHOD(const std::filesystem::path&, location, (), (const, noexcept, override));
};

[[nodiscard]] std::unique_ptr<SessionStore> makeFixed(Seconds ttl, const ManualClock& clock)
{
    return std::make_unique<SessionStore>(ttl, leasekeeper::random::providers::makeNativeRandomSource(),
                                          clock.source());
}

[[nodiscard]] std::unique_ptr<PersistentSessionStore> makePersistent(Seconds ttl, const std::filesystem::path& file,
                                                                     const ManualClock& clock)
{
    return std::make_unique<PersistentSessionStore>(
        makeFixed(ttl, clock), leasekeeper::storage::json::makeJsonSnapshotRepository(file), clock.source());
}

[[nodiscard]] nlohmann::json readJson(const std::filesystem::path& file)
{
    std::ifstream in{ file };
    return nlohmann::json::parse(in);
}

void writeText(const std::filesystem::path& file, const std::string& text)
{
    std::ofstream out{ file, std::ios::binary | std::ios::trunc };
    ASSERT_TRUE(static_cast<bool>(out));
    out << text;
    out.flush();
    ASSERT_TRUE(static_cast<bool>(out));
}

[[nodiscard]] double wallUnix(Seconds offset)
{
    return static_cast<double>(ManualClock::kWallBaseUnixSeconds + offset.count());
}

} // namespace

TEST(PersistentSessionStore, RequiresInnerStore)
{
    EXPECT_THROW((PersistentSessionStore{ nullptr, nullptr }), leasekeeper::core::ConfigurationError);
}

TEST(PersistentSessionStore, WithoutRepositoryBehavesInMemory)
{
    ManualClock clock{};
    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), nullptr, clock.source() };

    EXPECT_FALSE(store.isDurable());
    store.create("A");
    EXPECT_TRUE(store.isActive("A"));
    EXPECT_EQ(store.remove("A"), DeleteResult::Removed);
    EXPECT_EQ(store.count(), 0U);
}

TEST(PersistentSessionStore, SecondInstanceSeesSessionsOfFirst)
{
    const ScopedTempDir dir{ "persistent_reload_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    ManualClock clock{};

    {
        auto first{ makePersistent(Seconds{ 30 }, file, clock) };
        EXPECT_TRUE(first->isDurable());
        first->create("D");
    }

    auto second{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_TRUE(second->isActive("D"));
}

TEST(PersistentSessionStore, FileMapsIdToUnixExpiry)
{
    const ScopedTempDir dir{ "persistent_format_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    store->create("D");

    const auto doc{ readJson(file) };
    ASSERT_TRUE(doc.is_object());
    ASSERT_EQ(doc.size(), 1U);
    ASSERT_TRUE(doc.contains("D"));
    EXPECT_DOUBLE_EQ(doc.at("D").get<double>(), wallUnix(Seconds{ 30 }));
}

TEST(PersistentSessionStore, ReloadPrunesSessionsThatExpiredWhileDown)
{
    const ScopedTempDir dir{ "persistent_prune_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    ManualClock clock{};

    {
        auto first{ makePersistent(Seconds{ 10 }, file, clock) };
        first->create("short");
        clock.advance(Seconds{ 5 });
        first->create("long");
    }

    clock.advance(Seconds{ 7 });
    auto second{ makePersistent(Seconds{ 10 }, file, clock) };
    EXPECT_EQ(second->snapshot().entries.size(), 1U);
    EXPECT_FALSE(second->isActive("short"));
    EXPECT_TRUE(second->isActive("long"));

    const auto info{ second->info("long") };
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(std::chrono::duration_cast<Seconds>(info->remaining), Seconds{ 3 });
}

TEST(PersistentSessionStore, RemoveIsWrittenThrough)
{
    const ScopedTempDir dir{ "persistent_remove_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    store->create("a");
    store->create("b");
    EXPECT_EQ(store->remove("a"), DeleteResult::Removed);

    const auto doc{ readJson(file) };
    EXPECT_FALSE(doc.contains("a"));
    EXPECT_TRUE(doc.contains("b"));

    auto reloaded{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_FALSE(reloaded->isActive("a"));
    EXPECT_TRUE(reloaded->isActive("b"));
}

TEST(PersistentSessionStore, MissingFileStartsEmpty)
{
    const ScopedTempDir dir{ "persistent_missing_" };
    ASSERT_FALSE(dir.path().empty());
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, dir.path() / "absent.json", clock) };
    EXPECT_EQ(store->count(), 0U);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "absent.json"));
}

TEST(PersistentSessionStore, CorruptFileStartsEmptyAndIsReplacedOnWrite)
{
    const ScopedTempDir dir{ "persistent_corrupt_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    writeText(file, "{ not json");
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_EQ(store->count(), 0U);

    store->create("fresh");
    const auto doc{ readJson(file) };
    EXPECT_TRUE(doc.contains("fresh"));
}

TEST(PersistentSessionStore, NonObjectRootStartsEmpty)
{
    const ScopedTempDir dir{ "persistent_array_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    writeText(file, "[1, 2, 3]");
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_EQ(store->count(), 0U);
}

TEST(PersistentSessionStore, MalformedEntriesAreSkippedOnLoad)
{
    const ScopedTempDir dir{ "persistent_entries_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };

    nlohmann::json doc = nlohmann::json::object();
    doc["good"] = wallUnix(Seconds{ 60 });
    doc["text"] = "tomorrow";
    doc["bad id"] = wallUnix(Seconds{ 60 });
    doc["stale"] = wallUnix(Seconds{ -60 });
    writeText(file, doc.dump());
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_EQ(store->count(), 1U);
    EXPECT_TRUE(store->isActive("good"));
}

TEST(PersistentSessionStore, UnwritablePathKeepsInMemoryBehaviour)
{
    const ScopedTempDir dir{ "persistent_unwritable_" };
    ASSERT_FALSE(dir.path().empty());
    // A regular file where a parent directory is expected makes every write fail.
    const auto blocker{ dir.path() / "blocker" };
    writeText(blocker, "x");
    const auto file{ blocker / "sessions.json" };
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    EXPECT_NO_THROW(store->create("A"));
    EXPECT_TRUE(store->isActive("A"));
    EXPECT_EQ(store->remove("A"), DeleteResult::Removed);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST(PersistentSessionStore, CreatesMissingParentDirectories)
{
    const ScopedTempDir dir{ "persistent_mkdir_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "nested" / "deeper" / "sessions.json" };
    ManualClock clock{};

    auto store{ makePersistent(Seconds{ 30 }, file, clock) };
    store->create("A");
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::path{ file.string() + ".tmp" }));
}

TEST(PersistentSessionStore, SlidingRefreshSurvivesNextWrite)
{
    const ScopedTempDir dir{ "persistent_sliding_" };
    ASSERT_FALSE(dir.path().empty());
    const auto file{ dir.path() / "sessions.json" };
    ManualClock clock{};

    {
        auto sliding{ std::make_unique<leasekeeper::core::SlidingSessionStore>(makeFixed(Seconds{ 10 }, clock)) };
        PersistentSessionStore store{ std::move(sliding), leasekeeper::storage::json::makeJsonSnapshotRepository(file),
                                      clock.source() };
        store.create("driver");
        clock.advance(Seconds{ 8 });
        ASSERT_TRUE(store.isActive("driver"));
        store.create("other");
    }

    clock.advance(Seconds{ 5 });
    auto reloaded{ makePersistent(Seconds{ 10 }, file, clock) };
    EXPECT_TRUE(reloaded->isActive("driver"));
}

TEST(PersistentSessionStore, CleanupWritesOnlyWhenSomethingWasRemoved)
{
    ManualClock clock{};
    auto repo{ std::make_unique<MockSnapshotRepository>() };
    const std::filesystem::path location{ "mock.json" };
    EXPECT_CALL(*repo, location()).WillRepeatedly(ReturnRef(location));
    EXPECT_CALL(*repo, load()).WillOnce(Return(std::nullopt));
    // create() and the one effective cleanup().
    EXPECT_CALL(*repo, save(_)).Times(2);

    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), std::move(repo), clock.source() };
    store.create("a");
    EXPECT_EQ(store.cleanup(), 0U);
    clock.advance(Seconds{ 5 });
    EXPECT_EQ(store.cleanup(), 1U);
    EXPECT_EQ(store.cleanup(), 0U);
}

TEST(PersistentSessionStore, ReadsNeverTouchRepository)
{
    ManualClock clock{};
    auto repo{ std::make_unique<MockSnapshotRepository>() };
    const std::filesystem::path location{ "mock.json" };
    EXPECT_CALL(*repo, location()).WillRepeatedly(ReturnRef(location));
    EXPECT_CALL(*repo, load()).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*repo, save(_)).Times(1);

    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), std::move(repo), clock.source() };
    store.create("a");
    EXPECT_TRUE(store.isActive("a"));
    EXPECT_TRUE(store.info("a").has_value());
    EXPECT_EQ(store.count(), 1U);
}

TEST(PersistentSessionStore, SaveFailureIsSwallowed)
{
    ManualClock clock{};
    auto repo{ std::make_unique<MockSnapshotRepository>() };
    const std::filesystem::path location{ "mock.json" };
    EXPECT_CALL(*repo, location()).WillRepeatedly(ReturnRef(location));
    EXPECT_CALL(*repo, load()).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*repo, save(_)).WillRepeatedly(Throw(leasekeeper::storage::PersistenceIoError("disk full")));

    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), std::move(repo), clock.source() };
    EXPECT_NO_THROW(store.create("a"));
    EXPECT_TRUE(store.isActive("a"));
    EXPECT_EQ(store.remove("a"), DeleteResult::Removed);
}

TEST(PersistentSessionStore, LoadFailureStartsEmpty)
{
    ManualClock clock{};
    auto repo{ std::make_unique<MockSnapshotRepository>() };
    const std::filesystem::path location{ "mock.json" };
    EXPECT_CALL(*repo, location()).WillRepeatedly(ReturnRef(location));
    EXPECT_CALL(*repo, load()).WillOnce(Throw(leasekeeper::storage::PersistenceIoError("permission denied")));

    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), std::move(repo), clock.source() };
    EXPECT_EQ(store.count(), 0U);
}

TEST(PersistentSessionStore, LoadConvertsWallExpiryToMonotonic)
{
    ManualClock clock{};
    auto repo{ std::make_unique<MockSnapshotRepository>() };
    const std::filesystem::path location{ "mock.json" };
    LoadedSnapshot snapshot{};
    snapshot.sessions.push_back(PersistedSession{ "a", wallUnix(Seconds{ 4 }) });
    snapshot.sessions.push_back(PersistedSession{ "b", wallUnix(Seconds{ 0 }) });
    EXPECT_CALL(*repo, location()).WillRepeatedly(ReturnRef(location));
    EXPECT_CALL(*repo, load()).WillOnce(Return(std::optional<LoadedSnapshot>{ snapshot }));

    PersistentSessionStore store{ makeFixed(Seconds{ 5 }, clock), std::move(repo), clock.source() };
    EXPECT_FALSE(store.isActive("b"));
    EXPECT_TRUE(store.isActive("a"));
    clock.advance(Seconds{ 4 });
    EXPECT_FALSE(store.isActive("a"));
}
