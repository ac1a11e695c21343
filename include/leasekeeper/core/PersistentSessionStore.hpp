#ifndef INCLUDE_LEASEKEEPER_CORE_PERSISTENTSESSIONSTORE_HPP
#define INCLUDE_LEASEKEEPER_CORE_PERSISTENTSESSIONSTORE_HPP

#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/ISessionStore.hpp"
#include "leasekeeper/storage/ISnapshotRepository.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>

namespace leasekeeper::core
{

// Mirrors a fixed or sliding store to a snapshot repository.
//
// Construction loads the repository once and drops entries that expired while the process was down.
// create() and remove() (and a cleanup() that removed something) rewrite the snapshot; reads never touch it.
// Storage failures are logged and swallowed: the in-memory store stays authoritative.
//
// The snapshot is captured under the store lock; the write itself runs under a separate file lock so disk
// latency does not stall readers. A capture older than the last one written is discarded.
class PersistentSessionStore final : public ISessionStore
{
public:
    // A null `repository` makes the store purely in-memory. Throws ConfigurationError if `inner` is null.
    PersistentSessionStore(std::unique_ptr<ISessionStore> inner,
                           std::unique_ptr<leasekeeper::storage::ISnapshotRepository> repository,
                           ClockSource clock = {});

    void create(std::string_view id) override;
    [[nodiscard]] std::string create() override;
    [[nodiscard]] bool isActive(std::string_view id) override;
    [[nodiscard]] DeleteResult remove(std::string_view id) override;
    std::size_t cleanup() override;
    [[nodiscard]] std::size_t count() override;
    [[nodiscard]] std::optional<SessionInfo> info(std::string_view id) override;
    [[nodiscard]] std::string generateId() override;
    [[nodiscard]] std::chrono::seconds ttl() const noexcept override;
    [[nodiscard]] StoreSnapshot snapshot() const override;
    void restore(const std::vector<SessionEntry>& entries) override;

    [[nodiscard]] bool isDurable() const noexcept;

private:
    void load();
    void persist();

    std::unique_ptr<ISessionStore> m_inner;
    std::unique_ptr<leasekeeper::storage::ISnapshotRepository> m_repository;
    ClockSource m_clock;
    std::shared_ptr<spdlog::logger> m_log;

    std::mutex m_fileMutex;
    bool m_hasWritten{ false };
    std::uint64_t m_writtenGeneration{};
};

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_PERSISTENTSESSIONSTORE_HPP
