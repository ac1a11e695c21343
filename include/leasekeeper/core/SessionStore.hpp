#ifndef INCLUDE_LEASEKEEPER_CORE_SESSIONSTORE_HPP
#define INCLUDE_LEASEKEEPER_CORE_SESSIONSTORE_HPP

#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/ISessionStore.hpp"
#include "leasekeeper/random/IRandomSource.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/logger.h>
#include <string>

namespace leasekeeper::core
{

// Fixed-window store: the expiry instant is set at creation and never moves.
// All reads and writes go through one mutex; lazy eviction happens inside the same critical section as the read
// that discovers the expired entry.
class SessionStore final : public ISessionStore
{
public:
    // Throws ConfigurationError if `ttl` is not in (0, g_kMaxSessionTtl] or `random` is null.
    SessionStore(std::chrono::seconds ttl, std::shared_ptr<leasekeeper::random::IRandomSource> random,
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

    // Liveness check that also restarts the countdown of a live session (sliding expiry).
    [[nodiscard]] bool touchIfActive(std::string_view id);

    [[nodiscard]] const ClockSource& clock() const noexcept;

private:
    using ExpiryMap = std::map<std::string, ClockSource::TimePoint, std::less<>>;

    [[nodiscard]] bool checkLocked(std::string_view id, ClockSource::TimePoint now, bool refresh);
    std::size_t pruneLocked(ClockSource::TimePoint now);

    std::chrono::seconds m_ttl{};
    std::shared_ptr<leasekeeper::random::IRandomSource> m_random;
    ClockSource m_clock;
    std::shared_ptr<spdlog::logger> m_log;

    mutable std::mutex m_mutex;
    ExpiryMap m_expiries;
    std::uint64_t m_generation{};
};

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_SESSIONSTORE_HPP
