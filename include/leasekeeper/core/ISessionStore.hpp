#ifndef INCLUDE_LEASEKEEPER_CORE_ISESSIONSTORE_HPP
#define INCLUDE_LEASEKEEPER_CORE_ISESSIONSTORE_HPP

#include "leasekeeper/core/ClockSource.hpp"
#include "leasekeeper/core/SessionInfo.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace leasekeeper::core
{

struct SessionEntry final
{
    std::string id;
    ClockSource::TimePoint expiresAt{};
};

// Live entries at one instant. `generation` grows with every mutation of the owning store,
// so two snapshots of the same store can be ordered.
struct StoreSnapshot final
{
    std::uint64_t generation{};
    std::vector<SessionEntry> entries;
};

class ISessionStore
{
public:
    ISessionStore() = default;
    ISessionStore(const ISessionStore&) = delete;
    ISessionStore& operator=(const ISessionStore&) = delete;
    ISessionStore(ISessionStore&&) = delete;
    ISessionStore& operator=(ISessionStore&&) = delete;
    virtual ~ISessionStore() = default;

    // Registers `id` with a fresh expiry, replacing any existing entry.
    // Throws InvalidArgument for an empty or malformed id.
    virtual void create(std::string_view id) = 0;

    // Auto-identifier mode: registers and returns a newly generated id.
    [[nodiscard]] virtual std::string create() = 0;

    // Expired entries found here are removed before returning false.
    [[nodiscard]] virtual bool isActive(std::string_view id) = 0;

    // Throws InvalidArgument for an empty or malformed id. Missing and expired ids report Absent.
    [[nodiscard]] virtual DeleteResult remove(std::string_view id) = 0;

    // Removes every expired entry; returns how many were removed.
    virtual std::size_t cleanup() = 0;

    // Number of live entries, after pruning expired ones.
    [[nodiscard]] virtual std::size_t count() = 0;

    // Never extends the session's life.
    [[nodiscard]] virtual std::optional<SessionInfo> info(std::string_view id) = 0;

    [[nodiscard]] virtual std::string generateId() = 0;

    [[nodiscard]] virtual std::chrono::seconds ttl() const noexcept = 0;

    // Bulk access for persistence layers. restore() merges entries, skipping those already expired.
    [[nodiscard]] virtual StoreSnapshot snapshot() const = 0;
    virtual void restore(const std::vector<SessionEntry>& entries) = 0;
};

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_ISESSIONSTORE_HPP
