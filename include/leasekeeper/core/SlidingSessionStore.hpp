#ifndef INCLUDE_LEASEKEEPER_CORE_SLIDINGSESSIONSTORE_HPP
#define INCLUDE_LEASEKEEPER_CORE_SLIDINGSESSIONSTORE_HPP

#include "leasekeeper/core/ISessionStore.hpp"
#include "leasekeeper/core/SessionStore.hpp"
#include <memory>
#include <spdlog/logger.h>

namespace leasekeeper::core
{

// Every successful isActive() pushes the expiry to now + ttl, so a session checked more often than
// once per ttl never expires. All other operations behave exactly like the wrapped store.
class SlidingSessionStore final : public ISessionStore
{
public:
    // Throws ConfigurationError if `inner` is null.
    explicit SlidingSessionStore(std::unique_ptr<SessionStore> inner);

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

private:
    std::unique_ptr<SessionStore> m_inner;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace leasekeeper::core

#endif // INCLUDE_LEASEKEEPER_CORE_SLIDINGSESSIONSTORE_HPP
