#ifndef INCLUDE_LEASEKEEPER_STORAGE_ISNAPSHOTREPOSITORY_HPP
#define INCLUDE_LEASEKEEPER_STORAGE_ISNAPSHOTREPOSITORY_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace leasekeeper::storage
{

struct PersistedSession final
{
    std::string id;
    double expiresAtUnix{};
};

struct LoadedSnapshot final
{
    std::vector<PersistedSession> sessions;
    // Entries present in the file but dropped for having a non-numeric expiry.
    std::size_t skippedEntries{};
};

class ISnapshotRepository
{
public:
    ISnapshotRepository() = default;
    ISnapshotRepository(const ISnapshotRepository&) = delete;
    ISnapshotRepository& operator=(const ISnapshotRepository&) = delete;
    ISnapshotRepository(ISnapshotRepository&&) = delete;
    ISnapshotRepository& operator=(ISnapshotRepository&&) = delete;
    virtual ~ISnapshotRepository() = default;

    // Returns std::nullopt if no snapshot exists yet.
    // Throws PersistenceIoError if the file cannot be read, SnapshotFormatError if it is not a snapshot.
    [[nodiscard]] virtual std::optional<LoadedSnapshot> load() const = 0;

    // Replaces the stored snapshot as a whole. Throws PersistenceIoError on failure; the previous
    // snapshot is left intact in that case.
    virtual void save(const std::vector<PersistedSession>& sessions) = 0;

    [[nodiscard]] virtual const std::filesystem::path& location() const noexcept = 0;
};

} // namespace leasekeeper::storage

#endif // INCLUDE_LEASEKEEPER_STORAGE_ISNAPSHOTREPOSITORY_HPP
