#ifndef INCLUDE_LEASEKEEPER_STORAGE_JSON_JSONSNAPSHOTREPOSITORYFACTORY_HPP
#define INCLUDE_LEASEKEEPER_STORAGE_JSON_JSONSNAPSHOTREPOSITORYFACTORY_HPP

#include "leasekeeper/storage/ISnapshotRepository.hpp"
#include <filesystem>
#include <memory>

namespace leasekeeper::storage::json
{

// File layout: one JSON object mapping session id -> expiry as Unix epoch seconds.
[[nodiscard]] std::unique_ptr<leasekeeper::storage::ISnapshotRepository>
makeJsonSnapshotRepository(std::filesystem::path file);

} // namespace leasekeeper::storage::json

#endif // INCLUDE_LEASEKEEPER_STORAGE_JSON_JSONSNAPSHOTREPOSITORYFACTORY_HPP
