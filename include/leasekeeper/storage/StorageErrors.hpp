#ifndef INCLUDE_LEASEKEEPER_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_LEASEKEEPER_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace leasekeeper::storage
{

// The backing file could not be opened, read, written or replaced.
class PersistenceIoError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The backing file was read but does not hold a session snapshot.
class SnapshotFormatError final : public PersistenceIoError
{
public:
    using PersistenceIoError::PersistenceIoError;
};

} // namespace leasekeeper::storage

#endif // INCLUDE_LEASEKEEPER_STORAGE_STORAGEERRORS_HPP
