#pragma once

#include <memory>
#include <string>

#include "dal/IUserRepository.hpp"

namespace ustore::dal {

class ConnectionPool;

/// Owns the physical users table and the repository bound to it.
/// The location selects the technology: ":memory:" for a process-local
/// table, anything else is handed to libpq as a connection string/URI.
/// Class abbreviation: sb
class StorageBackend {
 public:
  static constexpr const char* kInMemoryLocation = ":memory:";

  /// Opens the location and creates the users table if it does not exist.
  /// Throws common::InitializationError if either step fails.
  StorageBackend(const std::string& sLocation, int iPoolSize);
  ~StorageBackend();

  StorageBackend(const StorageBackend&) = delete;
  StorageBackend& operator=(const StorageBackend&) = delete;

  IUserRepository& users() { return *_upUserRepo; }

  bool isInMemory() const { return _upPool == nullptr; }

 private:
  void ensureSchema();

  std::unique_ptr<ConnectionPool> _upPool;
  std::unique_ptr<IUserRepository> _upUserRepo;
};

}  // namespace ustore::dal
