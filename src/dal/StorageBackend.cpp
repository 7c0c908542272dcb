#include "dal/StorageBackend.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"
#include "dal/InMemoryUserRepository.hpp"
#include "dal/PgUserRepository.hpp"

#include <stdexcept>

#include <pqxx/pqxx>

namespace ustore::dal {

StorageBackend::StorageBackend(const std::string& sLocation, int iPoolSize) {
  auto spLog = common::Logger::get();

  if (sLocation == kInMemoryLocation) {
    _upUserRepo = std::make_unique<InMemoryUserRepository>();
    spLog->info("Storage backend ready: in-memory users table");
    return;
  }

  _upPool = std::make_unique<ConnectionPool>(sLocation, iPoolSize);
  ensureSchema();
  _upUserRepo = std::make_unique<PgUserRepository>(*_upPool);
  spLog->info("Storage backend ready: PostgreSQL users table");
}

StorageBackend::~StorageBackend() = default;

void StorageBackend::ensureSchema() {
  try {
    auto cg = _upPool->checkout();
    pqxx::work txn(*cg);
    txn.exec(
        "CREATE TABLE IF NOT EXISTS users ("
        "  id BIGSERIAL PRIMARY KEY,"
        "  name TEXT,"
        "  email TEXT"
        ")");
    txn.commit();
  } catch (const std::runtime_error& ex) {
    throw common::InitializationError("schema_failed",
                                      std::string("Failed to create users table: ") + ex.what());
  }
}

}  // namespace ustore::dal
