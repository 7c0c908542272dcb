#pragma once

#include <cstdint>
#include <vector>

#include "dal/IUserRepository.hpp"

namespace ustore::dal {

class ConnectionPool;

/// PostgreSQL-backed users table (id BIGSERIAL, name TEXT, email TEXT).
/// Backend failures surface as common::ReadError / common::WriteError.
/// Class abbreviation: pur
class PgUserRepository : public IUserRepository {
 public:
  explicit PgUserRepository(ConnectionPool& cpPool);
  ~PgUserRepository() override;

  common::UserRecord getById(int64_t iUserId) override;
  std::vector<common::UserRecord> getAll() override;
  common::UserRecord save(const common::UserRecord& urRecord) override;
  void update(const common::UserRecord& urRecord) override;
  void deleteById(int64_t iUserId) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace ustore::dal
