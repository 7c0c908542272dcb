#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "dal/IUserRepository.hpp"

namespace ustore::dal {

/// Process-local users table. Ids start at 1 and are never reused; getAll()
/// returns rows in id order.
/// Class abbreviation: mur
class InMemoryUserRepository : public IUserRepository {
 public:
  InMemoryUserRepository();
  ~InMemoryUserRepository() override;

  common::UserRecord getById(int64_t iUserId) override;
  std::vector<common::UserRecord> getAll() override;
  common::UserRecord save(const common::UserRecord& urRecord) override;
  void update(const common::UserRecord& urRecord) override;
  void deleteById(int64_t iUserId) override;

 private:
  std::map<int64_t, common::UserRecord> _mRows;
  int64_t _iNextId = 1;
  std::mutex _mtx;
};

}  // namespace ustore::dal
