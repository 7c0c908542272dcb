#pragma once

#include <cstdint>
#include <vector>

#include "common/Types.hpp"

namespace ustore::dal {

/// Pure abstract interface over the users table; one implementation per
/// storage technology. Every call executes exactly one statement.
/// Class abbreviation: iur
class IUserRepository {
 public:
  virtual ~IUserRepository() = default;

  /// Throws common::NotFoundError if no row has this id.
  virtual common::UserRecord getById(int64_t iUserId) = 0;

  /// Storage-defined order; empty when the table is empty.
  virtual std::vector<common::UserRecord> getAll() = 0;

  /// Inserts name/email, ignoring urRecord.iId. Returns the stored record
  /// carrying the newly assigned id.
  virtual common::UserRecord save(const common::UserRecord& urRecord) = 0;

  /// Overwrites name/email of the row with urRecord.iId. No-op if absent.
  virtual void update(const common::UserRecord& urRecord) = 0;

  /// No-op if absent.
  virtual void deleteById(int64_t iUserId) = 0;
};

}  // namespace ustore::dal
