#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ustore::dal {
class IUserRepository;
}  // namespace ustore::dal

namespace ustore::core {

/// Use-case facade over the users repository. Adds no business rules and
/// lets repository errors through unchanged.
/// Class abbreviation: us
class UserService {
 public:
  explicit UserService(dal::IUserRepository& iurRepo);
  ~UserService();

  /// Throws common::NotFoundError if the user does not exist.
  common::UserRecord getUser(int64_t iUserId);

  std::vector<common::UserRecord> getAllUsers();

  /// Stores a new user. The assigned id is not reported back.
  void createUser(const std::string& sName, const std::string& sEmail);

  /// Reads the user first, so a missing id throws common::NotFoundError,
  /// then overwrites name and email. The read and the write are separate
  /// statements with no isolation between them.
  void updateUser(int64_t iUserId, const std::string& sName, const std::string& sEmail);

  /// No existence check; deleting a missing id succeeds.
  void deleteUser(int64_t iUserId);

 private:
  dal::IUserRepository& _iurRepo;
};

}  // namespace ustore::core
