#include "core/UserService.hpp"

#include "common/Logger.hpp"
#include "dal/IUserRepository.hpp"

namespace ustore::core {

UserService::UserService(dal::IUserRepository& iurRepo) : _iurRepo(iurRepo) {}
UserService::~UserService() = default;

common::UserRecord UserService::getUser(int64_t iUserId) {
  return _iurRepo.getById(iUserId);
}

std::vector<common::UserRecord> UserService::getAllUsers() {
  return _iurRepo.getAll();
}

void UserService::createUser(const std::string& sName, const std::string& sEmail) {
  common::UserRecord urNew;
  urNew.sName = sName;
  urNew.sEmail = sEmail;
  auto urSaved = _iurRepo.save(urNew);
  common::Logger::get()->debug("Created user id={}", urSaved.iId);
}

void UserService::updateUser(int64_t iUserId, const std::string& sName,
                             const std::string& sEmail) {
  auto urExisting = _iurRepo.getById(iUserId);
  urExisting.sName = sName;
  urExisting.sEmail = sEmail;
  _iurRepo.update(urExisting);
}

void UserService::deleteUser(int64_t iUserId) {
  _iurRepo.deleteById(iUserId);
}

}  // namespace ustore::core
