#include "dal/InMemoryUserRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <string>

namespace ustore::dal {

InMemoryUserRepository::InMemoryUserRepository() = default;
InMemoryUserRepository::~InMemoryUserRepository() = default;

common::UserRecord InMemoryUserRepository::getById(int64_t iUserId) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mRows.find(iUserId);
  if (it == _mRows.end()) {
    throw common::NotFoundError("user_not_found",
                                "User " + std::to_string(iUserId) + " not found");
  }
  return it->second;
}

std::vector<common::UserRecord> InMemoryUserRepository::getAll() {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<common::UserRecord> vUsers;
  vUsers.reserve(_mRows.size());
  for (const auto& [iId, urRow] : _mRows) {
    vUsers.push_back(urRow);
  }
  return vUsers;
}

common::UserRecord InMemoryUserRepository::save(const common::UserRecord& urRecord) {
  std::lock_guard<std::mutex> lock(_mtx);
  common::UserRecord urSaved{_iNextId++, urRecord.sName, urRecord.sEmail};
  _mRows.emplace(urSaved.iId, urSaved);
  common::Logger::get()->debug("Inserted user id={} (in-memory)", urSaved.iId);
  return urSaved;
}

void InMemoryUserRepository::update(const common::UserRecord& urRecord) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mRows.find(urRecord.iId);
  if (it == _mRows.end()) return;
  it->second.sName = urRecord.sName;
  it->second.sEmail = urRecord.sEmail;
}

void InMemoryUserRepository::deleteById(int64_t iUserId) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mRows.erase(iUserId);
}

}  // namespace ustore::dal
