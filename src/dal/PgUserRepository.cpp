#include "dal/PgUserRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <optional>
#include <stdexcept>

#include <pqxx/pqxx>

namespace ustore::dal {

namespace {

common::UserRecord toRecord(const pqxx::row& row) {
  return common::UserRecord{
      row[0].as<int64_t>(),
      row[1].as<std::string>(),
      row[2].as<std::string>(),
  };
}

}  // namespace

PgUserRepository::PgUserRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
PgUserRepository::~PgUserRepository() = default;

common::UserRecord PgUserRepository::getById(int64_t iUserId) {
  std::optional<common::UserRecord> oUser;
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "SELECT id, COALESCE(name, ''), COALESCE(email, '') "
        "FROM users WHERE id = $1",
        pqxx::params{iUserId});
    txn.commit();
    if (!result.empty()) oUser = toRecord(result[0]);
  } catch (const std::runtime_error& ex) {
    throw common::ReadError("read_failed",
                            "Failed to read user " + std::to_string(iUserId) + ": " + ex.what());
  }

  if (!oUser.has_value()) {
    throw common::NotFoundError("user_not_found",
                                "User " + std::to_string(iUserId) + " not found");
  }
  return *oUser;
}

std::vector<common::UserRecord> PgUserRepository::getAll() {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec("SELECT id, COALESCE(name, ''), COALESCE(email, '') FROM users");
    txn.commit();

    std::vector<common::UserRecord> vUsers;
    vUsers.reserve(result.size());
    for (const auto& row : result) {
      vUsers.push_back(toRecord(row));
    }
    return vUsers;
  } catch (const std::runtime_error& ex) {
    throw common::ReadError("read_failed", std::string("Failed to list users: ") + ex.what());
  }
}

common::UserRecord PgUserRepository::save(const common::UserRecord& urRecord) {
  common::UserRecord urSaved{0, urRecord.sName, urRecord.sEmail};
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "INSERT INTO users (name, email) VALUES ($1, $2) RETURNING id",
        pqxx::params{urRecord.sName, urRecord.sEmail});
    txn.commit();
    urSaved.iId = result.one_row()[0].as<int64_t>();
  } catch (const std::runtime_error& ex) {
    throw common::WriteError("write_failed", std::string("Failed to insert user: ") + ex.what());
  }

  common::Logger::get()->debug("Inserted user id={}", urSaved.iId);
  return urSaved;
}

void PgUserRepository::update(const common::UserRecord& urRecord) {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec(
        "UPDATE users SET name = $1, email = $2 WHERE id = $3",
        pqxx::params{urRecord.sName, urRecord.sEmail, urRecord.iId});
    txn.commit();
    common::Logger::get()->debug("Update of user id={} touched {} row(s)", urRecord.iId,
                                 result.affected_rows());
  } catch (const std::runtime_error& ex) {
    throw common::WriteError("write_failed", "Failed to update user " +
                                                 std::to_string(urRecord.iId) + ": " + ex.what());
  }
}

void PgUserRepository::deleteById(int64_t iUserId) {
  try {
    auto cg = _cpPool.checkout();
    pqxx::work txn(*cg);
    auto result = txn.exec("DELETE FROM users WHERE id = $1", pqxx::params{iUserId});
    txn.commit();
    common::Logger::get()->debug("Delete of user id={} touched {} row(s)", iUserId,
                                 result.affected_rows());
  } catch (const std::runtime_error& ex) {
    throw common::WriteError("write_failed", "Failed to delete user " +
                                                 std::to_string(iUserId) + ": " + ex.what());
  }
}

}  // namespace ustore::dal
