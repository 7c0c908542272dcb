#pragma once

#include <cstdint>
#include <string>

namespace ustore::common {

/// One user entity. iId == 0 means "not yet persisted".
/// Class abbreviation: ur
struct UserRecord {
  int64_t iId = 0;
  std::string sName;
  std::string sEmail;
};

inline bool operator==(const UserRecord& lhs, const UserRecord& rhs) {
  return lhs.iId == rhs.iId && lhs.sName == rhs.sName && lhs.sEmail == rhs.sEmail;
}

}  // namespace ustore::common
