#include "dal/InMemoryUserRepository.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using ustore::common::NotFoundError;
using ustore::common::UserRecord;
using ustore::dal::InMemoryUserRepository;

class InMemoryUserRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override { ustore::common::Logger::init("warn"); }

  InMemoryUserRepository _murRepo;
};

TEST_F(InMemoryUserRepositoryTest, GetAllOnEmptyTableReturnsEmpty) {
  EXPECT_TRUE(_murRepo.getAll().empty());
}

TEST_F(InMemoryUserRepositoryTest, GetByIdThrowsNotFoundForMissing) {
  EXPECT_THROW(_murRepo.getById(42), NotFoundError);
}

TEST_F(InMemoryUserRepositoryTest, SaveAssignsIncreasingIdsAndIgnoresCallerId) {
  auto urFirst = _murRepo.save(UserRecord{99, "alice", "alice@example.com"});
  auto urSecond = _murRepo.save(UserRecord{0, "bob", "bob@example.com"});

  EXPECT_EQ(urFirst.iId, 1);
  EXPECT_EQ(urSecond.iId, 2);
  EXPECT_EQ(urFirst.sName, "alice");
  EXPECT_THROW(_murRepo.getById(99), NotFoundError);
}

TEST_F(InMemoryUserRepositoryTest, SaveDoesNotTouchTheInputRecord) {
  UserRecord urInput{0, "carol", "carol@example.com"};
  auto urSaved = _murRepo.save(urInput);
  EXPECT_EQ(urInput.iId, 0);
  EXPECT_NE(urSaved.iId, 0);
}

TEST_F(InMemoryUserRepositoryTest, IdsAreNotReusedAfterDelete) {
  auto urFirst = _murRepo.save(UserRecord{0, "a", "a@example.com"});
  _murRepo.deleteById(urFirst.iId);
  auto urSecond = _murRepo.save(UserRecord{0, "b", "b@example.com"});
  EXPECT_GT(urSecond.iId, urFirst.iId);
}

TEST_F(InMemoryUserRepositoryTest, RoundTripSaveUpdateDelete) {
  auto urSaved = _murRepo.save(UserRecord{0, "dave", "dave@example.com"});
  const int64_t iId = urSaved.iId;

  auto urRead = _murRepo.getById(iId);
  EXPECT_EQ(urRead.sName, "dave");
  EXPECT_EQ(urRead.sEmail, "dave@example.com");

  _murRepo.update(UserRecord{iId, "david", "david@example.com"});
  urRead = _murRepo.getById(iId);
  EXPECT_EQ(urRead.iId, iId);
  EXPECT_EQ(urRead.sName, "david");
  EXPECT_EQ(urRead.sEmail, "david@example.com");

  _murRepo.deleteById(iId);
  EXPECT_THROW(_murRepo.getById(iId), NotFoundError);
}

TEST_F(InMemoryUserRepositoryTest, UpdateOfMissingIdIsSilentNoOp) {
  _murRepo.save(UserRecord{0, "erin", "erin@example.com"});
  EXPECT_NO_THROW(_murRepo.update(UserRecord{500, "ghost", "ghost@example.com"}));

  auto vUsers = _murRepo.getAll();
  ASSERT_EQ(vUsers.size(), 1u);
  EXPECT_EQ(vUsers[0].sName, "erin");
  EXPECT_THROW(_murRepo.getById(500), NotFoundError);
}

TEST_F(InMemoryUserRepositoryTest, DeleteOfMissingIdIsSilentNoOp) {
  _murRepo.save(UserRecord{0, "frank", "frank@example.com"});
  EXPECT_NO_THROW(_murRepo.deleteById(500));
  EXPECT_EQ(_murRepo.getAll().size(), 1u);
}

TEST_F(InMemoryUserRepositoryTest, AcceptsEmptyAndDuplicateEmails) {
  auto urA = _murRepo.save(UserRecord{0, "", ""});
  auto urB = _murRepo.save(UserRecord{0, "x", "same@example.com"});
  auto urC = _murRepo.save(UserRecord{0, "y", "same@example.com"});

  EXPECT_EQ(_murRepo.getById(urA.iId).sEmail, "");
  EXPECT_NE(urB.iId, urC.iId);
  EXPECT_EQ(_murRepo.getAll().size(), 3u);
}

TEST_F(InMemoryUserRepositoryTest, ConcurrentSavesAssignDistinctIds) {
  const int iThreadCount = 8;
  const int iPerThread = 50;
  std::vector<std::thread> vThreads;

  for (int i = 0; i < iThreadCount; ++i) {
    vThreads.emplace_back([this]() {
      for (int j = 0; j < iPerThread; ++j) {
        _murRepo.save(UserRecord{0, "load", "load@example.com"});
      }
    });
  }
  for (auto& t : vThreads) {
    t.join();
  }

  auto vUsers = _murRepo.getAll();
  ASSERT_EQ(vUsers.size(), static_cast<size_t>(iThreadCount * iPerThread));
  EXPECT_EQ(vUsers.front().iId, 1);
  EXPECT_EQ(vUsers.back().iId, iThreadCount * iPerThread);
}
