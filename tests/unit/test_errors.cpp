#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace ustore::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, InitializationErrorIs503) {
  InitializationError err("storage_unavailable", "could not connect");
  EXPECT_EQ(err._iHttpStatus, 503);
  EXPECT_EQ(err._sErrorCode, "storage_unavailable");
}

TEST(ErrorsTest, NotFoundErrorIs404) {
  NotFoundError err("user_not_found", "User 7 not found");
  EXPECT_EQ(err._iHttpStatus, 404);
  EXPECT_EQ(err._sErrorCode, "user_not_found");
}

TEST(ErrorsTest, WriteErrorIs500) {
  WriteError err("write_failed", "insert failed");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "write_failed");
}

TEST(ErrorsTest, ReadErrorIs500) {
  ReadError err("read_failed", "select failed");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "read_failed");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw NotFoundError("user_not_found", "missing");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 404);
    EXPECT_STREQ(err.what(), "missing");
  }

  try {
    throw InitializationError("schema_failed", "no table");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 503);
    EXPECT_EQ(err._sErrorCode, "schema_failed");
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw WriteError("write_failed", "connection closed");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "connection closed");
  }
}
