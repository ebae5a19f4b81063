#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace sso::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIs400) {
  ValidationError err("invalid_device_type", "Unknown device type: tv");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "invalid_device_type");
}

TEST(ErrorsTest, AuthenticationErrorIs401) {
  AuthenticationError err("session_revoked", "Invalid or expired session");
  EXPECT_EQ(err._iHttpStatus, 401);
  EXPECT_EQ(err._sErrorCode, "session_revoked");
}

TEST(ErrorsTest, NotFoundErrorIs404) {
  NotFoundError err("user_not_found", "User not found");
  EXPECT_EQ(err._iHttpStatus, 404);
  EXPECT_EQ(err._sErrorCode, "user_not_found");
}

TEST(ErrorsTest, ConflictErrorIs409) {
  ConflictError err("duplicate_email", "User with this email already exists");
  EXPECT_EQ(err._iHttpStatus, 409);
  EXPECT_EQ(err._sErrorCode, "duplicate_email");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw ValidationError("validation_error", "email is required");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 400);
    EXPECT_EQ(err._sErrorCode, "validation_error");
    EXPECT_STREQ(err.what(), "email is required");
  }

  try {
    throw ConflictError("duplicate_email", "taken");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iHttpStatus, 409);
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw NotFoundError("nf", "not found");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "not found");
  }
}
