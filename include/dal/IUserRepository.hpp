#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sso::dal {

/// Row type returned from user queries.
struct UserRow {
  int64_t iId = 0;
  std::string sEmail;
  std::string sPasswordHash;
  std::string sName;
  std::chrono::system_clock::time_point tpCreatedAt;
};

/// User record storage.
class IUserRepository {
 public:
  virtual ~IUserRepository() = default;

  /// Find a user by email (exact match). Returns nullopt if not found.
  virtual std::optional<UserRow> findByEmail(const std::string& sEmail) = 0;

  /// Find a user by ID. Returns nullopt if not found.
  virtual std::optional<UserRow> findById(int64_t iUserId) = 0;

  /// Insert a user and return the stored row.
  /// Throws ConflictError("duplicate_email") if the email is taken.
  virtual UserRow create(const std::string& sEmail, const std::string& sPasswordHash,
                         const std::string& sName) = 0;
};

}  // namespace sso::dal
