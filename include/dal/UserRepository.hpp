#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "dal/IUserRepository.hpp"

namespace sso::dal {

class ConnectionPool;

/// Manages the users table.
/// Class abbreviation: ur
class UserRepository : public IUserRepository {
 public:
  explicit UserRepository(ConnectionPool& cpPool);
  ~UserRepository() override;

  std::optional<UserRow> findByEmail(const std::string& sEmail) override;
  std::optional<UserRow> findById(int64_t iUserId) override;
  UserRow create(const std::string& sEmail, const std::string& sPasswordHash,
                 const std::string& sName) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace sso::dal
