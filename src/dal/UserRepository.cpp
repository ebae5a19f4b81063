#include "dal/UserRepository.hpp"

#include "common/Errors.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace sso::dal {

namespace {

constexpr const char* kUserColumns =
    "id, email, password_hash, name, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::bigint";

UserRow toUserRow(const pqxx::row& row) {
  UserRow ur;
  ur.iId = row[0].as<int64_t>();
  ur.sEmail = row[1].as<std::string>();
  ur.sPasswordHash = row[2].as<std::string>();
  ur.sName = row[3].as<std::string>();
  ur.tpCreatedAt = std::chrono::system_clock::time_point(
      std::chrono::milliseconds(row[4].as<int64_t>()));
  return ur;
}

}  // namespace

UserRepository::UserRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
UserRepository::~UserRepository() = default;

std::optional<UserRow> UserRepository::findByEmail(const std::string& sEmail) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      std::string("SELECT ") + kUserColumns + " FROM users WHERE email = $1",
      pqxx::params{sEmail});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toUserRow(result[0]);
}

std::optional<UserRow> UserRepository::findById(int64_t iUserId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      std::string("SELECT ") + kUserColumns + " FROM users WHERE id = $1",
      pqxx::params{iUserId});
  txn.commit();

  if (result.empty()) return std::nullopt;
  return toUserRow(result[0]);
}

UserRow UserRepository::create(const std::string& sEmail, const std::string& sPasswordHash,
                               const std::string& sName) {
  auto cg = _cpPool.checkout();
  try {
    pqxx::work txn(*cg);
    auto result = txn.exec(
        std::string("INSERT INTO users (email, password_hash, name) VALUES ($1, $2, $3) "
                    "RETURNING ") + kUserColumns,
        pqxx::params{sEmail, sPasswordHash, sName});
    txn.commit();
    return toUserRow(result.one_row());
  } catch (const pqxx::unique_violation&) {
    throw common::ConflictError("duplicate_email", "User with this email already exists");
  }
}

}  // namespace sso::dal
