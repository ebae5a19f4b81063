#include "dal/SessionRepository.hpp"

#include "common/Logger.hpp"
#include "core/SessionId.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

#include <cctype>
#include <stdexcept>

namespace sso::dal {

using common::DeviceClass;

namespace {

constexpr int kCreateAttempts = 3;

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

// Canonical 8-4-4-4-12 hex form; anything else cannot name a stored session.
bool isUuid(const std::string& sValue) {
  if (sValue.size() != 36) return false;
  for (size_t i = 0; i < sValue.size(); ++i) {
    const char c = sValue[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace

SessionRepository::SessionRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SessionRepository::~SessionRepository() = default;

std::string SessionRepository::create(int64_t iUserId, DeviceClass eClass,
                                      const std::string& sDeviceName,
                                      const std::string& sIpAddress) {
  const std::string sClass = common::toString(eClass);

  for (int iAttempt = 1;; ++iAttempt) {
    const std::string sSessionId = core::generateSessionId();
    auto cg = _cpPool.checkout();
    try {
      pqxx::work txn(*cg);
      // Serializes creates per user; released at commit or rollback.
      txn.exec("SELECT pg_advisory_xact_lock($1)", pqxx::params{iUserId});
      txn.exec(
          "UPDATE sessions SET revoked_at = NOW() "
          "WHERE user_id = $1 AND device_class = $2 AND revoked_at IS NULL",
          pqxx::params{iUserId, sClass});
      txn.exec(
          "INSERT INTO sessions (session_id, user_id, device_class, device_name, ip_address) "
          "VALUES ($1::uuid, $2, $3, $4, NULLIF($5, ''))",
          pqxx::params{sSessionId, iUserId, sClass, sDeviceName, sIpAddress});
      txn.commit();
      return sSessionId;
    } catch (const pqxx::unique_violation&) {
      // A writer outside the advisory lock won the live index; the next
      // attempt revokes its row.
      if (iAttempt >= kCreateAttempts) {
        throw std::runtime_error("Session create for user " + std::to_string(iUserId) +
                                 " kept losing to concurrent creates");
      }
      common::Logger::get()->debug("Session create for user {} ({}) raced, retrying",
                                   iUserId, sClass);
    }
  }
}

bool SessionRepository::isLive(const std::string& sSessionId) const {
  if (!isUuid(sSessionId)) return false;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT 1 FROM sessions WHERE session_id = $1::uuid AND revoked_at IS NULL",
      pqxx::params{sSessionId});
  txn.commit();
  return !result.empty();
}

void SessionRepository::revoke(const std::string& sSessionId) {
  if (!isUuid(sSessionId)) return;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "UPDATE sessions SET revoked_at = NOW() "
      "WHERE session_id = $1::uuid AND revoked_at IS NULL",
      pqxx::params{sSessionId});
  txn.commit();
}

bool SessionRepository::revokeDevice(int64_t iUserId, DeviceClass eClass) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE sessions SET revoked_at = NOW() "
      "WHERE user_id = $1 AND device_class = $2 AND revoked_at IS NULL",
      pqxx::params{iUserId, common::toString(eClass)});
  txn.commit();
  return result.affected_rows() > 0;
}

int SessionRepository::revokeAll(int64_t iUserId) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE sessions SET revoked_at = NOW() WHERE user_id = $1 AND revoked_at IS NULL",
      pqxx::params{iUserId});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

std::vector<common::Session> SessionRepository::listLive(int64_t iUserId) const {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT session_id::text, device_class, device_name, COALESCE(ip_address, ''), "
      "(EXTRACT(EPOCH FROM created_at) * 1000)::bigint "
      "FROM sessions WHERE user_id = $1 AND revoked_at IS NULL "
      "ORDER BY id",
      pqxx::params{iUserId});
  txn.commit();

  std::vector<common::Session> vSessions;
  vSessions.reserve(result.size());
  for (const auto& row : result) {
    auto oClass = common::parseDeviceClass(row[1].as<std::string>());
    if (!oClass) {
      common::Logger::get()->warn("Skipping session {} with unknown device class '{}'",
                                  row[0].as<std::string>(), row[1].as<std::string>());
      continue;
    }
    common::Session ses;
    ses.sSessionId = row[0].as<std::string>();
    ses.iUserId = iUserId;
    ses.eClass = *oClass;
    ses.sDeviceName = row[2].as<std::string>();
    ses.sIpAddress = row[3].as<std::string>();
    ses.tpCreatedAt = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(row[4].as<int64_t>()));
    vSessions.push_back(std::move(ses));
  }
  return vSessions;
}

int SessionRepository::expireCreatedBefore(std::chrono::system_clock::time_point tpCutoff) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "UPDATE sessions SET revoked_at = NOW() "
      "WHERE revoked_at IS NULL AND created_at < to_timestamp($1::bigint / 1000.0)",
      pqxx::params{toEpochMillis(tpCutoff)});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

int SessionRepository::purgeRevokedBefore(std::chrono::system_clock::time_point tpCutoff) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "DELETE FROM sessions "
      "WHERE revoked_at IS NOT NULL AND revoked_at < to_timestamp($1::bigint / 1000.0)",
      pqxx::params{toEpochMillis(tpCutoff)});
  txn.commit();
  return static_cast<int>(result.affected_rows());
}

}  // namespace sso::dal
