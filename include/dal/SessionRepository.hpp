#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/ISessionStore.hpp"

namespace sso::dal {

class ConnectionPool;

/// Durable session store backed by the sessions table.
///
/// A partial unique index on (user_id, device_class) WHERE revoked_at IS NULL
/// enforces the single-live-session rule. create() revokes and inserts in one
/// transaction under a per-user advisory lock, and retries if the index still
/// reports a conflict.
/// Class abbreviation: sr
class SessionRepository : public core::ISessionStore {
 public:
  explicit SessionRepository(ConnectionPool& cpPool);
  ~SessionRepository() override;

  std::string create(int64_t iUserId, common::DeviceClass eClass,
                     const std::string& sDeviceName,
                     const std::string& sIpAddress) override;
  bool isLive(const std::string& sSessionId) const override;
  void revoke(const std::string& sSessionId) override;
  bool revokeDevice(int64_t iUserId, common::DeviceClass eClass) override;
  int revokeAll(int64_t iUserId) override;
  std::vector<common::Session> listLive(int64_t iUserId) const override;
  int expireCreatedBefore(std::chrono::system_clock::time_point tpCutoff) override;
  int purgeRevokedBefore(std::chrono::system_clock::time_point tpCutoff) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace sso::dal
