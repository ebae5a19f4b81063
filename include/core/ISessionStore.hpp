#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace sso::core {

/// Authoritative registry of sessions.
///
/// At most one live session exists per (user, device class). create() replaces
/// the current occupant in a single atomic transition, so no reader ever sees
/// zero or two live sessions for the pair. All methods are thread-safe. A
/// missing session is an empty result, never an error.
class ISessionStore {
 public:
  virtual ~ISessionStore() = default;

  /// Install a new live session, revoking the pair's previous occupant.
  /// Returns the new session id.
  virtual std::string create(int64_t iUserId, common::DeviceClass eClass,
                             const std::string& sDeviceName,
                             const std::string& sIpAddress) = 0;

  /// True iff the session exists and is not revoked.
  virtual bool isLive(const std::string& sSessionId) const = 0;

  /// Idempotent.
  virtual void revoke(const std::string& sSessionId) = 0;

  /// Returns true if a live session of that class was revoked.
  virtual bool revokeDevice(int64_t iUserId, common::DeviceClass eClass) = 0;

  /// Returns the number of sessions revoked.
  virtual int revokeAll(int64_t iUserId) = 0;

  /// Live sessions of the user, oldest first.
  virtual std::vector<common::Session> listLive(int64_t iUserId) const = 0;

  /// Revoke live sessions created before the cutoff. Returns the count.
  virtual int expireCreatedBefore(std::chrono::system_clock::time_point tpCutoff) = 0;

  /// Forget revoked sessions revoked before the cutoff. Returns the count.
  virtual int purgeRevokedBefore(std::chrono::system_clock::time_point tpCutoff) = 0;
};

}  // namespace sso::core
