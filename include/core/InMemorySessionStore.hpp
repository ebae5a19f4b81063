#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/ISessionStore.hpp"

namespace sso::core {

/// Process-local session registry. Contents are lost on restart.
///
/// One shared_mutex guards both indices: writers hold it exclusively only for
/// the map mutation itself, readers share it. Revoked sessions stay behind as
/// tombstones until purgeRevokedBefore() drops them.
/// Class abbreviation: ims
class InMemorySessionStore : public ISessionStore {
 public:
  InMemorySessionStore();
  ~InMemorySessionStore() override;

  InMemorySessionStore(const InMemorySessionStore&) = delete;
  InMemorySessionStore& operator=(const InMemorySessionStore&) = delete;

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

  /// Live plus tombstoned records currently held.
  size_t size() const;

 private:
  using Slot = std::pair<int64_t, common::DeviceClass>;

  struct Record {
    common::Session ses;
    uint64_t uSeq = 0;
    std::chrono::system_clock::time_point tpRevokedAt;
  };

  /// Caller holds _mtx exclusively. Clears the slot entry if it points here.
  void revokeLocked(Record& rec, std::chrono::system_clock::time_point tpNow);

  std::unordered_map<std::string, Record> _mSessions;
  std::map<Slot, std::string> _mLiveBySlot;
  uint64_t _uNextSeq = 0;
  mutable std::shared_mutex _mtx;
};

}  // namespace sso::core
