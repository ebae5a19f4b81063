#include "core/InMemorySessionStore.hpp"

#include "core/SessionId.hpp"

#include <algorithm>
#include <mutex>

namespace sso::core {

using common::DeviceClass;
using common::Session;

namespace {
// Lowest and highest enumerators, used to bound a per-user range of slots.
constexpr DeviceClass kFirstClass = DeviceClass::Web;
constexpr DeviceClass kLastClass = DeviceClass::Unknown;
}  // namespace

InMemorySessionStore::InMemorySessionStore() = default;
InMemorySessionStore::~InMemorySessionStore() = default;

void InMemorySessionStore::revokeLocked(Record& rec,
                                        std::chrono::system_clock::time_point tpNow) {
  if (rec.ses.bRevoked) return;
  rec.ses.bRevoked = true;
  rec.tpRevokedAt = tpNow;

  auto it = _mLiveBySlot.find({rec.ses.iUserId, rec.ses.eClass});
  if (it != _mLiveBySlot.end() && it->second == rec.ses.sSessionId) {
    _mLiveBySlot.erase(it);
  }
}

std::string InMemorySessionStore::create(int64_t iUserId, DeviceClass eClass,
                                         const std::string& sDeviceName,
                                         const std::string& sIpAddress) {
  Record rec;
  rec.ses.sSessionId = generateSessionId();
  rec.ses.iUserId = iUserId;
  rec.ses.eClass = eClass;
  rec.ses.sDeviceName = sDeviceName;
  rec.ses.sIpAddress = sIpAddress;
  rec.ses.tpCreatedAt = std::chrono::system_clock::now();
  const std::string sSessionId = rec.ses.sSessionId;

  std::unique_lock lock(_mtx);
  rec.uSeq = _uNextSeq++;

  // Replace in place: the slot is repointed and the old occupant revoked
  // under the same exclusive lock.
  auto& sSlotOwner = _mLiveBySlot[{iUserId, eClass}];
  if (!sSlotOwner.empty()) {
    auto itOld = _mSessions.find(sSlotOwner);
    if (itOld != _mSessions.end()) {
      itOld->second.ses.bRevoked = true;
      itOld->second.tpRevokedAt = rec.ses.tpCreatedAt;
    }
  }
  sSlotOwner = sSessionId;
  _mSessions.emplace(sSessionId, std::move(rec));

  return sSessionId;
}

bool InMemorySessionStore::isLive(const std::string& sSessionId) const {
  std::shared_lock lock(_mtx);
  auto it = _mSessions.find(sSessionId);
  return it != _mSessions.end() && !it->second.ses.bRevoked;
}

void InMemorySessionStore::revoke(const std::string& sSessionId) {
  const auto tpNow = std::chrono::system_clock::now();
  std::unique_lock lock(_mtx);
  auto it = _mSessions.find(sSessionId);
  if (it != _mSessions.end()) {
    revokeLocked(it->second, tpNow);
  }
}

bool InMemorySessionStore::revokeDevice(int64_t iUserId, DeviceClass eClass) {
  const auto tpNow = std::chrono::system_clock::now();
  std::unique_lock lock(_mtx);
  auto itSlot = _mLiveBySlot.find({iUserId, eClass});
  if (itSlot == _mLiveBySlot.end()) {
    return false;
  }
  auto it = _mSessions.find(itSlot->second);
  if (it == _mSessions.end()) {
    // Dangling slot: nothing live to revoke.
    _mLiveBySlot.erase(itSlot);
    return false;
  }
  revokeLocked(it->second, tpNow);
  return true;
}

int InMemorySessionStore::revokeAll(int64_t iUserId) {
  const auto tpNow = std::chrono::system_clock::now();
  std::unique_lock lock(_mtx);

  int iRevoked = 0;
  auto itSlot = _mLiveBySlot.lower_bound({iUserId, kFirstClass});
  const auto itEnd = _mLiveBySlot.upper_bound({iUserId, kLastClass});
  while (itSlot != itEnd) {
    auto it = _mSessions.find(itSlot->second);
    if (it != _mSessions.end() && !it->second.ses.bRevoked) {
      it->second.ses.bRevoked = true;
      it->second.tpRevokedAt = tpNow;
      ++iRevoked;
    }
    itSlot = _mLiveBySlot.erase(itSlot);
  }
  return iRevoked;
}

std::vector<Session> InMemorySessionStore::listLive(int64_t iUserId) const {
  std::vector<std::pair<uint64_t, Session>> vLive;
  {
    std::shared_lock lock(_mtx);
    auto itSlot = _mLiveBySlot.lower_bound({iUserId, kFirstClass});
    const auto itEnd = _mLiveBySlot.upper_bound({iUserId, kLastClass});
    for (; itSlot != itEnd; ++itSlot) {
      auto it = _mSessions.find(itSlot->second);
      if (it != _mSessions.end() && !it->second.ses.bRevoked) {
        vLive.emplace_back(it->second.uSeq, it->second.ses);
      }
    }
  }

  std::sort(vLive.begin(), vLive.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<Session> vResult;
  vResult.reserve(vLive.size());
  for (auto& [uSeq, ses] : vLive) {
    vResult.push_back(std::move(ses));
  }
  return vResult;
}

int InMemorySessionStore::expireCreatedBefore(std::chrono::system_clock::time_point tpCutoff) {
  const auto tpNow = std::chrono::system_clock::now();
  std::unique_lock lock(_mtx);

  int iExpired = 0;
  for (auto itSlot = _mLiveBySlot.begin(); itSlot != _mLiveBySlot.end();) {
    auto it = _mSessions.find(itSlot->second);
    if (it == _mSessions.end()) {
      itSlot = _mLiveBySlot.erase(itSlot);
      continue;
    }
    if (it->second.ses.tpCreatedAt < tpCutoff) {
      it->second.ses.bRevoked = true;
      it->second.tpRevokedAt = tpNow;
      ++iExpired;
      itSlot = _mLiveBySlot.erase(itSlot);
    } else {
      ++itSlot;
    }
  }
  return iExpired;
}

int InMemorySessionStore::purgeRevokedBefore(std::chrono::system_clock::time_point tpCutoff) {
  std::unique_lock lock(_mtx);

  int iPurged = 0;
  for (auto it = _mSessions.begin(); it != _mSessions.end();) {
    if (it->second.ses.bRevoked && it->second.tpRevokedAt < tpCutoff) {
      it = _mSessions.erase(it);
      ++iPurged;
    } else {
      ++it;
    }
  }
  return iPurged;
}

size_t InMemorySessionStore::size() const {
  std::shared_lock lock(_mtx);
  return _mSessions.size();
}

}  // namespace sso::core
