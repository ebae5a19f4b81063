#include "core/SessionSweeper.hpp"

#include "common/Logger.hpp"
#include "core/ISessionStore.hpp"

#include <exception>

namespace sso::core {

SessionSweeper::SessionSweeper(ISessionStore& ssStore,
                               std::chrono::seconds durInterval,
                               std::chrono::seconds durTokenTtl,
                               std::chrono::seconds durRevokedRetention)
    : _ssStore(ssStore),
      _durInterval(durInterval),
      _durTokenTtl(durTokenTtl),
      _durRevokedRetention(durRevokedRetention) {}

SessionSweeper::~SessionSweeper() {
  stop();
}

void SessionSweeper::sweepOnce() {
  const auto tpNow = std::chrono::system_clock::now();
  const int iExpired = _ssStore.expireCreatedBefore(tpNow - _durTokenTtl);
  const int iPurged = _ssStore.purgeRevokedBefore(tpNow - _durRevokedRetention);

  if (iExpired > 0 || iPurged > 0) {
    common::Logger::get()->info("Session sweep: expired {} sessions, purged {} revoked",
                                iExpired, iPurged);
  }

  std::lock_guard<std::mutex> lock(_mtx);
  ++_iPasses;
}

int SessionSweeper::passes() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _iPasses;
}

void SessionSweeper::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    while (!stToken.stop_requested()) {
      try {
        sweepOnce();
      } catch (const std::exception& ex) {
        common::Logger::get()->error("Session sweep failed: {}", ex.what());
      }

      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait_for(ulock, _durInterval, [&stToken]() {
        return stToken.stop_requested();
      });
    }
  });
}

void SessionSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
    _thread.request_stop();  // under _mtx: the worker tests the predicate holding it
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace sso::core
