#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace sso::core {

class ISessionStore;

/// Background memory hygiene for a session store: on every pass it revokes
/// sessions whose tokens have outlived the token TTL and purges revoked
/// records older than the retention window. Not needed for correctness.
/// Class abbreviation: sw
class SessionSweeper {
 public:
  SessionSweeper(ISessionStore& ssStore,
                 std::chrono::seconds durInterval,
                 std::chrono::seconds durTokenTtl,
                 std::chrono::seconds durRevokedRetention);
  ~SessionSweeper();

  SessionSweeper(const SessionSweeper&) = delete;
  SessionSweeper& operator=(const SessionSweeper&) = delete;

  /// Start the background thread; the first pass runs immediately.
  void start();

  /// Stop and join. Safe to call more than once.
  void stop();

  /// Run one pass on the calling thread.
  void sweepOnce();

  /// Completed passes, including sweepOnce() calls.
  int passes() const;

 private:
  ISessionStore& _ssStore;
  std::chrono::seconds _durInterval;
  std::chrono::seconds _durTokenTtl;
  std::chrono::seconds _durRevokedRetention;

  std::jthread _thread;
  mutable std::mutex _mtx;
  std::condition_variable _cv;
  bool _bRunning = false;
  int _iPasses = 0;
};

}  // namespace sso::core
