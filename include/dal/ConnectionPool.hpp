#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace sso::dal {

class ConnectionPool;

/// RAII guard for checked-out database connections.
/// Returns the connection to the pool on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::unique_ptr<pqxx::connection> upConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  void release();

  ConnectionPool* _pPool;
  std::unique_ptr<pqxx::connection> _upConn;
};

/// Fixed-size pool of pqxx::connection objects shared by the repositories.
/// checkout() blocks while all connections are in use, up to the timeout.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /// Check out a connection, reconnecting it if it went stale.
  /// Throws std::runtime_error on timeout or reconnect failure.
  ConnectionGuard checkout();

  int size() const { return _iPoolSize; }

 private:
  friend class ConnectionGuard;

  /// Called by ConnectionGuard.
  void giveBack(std::unique_ptr<pqxx::connection> upConn);

  static bool isHealthy(pqxx::connection& conn);

  std::vector<std::unique_ptr<pqxx::connection>> _vIdle;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace sso::dal
