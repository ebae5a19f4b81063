#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace sso::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::unique_ptr<pqxx::connection> upConn)
    : _pPool(&cpPool), _upConn(std::move(upConn)) {}

ConnectionGuard::~ConnectionGuard() {
  release();
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _upConn(std::move(other._upConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = other._pPool;
    _upConn = std::move(other._upConn);
    other._pPool = nullptr;
  }
  return *this;
}

void ConnectionGuard::release() {
  if (_upConn && _pPool) {
    _pPool->giveBack(std::move(_upConn));
  }
}

pqxx::connection& ConnectionGuard::operator*() { return *_upConn; }
pqxx::connection* ConnectionGuard::operator->() { return _upConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  auto spLog = common::Logger::get();
  // Log only the part after the credentials.
  const auto nAt = _sDbUrl.find('@');
  spLog->info("Opening {} database connections to {}", _iPoolSize,
              nAt == std::string::npos ? std::string("<local>") : _sDbUrl.substr(nAt + 1));

  _vIdle.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    auto upConn = std::make_unique<pqxx::connection>(_sDbUrl);
    if (!upConn->is_open()) {
      throw std::runtime_error("Failed to open database connection " + std::to_string(i + 1));
    }
    _vIdle.push_back(std::move(upConn));
  }
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vIdle.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  if (!_cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vIdle.empty(); })) {
    throw std::runtime_error("Connection pool exhausted: timeout waiting for available connection");
  }

  auto upConn = std::move(_vIdle.back());
  _vIdle.pop_back();
  lock.unlock();

  if (!isHealthy(*upConn)) {
    common::Logger::get()->warn("Stale database connection detected, reconnecting");
    try {
      upConn = std::make_unique<pqxx::connection>(_sDbUrl);
    } catch (const pqxx::broken_connection& ex) {
      // Keep the pool at full size; the slot is retried on the next checkout.
      giveBack(std::move(upConn));
      throw std::runtime_error(std::string("Failed to reconnect to database: ") + ex.what());
    }
  }

  return ConnectionGuard(*this, std::move(upConn));
}

void ConnectionPool::giveBack(std::unique_ptr<pqxx::connection> upConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vIdle.push_back(std::move(upConn));
  }
  _cv.notify_one();
}

bool ConnectionPool::isHealthy(pqxx::connection& conn) {
  if (!conn.is_open()) return false;
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure&) {
    return false;
  }
}

}  // namespace sso::dal
