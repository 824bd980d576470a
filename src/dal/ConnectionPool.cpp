#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace sessiondb::dal {

std::string redactDbUrl(const std::string& sDbUrl) {
  const size_t nScheme = sDbUrl.find("://");
  if (nScheme != std::string::npos) {
    const size_t nAt = sDbUrl.find('@', nScheme);
    const size_t nColon = sDbUrl.find(':', nScheme + 3);
    if (nAt == std::string::npos || nColon == std::string::npos || nColon > nAt) {
      return sDbUrl;
    }
    return sDbUrl.substr(0, nColon + 1) + "***" + sDbUrl.substr(nAt);
  }

  std::string sOut = sDbUrl;
  const std::string sKey = "password=";
  for (size_t nPos = sOut.find(sKey); nPos != std::string::npos;
       nPos = sOut.find(sKey, nPos + sKey.size())) {
    const size_t nValue = nPos + sKey.size();
    const size_t nEnd = sOut.find(' ', nValue);
    sOut.replace(nValue, (nEnd == std::string::npos ? sOut.size() : nEnd) - nValue, "***");
  }
  return sOut;
}

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() { release(); }

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(std::exchange(other._pPool, nullptr)), _spConn(std::move(other._spConn)) {}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = std::exchange(other._pPool, nullptr);
    _spConn = std::move(other._spConn);
  }
  return *this;
}

void ConnectionGuard::release() {
  if (_pPool != nullptr && _spConn) {
    _pPool->release(std::move(_spConn));
  }
  _pPool = nullptr;
}

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw common::ConfigurationError(
        "invalid_configuration",
        "Connection pool size must be >= 1 (got " + std::to_string(_iPoolSize) + ")");
  }
  if (_durCheckoutTimeout < std::chrono::seconds(1)) {
    throw common::ConfigurationError("invalid_configuration",
                                     "Connection checkout timeout must be >= 1s");
  }

  auto spLog = common::Logger::get();
  spLog->info("Opening {} session store connections to {}", _iPoolSize,
              redactDbUrl(_sDbUrl));
  _vIdle.reserve(static_cast<size_t>(_iPoolSize));
  while (static_cast<int>(_vIdle.size()) < _iPoolSize) {
    _vIdle.push_back(open());
  }
  spLog->info("Connection pool ready (checkout timeout {}s)", _durCheckoutTimeout.count());
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vIdle.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  return ConnectionGuard(*this, ensureLive(acquire()));
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vIdle.size());
}

std::shared_ptr<pqxx::connection> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(_mtx);
  if (!_cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vIdle.empty(); })) {
    throw std::runtime_error("No session store connection free after " +
                             std::to_string(_durCheckoutTimeout.count()) + "s");
  }
  auto spConn = std::move(_vIdle.back());
  _vIdle.pop_back();
  return spConn;
}

std::shared_ptr<pqxx::connection> ConnectionPool::ensureLive(
    std::shared_ptr<pqxx::connection> spConn) {
  try {
    pqxx::nontransaction ntx(*spConn);
    ntx.exec("SELECT 1").one_row();
    return spConn;
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->warn("Dropping dead connection ({}), reconnecting", ex.what());
  }

  try {
    return open();
  } catch (const std::exception&) {
    // The slot stays in the pool; the next checkout retries the reconnect
    release(std::move(spConn));
    throw;
  }
}

void ConnectionPool::release(std::shared_ptr<pqxx::connection> spConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vIdle.push_back(std::move(spConn));
  }
  _cv.notify_one();
}

std::shared_ptr<pqxx::connection> ConnectionPool::open() const {
  auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  if (!spConn->is_open()) {
    throw std::runtime_error("Session store connection to " + redactDbUrl(_sDbUrl) +
                             " is not open");
  }
  return spConn;
}

}  // namespace sessiondb::dal
