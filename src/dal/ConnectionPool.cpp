#include "dal/ConnectionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cstring>
#include <stdexcept>

#include <libpq-fe.h>

namespace ustore::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

std::string ConnectionPool::redact(const std::string& sDbUrl) {
  // libpq parses both the URI and the keyword/value form; only options the
  // string sets explicitly come back, and they are re-emitted as keyword/value
  char* pErrMsg = nullptr;
  PQconninfoOption* pOptions = PQconninfoParse(sDbUrl.c_str(), &pErrMsg);
  if (pOptions == nullptr) {
    if (pErrMsg != nullptr) PQfreemem(pErrMsg);
    return "<unparseable connection string>";
  }

  std::string sOut;
  for (const PQconninfoOption* pOpt = pOptions; pOpt->keyword != nullptr; ++pOpt) {
    if (pOpt->val == nullptr || std::strcmp(pOpt->keyword, "password") == 0) continue;

    const std::string sValue(pOpt->val);
    const bool bQuote = sValue.empty() || sValue.find_first_of(" \t\n\r'\\") != std::string::npos;
    std::string sRendered;
    if (bQuote) {
      sRendered += '\'';
      for (char c : sValue) {
        if (c == '\'' || c == '\\') sRendered += '\\';
        sRendered += c;
      }
      sRendered += '\'';
    } else {
      sRendered = sValue;
    }

    if (!sOut.empty()) sOut += ' ';
    sOut += std::string(pOpt->keyword) + "=" + sRendered;
  }

  PQconninfoFree(pOptions);
  return sOut;
}

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  auto spLog = common::Logger::get();
  spLog->info("Initializing connection pool: size={}, url={}", _iPoolSize, redact(_sDbUrl));

  if (_iPoolSize < 1) {
    throw common::InitializationError(
        "storage_unavailable",
        "Connection pool size must be >= 1 (got " + std::to_string(_iPoolSize) + ")");
  }

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    std::shared_ptr<pqxx::connection> spConn;
    try {
      spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    } catch (const pqxx::failure& ex) {
      throw common::InitializationError(
          "storage_unavailable",
          "Failed to open database connection " + std::to_string(i + 1) + ": " + ex.what());
    }
    if (!spConn->is_open()) {
      throw common::InitializationError(
          "storage_unavailable",
          "Failed to open database connection " + std::to_string(i + 1));
    }
    _vAvailable.push_back(std::move(spConn));
  }

  spLog->info("Connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });

  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: timeout waiting for available connection");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  // No validation query: the caller's statement is the only round-trip. A handle
  // that libpq has already seen drop is replaced here.
  if (!spConn->is_open()) {
    common::Logger::get()->warn("Closed connection detected, reconnecting");
    try {
      spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    } catch (...) {
      // Keep the pool at full size; the closed handle is retried next time
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

}  // namespace ustore::dal
