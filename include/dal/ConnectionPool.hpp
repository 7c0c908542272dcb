#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <pqxx/pqxx>

namespace ustore::dal {

class ConnectionPool;

/// RAII guard for checked-out database connections.
/// Returns the connection to the pool on destruction.
/// Class abbreviation: cg
class ConnectionGuard {
 public:
  ConnectionGuard(ConnectionPool& cpPool, std::shared_ptr<pqxx::connection> spConn);
  ~ConnectionGuard();

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;
  ConnectionGuard(ConnectionGuard&& other) noexcept;
  ConnectionGuard& operator=(ConnectionGuard&& other) noexcept;

  pqxx::connection& operator*();
  pqxx::connection* operator->();

 private:
  ConnectionPool* _pPool;
  std::shared_ptr<pqxx::connection> _spConn;
};

/// Fixed-size pool of pqxx::connection objects shared by every repository
/// of a storage backend. Serializes access via std::mutex +
/// std::condition_variable; checkout blocks on exhaustion up to a timeout.
/// Class abbreviation: cp
class ConnectionPool {
 public:
  /// Opens iPoolSize connections eagerly.
  /// Throws common::InitializationError if any connection cannot be opened.
  ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                 std::chrono::seconds durCheckoutTimeout = std::chrono::seconds(30));
  ~ConnectionPool();

  /// Check out a connection. Blocks if all connections are in use.
  /// A connection already known to be closed is reopened first.
  /// Throws std::runtime_error on timeout, pqxx::broken_connection if a
  /// closed connection cannot be re-established.
  ConnectionGuard checkout();

  /// Return a connection to the pool. Called by ConnectionGuard destructor.
  void returnConnection(std::shared_ptr<pqxx::connection> spConn);

  int size() const { return _iPoolSize; }

  /// Connection string (URI or keyword/value) parsed by libpq and rendered
  /// as keyword/value pairs without the password, for logging.
  /// Unparseable input yields a placeholder rather than the raw string.
  static std::string redact(const std::string& sDbUrl);

 private:
  std::vector<std::shared_ptr<pqxx::connection>> _vAvailable;
  std::mutex _mtx;
  std::condition_variable _cv;
  std::string _sDbUrl;
  int _iPoolSize;
  std::chrono::seconds _durCheckoutTimeout;
};

}  // namespace ustore::dal
