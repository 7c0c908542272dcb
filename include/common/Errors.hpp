#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ustore::common {

/// Base error for all application-level exceptions.
/// Carries an HTTP-style status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 503 Service Unavailable — storage cannot be opened or its schema prepared.
struct InitializationError : AppError {
  explicit InitializationError(std::string sCode, std::string sMsg)
      : AppError(503, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found — no row for the requested identifier.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error — insert/update/delete failed at the backend.
struct WriteError : AppError {
  explicit WriteError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

/// 500 Internal Server Error — select failed at the backend.
struct ReadError : AppError {
  explicit ReadError(std::string sCode, std::string sMsg)
      : AppError(500, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ustore::common
