#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sso::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed request bodies, unknown device types.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 401 Unauthorized: bad credentials, unusable tokens, revoked sessions.
struct AuthenticationError : AppError {
  explicit AuthenticationError(std::string sCode, std::string sMsg)
      : AppError(401, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict, e.g. registering an email that is already taken.
struct ConflictError : AppError {
  explicit ConflictError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace sso::common
